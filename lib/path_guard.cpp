#include "lib/path_guard.hpp"
#include "lib/errors.hpp"
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace PathGuard {
    
    fs::path expandHome(const std::string& path) {
        if (path.empty() || path[0] != '~') {
            return fs::path(path);
        }
        if (path.size() > 1 && path[1] != '/') {
            // "~user" forms are left alone
            return fs::path(path);
        }
        
        const char* home = std::getenv("HOME");
        if (home == nullptr || home[0] == '\0') {
            throw NotFoundError(path, "Cannot expand home directory, HOME is not set");
        }
        
        std::string expanded = home;
        expanded += path.substr(1);
        return fs::path(expanded);
    }
    
    fs::path resolve(const std::string& path) {
        if (path.empty()) {
            throw NotFoundError(path, "Empty path");
        }
        
        std::error_code ec;
        fs::path absolute = fs::absolute(expandHome(path), ec);
        if (ec) {
            throw NotFoundError(path, "Cannot resolve path (" + ec.message() + ")");
        }
        
        fs::path normal = absolute.lexically_normal();
        // "dir/" normalizes to "dir/." style trailing separators; drop them
        if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
            normal = normal.parent_path();
        }
        return normal;
    }
    
    fs::path require(const std::string& path, Requirement requirement) {
        fs::path resolved = resolve(path);
        std::error_code ec;
        fs::file_status status = fs::status(resolved, ec);
        
        switch (requirement) {
            case Requirement::EXISTING_FILE:
                if (!fs::is_regular_file(status)) {
                    throw NotFoundError(resolved.string(), "No such file");
                }
                break;
                
            case Requirement::EXISTING_DIRECTORY:
                if (!fs::exists(status)) {
                    throw NotADirectoryError(resolved.string());
                }
                if (!fs::is_directory(status)) {
                    throw NotADirectoryError(resolved.string(), "Not a directory");
                }
                break;
                
            case Requirement::NON_EXISTING:
                // Dangling symlinks count as existing: writing would follow them
                if (fs::exists(status) || fs::is_symlink(fs::symlink_status(resolved, ec))) {
                    throw AlreadyExistsError(resolved.string());
                }
                break;
                
            case Requirement::EXISTING_PARENT: {
                fs::path parent = resolved.parent_path();
                if (!fs::is_directory(fs::status(parent, ec))) {
                    throw NotADirectoryError(parent.string());
                }
                break;
            }
        }
        
        return resolved;
    }
    
    std::string describe(Requirement requirement) {
        switch (requirement) {
            case Requirement::EXISTING_FILE: return "existing file";
            case Requirement::EXISTING_DIRECTORY: return "existing directory";
            case Requirement::NON_EXISTING: return "non-existing path";
            case Requirement::EXISTING_PARENT: return "path with existing parent directory";
            default: return "unknown";
        }
    }
}
