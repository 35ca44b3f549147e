#include "utils/file_utils.hpp"
#include "utils/logs.hpp"
#include "lib/errors.hpp"
#include <fstream>
#include <sstream>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <cerrno>

namespace fs = std::filesystem;

namespace FileUtils {
    
    TempDirectory::TempDirectory(const std::string& prefix, const fs::path& parent) {
        std::error_code ec;
        fs::path base = parent.empty() ? fs::temp_directory_path(ec) : parent;
        if (ec) {
            base = "/tmp";
        }
        
        std::string pattern = (base / (prefix + "XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        
        if (mkdtemp(buffer.data()) == nullptr) {
            throw FilesystemError("mkdtemp() failed for " + pattern + ": " + strerror(errno));
        }
        
        dir = buffer.data();
        Logs::debug("Created temporary directory " + dir.string());
    }
    
    TempDirectory::~TempDirectory() {
        std::error_code ec;
        if (!forceRemoveAll(dir, ec)) {
            Logs::warning("Failed to remove temporary directory " + dir.string() + ": " + ec.message());
        } else {
            Logs::debug("Removed temporary directory " + dir.string());
        }
    }
    
    static void applyPermissions(const fs::path& path, fs::perms mode) {
        std::error_code ec;
        fs::permissions(path, mode, fs::perm_options::replace, ec);
        if (ec) {
            throw FilesystemError("Cannot change permissions of " + path.string() + ": " + ec.message());
        }
    }
    
    ScopedPermissions::ScopedPermissions(const fs::path& path, fs::perms grant)
        : target(path) {
        std::error_code ec;
        fs::file_status status = fs::status(target, ec);
        if (ec || !fs::exists(status)) {
            throw NotFoundError(target.string(), "Cannot read permissions");
        }
        applyPermissions(target, grant);
        restoreTo = status.permissions();
    }
    
    ScopedPermissions::ScopedPermissions(const fs::path& path, fs::perms grant, fs::perms finalMode)
        : target(path) {
        applyPermissions(target, grant);
        restoreTo = finalMode;
    }
    
    ScopedPermissions::~ScopedPermissions() {
        if (!restoreTo) {
            return;
        }
        
        std::error_code ec;
        fs::permissions(target, *restoreTo, fs::perm_options::replace, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            Logs::warning("Could not restore permissions of " + target.string() + ": " + ec.message());
        }
    }
    
    void makeTreeWritable(const fs::path& root, std::error_code& ec) {
        ec.clear();
        
        fs::file_status rootStatus = fs::symlink_status(root, ec);
        if (ec) return;
        if (!fs::is_directory(rootStatus)) return;
        
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
        if (ec) return;
        
        // Parents are fixed before their children are listed, so the walk
        // can descend into directories that were read-only
        for (auto it = fs::recursive_directory_iterator(root, ec); 
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code statusEc;
            fs::file_status status = it->symlink_status(statusEc);
            if (statusEc) continue;
            
            if (fs::is_directory(status)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, statusEc);
            } else if (fs::is_regular_file(status)) {
                fs::permissions(it->path(), fs::perms::owner_write, fs::perm_options::add, statusEc);
            }
        }
    }
    
    bool forceRemoveAll(const fs::path& root, std::error_code& ec) {
        ec.clear();
        if (root.empty()) {
            return true;
        }
        
        std::error_code ignored;
        makeTreeWritable(root, ignored);
        
        fs::remove_all(root, ec);
        return !ec;
    }
    
    std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw NotFoundError(path.string(), "Cannot open file");
        }
        
        std::ostringstream content;
        content << in.rdbuf();
        if (in.bad()) {
            throw FilesystemError("Failed reading " + path.string());
        }
        return content.str();
    }
    
    void writeFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw FilesystemError("Cannot open " + path.string() + " for writing");
        }
        
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            throw FilesystemError("Failed writing " + path.string());
        }
    }
}
