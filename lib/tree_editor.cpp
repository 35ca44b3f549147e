#include "lib/tree_editor.hpp"
#include "lib/path_guard.hpp"
#include "lib/errors.hpp"
#include "utils/file_utils.hpp"
#include "utils/logs.hpp"
#include <memory>

namespace fs = std::filesystem;

namespace TreeEditor {
    
    TreeEdit TreeEdit::substitute(const std::string& placeholder, const std::string& value,
                                  const std::vector<std::string>& targets) {
        TreeEdit edit;
        edit.kind = EditKind::SUBSTITUTE;
        edit.placeholder = placeholder;
        edit.value = value;
        edit.targets = targets;
        return edit;
    }
    
    TreeEdit TreeEdit::deleteSubtree(const std::string& path) {
        TreeEdit edit;
        edit.kind = EditKind::DELETE_SUBTREE;
        edit.path = path;
        return edit;
    }
    
    TreeEdit TreeEdit::copyOverlay(const std::string& sourceDir) {
        TreeEdit edit;
        edit.kind = EditKind::COPY_OVERLAY;
        edit.sourceDir = sourceDir;
        return edit;
    }
    
    std::string TreeEdit::describe() const {
        switch (kind) {
            case EditKind::SUBSTITUTE: {
                std::string files;
                for (const auto& target : targets) {
                    files += (files.empty() ? "" : ", ") + target;
                }
                return "replace " + placeholder + " with '" + value + "' in " + files;
            }
            case EditKind::DELETE_SUBTREE:
                return "delete " + path;
            case EditKind::COPY_OVERLAY:
                return "copy " + sourceDir + " onto the tree";
            default:
                return "unknown edit";
        }
    }
    
    static std::unique_ptr<FileUtils::ScopedPermissions> grantWrite(const fs::path& path) {
        fs::file_status status = fs::status(path);
        fs::perms grant = status.permissions() | fs::perms::owner_write;
        if (fs::is_directory(status)) {
            grant |= fs::perms::owner_exec | fs::perms::owner_read;
        }
        return std::make_unique<FileUtils::ScopedPermissions>(path, grant);
    }
    
    fs::path resolveInside(const fs::path& root, const std::string& relative) {
        fs::path rel(relative);
        if (relative.empty() || rel.is_absolute()) {
            throw InvalidArgumentError("Tree edit path must be relative to the tree root: '" + relative + "'");
        }
        
        fs::path normal = rel.lexically_normal();
        if (!normal.empty() && *normal.begin() == "..") {
            throw InvalidArgumentError("Tree edit path escapes the tree root: '" + relative + "'");
        }
        if (normal == ".") {
            return root;
        }

        return root / normal;
    }
    
    static size_t replaceAll(std::string& text, const std::string& from, const std::string& to) {
        size_t count = 0;
        size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos) {
            text.replace(pos, from.size(), to);
            pos += to.size();
            count++;
        }
        return count;
    }
    
    static size_t substituteInFile(const fs::path& file, const std::string& from, const std::string& to) {
        std::string content = FileUtils::readFile(file);
        size_t count = replaceAll(content, from, to);
        
        if (count > 0) {
            auto perms = grantWrite(file);
            FileUtils::writeFile(file, content);
        }
        
        Logs::debug(file.string() + ": " + std::to_string(count) + " x " + from);
        return count;
    }
    
    size_t applySubstitute(const fs::path& root, const TreeEdit& edit) {
        if (edit.placeholder.empty()) {
            throw InvalidArgumentError("Substitution placeholder must not be empty");
        }
        
        size_t total = 0;
        
        for (const auto& target : edit.targets) {
            fs::path path = resolveInside(root, target);
            std::error_code ec;
            fs::file_status status = fs::symlink_status(path, ec);
            
            if (fs::is_regular_file(status)) {
                total += substituteInFile(path, edit.placeholder, edit.value);
            } else if (fs::is_directory(status)) {
                for (const auto& entry : fs::directory_iterator(path)) {
                    if (entry.is_regular_file() && !entry.is_symlink()) {
                        total += substituteInFile(entry.path(), edit.placeholder, edit.value);
                    }
                }
            } else {
                throw NotFoundError(path.string(), "Substitution target not found");
            }
        }
        
        return total;
    }
    
    bool applyDelete(const fs::path& root, const TreeEdit& edit) {
        fs::path path = resolveInside(root, edit.path);
        if (path.lexically_normal() == root.lexically_normal()) {
            throw InvalidArgumentError("Refusing to delete the tree root");
        }
        
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(path, ec))) {
            Logs::debug("Nothing to delete at " + path.string());
            return false;
        }
        
        auto parentPerms = grantWrite(path.parent_path());
        if (!FileUtils::forceRemoveAll(path, ec)) {
            throw FilesystemError("Cannot delete " + path.string() + ": " + ec.message());
        }
        return true;
    }
    
    static void copyOverlayEntry(const fs::path& source, const fs::path& destination) {
        std::error_code ec;
        fs::file_status sourceStatus = fs::symlink_status(source);
        fs::file_status destStatus = fs::symlink_status(destination, ec);
        
        if (fs::is_directory(sourceStatus)) {
            if (fs::is_directory(destStatus)) {
                return;
            }
            if (fs::exists(destStatus)) {
                throw FilesystemError("Cannot copy directory " + source.string() + 
                                      " over file " + destination.string());
            }
            auto parentPerms = grantWrite(destination.parent_path());
            fs::create_directory(destination);
            return;
        }
        
        if (fs::is_directory(destStatus)) {
            throw FilesystemError("Cannot copy " + source.string() + 
                                  " over directory " + destination.string());
        }
        
        auto parentPerms = grantWrite(destination.parent_path());
        if (fs::exists(destStatus)) {
            // a read-only file cannot be truncated, unlink it instead
            fs::remove(destination);
        }
        
        if (fs::is_symlink(sourceStatus)) {
            fs::copy_symlink(source, destination);
        } else {
            fs::copy_file(source, destination);
        }
    }
    
    size_t applyOverlay(const fs::path& root, const TreeEdit& edit) {
        fs::path source = PathGuard::require(edit.sourceDir, PathGuard::Requirement::EXISTING_DIRECTORY);
        size_t copied = 0;
        
        // Pre-order walk: a directory exists in the tree before its files are copied
        for (auto it = fs::recursive_directory_iterator(source); 
             it != fs::recursive_directory_iterator(); ++it) {
            fs::path relative = it->path().lexically_relative(source);
            copyOverlayEntry(it->path(), root / relative);
            
            if (!it->is_directory() || it->is_symlink()) {
                copied++;
            }
        }
        
        return copied;
    }
    
    void apply(const std::string& treeRoot, const std::vector<TreeEdit>& edits) {
        fs::path root = PathGuard::require(treeRoot, PathGuard::Requirement::EXISTING_DIRECTORY);
        
        for (const auto& edit : edits) {
            Logs::debug("Tree edit: " + edit.describe());
            
            try {
                switch (edit.kind) {
                    case EditKind::SUBSTITUTE: {
                        size_t count = applySubstitute(root, edit);
                        Logs::debug("Made " + std::to_string(count) + " replacements");
                        break;
                    }
                    case EditKind::DELETE_SUBTREE:
                        applyDelete(root, edit);
                        break;
                    case EditKind::COPY_OVERLAY: {
                        size_t count = applyOverlay(root, edit);
                        Logs::debug("Copied " + std::to_string(count) + " files");
                        break;
                    }
                }
            } catch (const fs::filesystem_error& e) {
                throw FilesystemError(edit.describe() + " failed: " + e.what());
            }
        }
    }
}
