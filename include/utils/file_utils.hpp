#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>
#include <filesystem>
#include <optional>

namespace FileUtils {
    
    // Directory created with mkdtemp() and removed, contents included, when
    // the object goes away. Read-only subdirectories (as extracted from an
    // ISO) are made writable first so removal cannot get stuck on them.
    class TempDirectory {
    private:
        std::filesystem::path dir;
        
    public:
        explicit TempDirectory(const std::string& prefix, 
                               const std::filesystem::path& parent = std::filesystem::path());
        ~TempDirectory();
        
        TempDirectory(const TempDirectory&) = delete;
        TempDirectory& operator=(const TempDirectory&) = delete;
        
        const std::filesystem::path& path() const { return dir; }
        std::filesystem::path operator/(const std::filesystem::path& other) const { return dir / other; }
    };
    
    // Temporarily applies a permission set to one path. The destructor puts
    // back either the mode found at construction or an explicit final mode.
    class ScopedPermissions {
    private:
        std::filesystem::path target;
        std::optional<std::filesystem::perms> restoreTo;
        
    public:
        ScopedPermissions(const std::filesystem::path& path, std::filesystem::perms grant);
        ScopedPermissions(const std::filesystem::path& path, std::filesystem::perms grant,
                          std::filesystem::perms finalMode);
        ~ScopedPermissions();
        
        ScopedPermissions(const ScopedPermissions&) = delete;
        ScopedPermissions& operator=(const ScopedPermissions&) = delete;
    };
    
    // Adds owner write (and search, for directories) permission throughout a tree.
    void makeTreeWritable(const std::filesystem::path& root, std::error_code& ec);
    
    // remove_all() that also works on trees with read-only directories.
    bool forceRemoveAll(const std::filesystem::path& root, std::error_code& ec);
    
    std::string readFile(const std::filesystem::path& path);
    void writeFile(const std::filesystem::path& path, const std::string& content);
}

#endif // FILE_UTILS_HPP
