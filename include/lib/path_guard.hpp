#ifndef PATH_GUARD_HPP
#define PATH_GUARD_HPP

#include <string>
#include <filesystem>

namespace PathGuard {
    enum class Requirement {
        EXISTING_FILE,
        EXISTING_DIRECTORY,
        NON_EXISTING,
        EXISTING_PARENT
    };
    
    // Replaces a leading "~" or "~/" with $HOME. Other paths pass through.
    std::filesystem::path expandHome(const std::string& path);
    
    // Expands, makes absolute and normalizes without touching the filesystem.
    std::filesystem::path resolve(const std::string& path);
    
    // resolve() plus a check of the requirement; throws NotFoundError,
    // NotADirectoryError or AlreadyExistsError when it is not met.
    std::filesystem::path require(const std::string& path, Requirement requirement);
    
    std::string describe(Requirement requirement);
}

#endif // PATH_GUARD_HPP
