#ifndef ISO_REPACKER_HPP
#define ISO_REPACKER_HPP

#include <string>
#include <vector>

namespace ISORepacker {
    
    // Boot files every repacked image points El Torito at, relative to the tree
    extern const std::string BIOS_BOOT_IMAGE;
    extern const std::string BOOT_CATALOG;
    extern const std::string EFI_BOOT_IMAGE;
    
    // Throws InvalidArgumentError naming the first character outside
    // [A-Za-z0-9 ._-], or when the name is empty.
    void validateFilesystemName(const std::string& name);
    
    // Full xorriso command line in mkisofs emulation. The flag set matches
    // what Debian uses for its hybrid installer images; changing it changes
    // what the images boot on.
    std::vector<std::string> buildArguments(const std::string& outputImage,
                                            const std::string& mbrDataFile,
                                            const std::string& treeRoot,
                                            const std::string& filesystemName);
    
    // Builds a hybrid BIOS/EFI image from treeRoot. xorriso writes into a
    // staging directory next to outputImage; the result is linked into
    // place only when xorriso succeeded, so a failed run leaves no file at
    // outputImage and an existing file is never replaced.
    void repack(const std::string& outputImage,
                const std::string& mbrDataFile,
                const std::string& treeRoot,
                const std::string& filesystemName);
}

#endif // ISO_REPACKER_HPP
