#ifndef INITRD_PATCHER_HPP
#define INITRD_PATCHER_HPP

#include <string>
#include <vector>

namespace InitrdPatcher {
    
    extern const std::string INITRD_NAME;
    
    // How the appended file is named to cpio, and therefore inside the archive.
    enum class PatchMode {
        RELATIVE_TO_BASE,   // cpio runs in baseDir and gets the relative path
        ABSOLUTE_PATH       // cpio gets the absolute path of the file
    };
    
    // cpio binary, overridable with INJECTISO_CPIO
    std::string cpioTool();
    
    std::vector<std::string> buildArguments(const std::string& rawArchive);
    
    // Appends baseDir/relativeFilePath to the gzip-compressed newc archive
    // initrdArchive.
    //
    // The archive is unpacked and rebuilt in a private staging directory
    // beside it; the original initrd.gz is only replaced, by a rename, once
    // the rebuilt archive is complete. The archive ends up mode 0444 and its
    // directory 0555, on success and failure alike.
    //
    // Not safe to run concurrently on the same archive.
    void appendFile(const std::string& initrdArchive, 
                    const std::string& baseDir,
                    const std::string& relativeFilePath,
                    PatchMode mode = PatchMode::RELATIVE_TO_BASE);
}

#endif // INITRD_PATCHER_HPP
