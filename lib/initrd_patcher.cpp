#include "lib/initrd_patcher.hpp"
#include "lib/gzip_stream.hpp"
#include "lib/path_guard.hpp"
#include "lib/process_runner.hpp"
#include "lib/errors.hpp"
#include "utils/file_utils.hpp"
#include "utils/logs.hpp"
#include <filesystem>
#include <cstdio>
#include <cstring>
#include <cerrno>

namespace fs = std::filesystem;

namespace InitrdPatcher {
    
    const std::string INITRD_NAME = "initrd.gz";
    
    static const fs::perms WRITABLE_FILE = static_cast<fs::perms>(0644);
    static const fs::perms WRITABLE_DIR = static_cast<fs::perms>(0755);
    static const fs::perms READONLY_FILE = static_cast<fs::perms>(0444);
    static const fs::perms READONLY_DIR = static_cast<fs::perms>(0555);
    
    std::string cpioTool() {
        return ProcessRunner::toolPath("INJECTISO_CPIO", "cpio");
    }
    
    std::vector<std::string> buildArguments(const std::string& rawArchive) {
        return {cpioTool(), "-H", "newc", "-o", "-A", "-F", rawArchive};
    }
    
    void appendFile(const std::string& initrdArchive, 
                    const std::string& baseDir,
                    const std::string& relativeFilePath,
                    PatchMode mode) {
        if (fs::path(initrdArchive).filename() != INITRD_NAME) {
            throw InvalidFormatError(fs::path(initrdArchive).filename().string(), 
                                     "Does not seem to be an initrd.gz archive");
        }
        
        fs::path archive = PathGuard::require(initrdArchive, PathGuard::Requirement::EXISTING_FILE);
        fs::path base = PathGuard::require(baseDir, PathGuard::Requirement::EXISTING_DIRECTORY);
        
        fs::path relative(relativeFilePath);
        if (relativeFilePath.empty() || relative.is_absolute()) {
            throw InvalidArgumentError("Expected a path relative to " + base.string() + 
                                       ", got '" + relativeFilePath + "'");
        }
        fs::path inputFile = PathGuard::require((base / relative).string(), 
                                                PathGuard::Requirement::EXISTING_FILE);
        
        if (!GzipStream::hasGzipMagic(archive.string())) {
            throw InvalidFormatError(archive.string(), "Not a gzip-compressed archive");
        }
        
        Logs::debug("Appending " + relativeFilePath + " to " + archive.string());
        
        fs::path parent = archive.parent_path();
        
        // Declaration order matters: staging goes first, then the archive
        // is made read-only, then its directory
        FileUtils::ScopedPermissions parentPerms(parent, WRITABLE_DIR, READONLY_DIR);
        FileUtils::ScopedPermissions archivePerms(archive, WRITABLE_FILE, READONLY_FILE);
        FileUtils::TempDirectory staging(".initrd-", parent);
        
        fs::path rawArchive = staging / archive.stem();
        GzipStream::decompressFile(archive.string(), rawArchive.string());
        
        ProcessRunner::Command command;
        command.argv = buildArguments(rawArchive.string());
        command.hasInput = true;
        if (mode == PatchMode::RELATIVE_TO_BASE) {
            command.workingDirectory = base.string();
            command.input = relative.string();
        } else {
            command.input = inputFile.string();
        }
        
        ProcessRunner::runChecked(command, "Failed while appending contents of '" + 
                                  relativeFilePath + "' to '" + archive.string() + "'");
        
        fs::path repacked = staging / INITRD_NAME;
        GzipStream::compressFile(rawArchive.string(), repacked.string());
        
        if (std::rename(repacked.c_str(), archive.c_str()) != 0) {
            throw FilesystemError("Cannot replace " + archive.string() + ": " + strerror(errno));
        }
        
        Logs::debug("Repacked " + archive.string());
    }
}
