#include "lib/iso_repacker.hpp"
#include "lib/iso_extractor.hpp"
#include "lib/mbr_extractor.hpp"
#include "lib/path_guard.hpp"
#include "lib/process_runner.hpp"
#include "lib/errors.hpp"
#include "utils/file_utils.hpp"
#include "utils/logs.hpp"
#include <filesystem>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace ISORepacker {
    
    const std::string BIOS_BOOT_IMAGE = "isolinux/isolinux.bin";
    const std::string BOOT_CATALOG = "isolinux/boot.cat";
    const std::string EFI_BOOT_IMAGE = "boot/grub/efi.img";
    
    // ISO 9660 volume identifiers hold at most 32 characters
    static const size_t VOLUME_ID_LIMIT = 32;
    
    static bool isAllowedNameChar(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || 
               (c >= '0' && c <= '9') || c == ' ' || c == '.' || c == '_' || c == '-';
    }
    
    // Length of the UTF-8 sequence starting with lead, 1 for stray bytes
    static size_t utf8SequenceLength(unsigned char lead) {
        if ((lead & 0xE0) == 0xC0) return 2;
        if ((lead & 0xF0) == 0xE0) return 3;
        if ((lead & 0xF8) == 0xF0) return 4;
        return 1;
    }
    
    void validateFilesystemName(const std::string& name) {
        if (name.empty()) {
            throw InvalidArgumentError("Filesystem name must not be empty");
        }
        
        for (size_t i = 0; i < name.size(); i++) {
            if (!isAllowedNameChar(name[i])) {
                size_t length = utf8SequenceLength(static_cast<unsigned char>(name[i]));
                std::string invalid = name.substr(i, length);
                throw InvalidArgumentError("Invalid character in filesystem name: '" + invalid + "'");
            }
        }
    }
    
    std::vector<std::string> buildArguments(const std::string& outputImage,
                                            const std::string& mbrDataFile,
                                            const std::string& treeRoot,
                                            const std::string& filesystemName) {
        return {
            ISOExtractor::xorrisoTool(), "-as", "mkisofs",
            "-r", "-V", filesystemName,
            "-o", outputImage,
            "-J", "-J", "-joliet-long", "-cache-inodes",
            "-isohybrid-mbr", mbrDataFile,
            "-b", BIOS_BOOT_IMAGE,
            "-c", BOOT_CATALOG,
            "-boot-load-size", "4", "-boot-info-table", "-no-emul-boot",
            "-eltorito-alt-boot",
            "-e", EFI_BOOT_IMAGE, "-no-emul-boot",
            "-isohybrid-gpt-basdat", "-isohybrid-apm-hfsplus",
            treeRoot
        };
    }
    
    void repack(const std::string& outputImage,
                const std::string& mbrDataFile,
                const std::string& treeRoot,
                const std::string& filesystemName) {
        fs::path output = PathGuard::require(outputImage, PathGuard::Requirement::NON_EXISTING);
        PathGuard::require(outputImage, PathGuard::Requirement::EXISTING_PARENT);
        fs::path mbr = PathGuard::require(mbrDataFile, PathGuard::Requirement::EXISTING_FILE);
        fs::path tree = PathGuard::require(treeRoot, PathGuard::Requirement::EXISTING_DIRECTORY);
        
        validateFilesystemName(filesystemName);
        
        if (filesystemName.size() > VOLUME_ID_LIMIT) {
            Logs::warning("Filesystem name is longer than " + std::to_string(VOLUME_ID_LIMIT) + 
                         " characters and will be truncated by xorriso");
        }
        
        std::error_code ec;
        uintmax_t mbrSize = fs::file_size(mbr, ec);
        if (!ec && mbrSize != MBRExtractor::MBR_DATA_SIZE) {
            Logs::warning("MBR data file " + mbr.string() + " is " + std::to_string(mbrSize) + 
                         " bytes, expected " + std::to_string(MBRExtractor::MBR_DATA_SIZE));
        }
        
        FileUtils::TempDirectory staging("." + output.filename().string() + ".", output.parent_path());
        fs::path stagedImage = staging / output.filename();
        
        ProcessRunner::Command command;
        command.argv = buildArguments(stagedImage.string(), mbr.string(), 
                                      tree.string(), filesystemName);
        
        ProcessRunner::runChecked(command, 
            "Failed while repacking ISO from source files: '" + tree.string() + "'");
        
        uintmax_t size = fs::file_size(stagedImage, ec);
        if (ec || size == 0) {
            throw ProcessError(command.argv[0], 0, "xorriso reported success but wrote no image for '" + 
                               tree.string() + "'");
        }
        
        // link() refuses to replace an existing path, unlike rename()
        if (link(stagedImage.c_str(), output.c_str()) != 0) {
            if (errno == EEXIST) {
                throw AlreadyExistsError(output.string());
            }
            throw FilesystemError("Cannot move image into place at " + output.string() + 
                                  ": " + strerror(errno));
        }
        
        Logs::debug("Repacked " + tree.string() + " into " + output.string() + 
                   " (" + std::to_string(size) + " bytes)");
    }
}
