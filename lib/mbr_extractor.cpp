#include "lib/mbr_extractor.hpp"
#include "lib/path_guard.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace MBRExtractor {
    
    bool hasImageExtension(const std::string& path) {
        std::string extension = fs::path(path).extension().string();
        return extension == ".iso" || extension == ".img";
    }
    
    static std::vector<uint8_t> readPrefix(const fs::path& image) {
        int fd = open(image.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            throw NotFoundError(image.string(), "Cannot open image (" + std::string(strerror(errno)) + ")");
        }
        
        std::vector<uint8_t> data(MBR_DATA_SIZE);
        size_t total = 0;
        
        while (total < MBR_DATA_SIZE) {
            ssize_t n = read(fd, data.data() + total, MBR_DATA_SIZE - total);
            if (n < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                close(fd);
                throw FilesystemError("Failed reading " + image.string() + ": " + strerror(err));
            }
            if (n == 0) break;
            total += static_cast<size_t>(n);
        }
        close(fd);
        
        if (total != MBR_DATA_SIZE) {
            throw InvalidFormatError(image.string(), 
                "Image is too small to contain MBR data (" + std::to_string(total) + " bytes)");
        }
        
        return data;
    }
    
    std::vector<uint8_t> readMBR(const std::string& sourceImage) {
        fs::path image = PathGuard::require(sourceImage, PathGuard::Requirement::EXISTING_FILE);
        return readPrefix(image);
    }
    
    void extractMBR(const std::string& sourceImage, const std::string& outputFile) {
        fs::path output = PathGuard::require(outputFile, PathGuard::Requirement::NON_EXISTING);
        fs::path image = PathGuard::require(sourceImage, PathGuard::Requirement::EXISTING_FILE);
        
        if (!hasImageExtension(image.string())) {
            throw InvalidFormatError(image.string(), "Input file is not an image file");
        }
        
        std::vector<uint8_t> data = readPrefix(image);
        
        // O_EXCL: a file that appeared after the check is still never clobbered
        int fd = open(output.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0) {
            if (errno == EEXIST) {
                throw AlreadyExistsError(output.string());
            }
            throw FilesystemError("Cannot create " + output.string() + ": " + strerror(errno));
        }
        
        size_t written = 0;
        while (written < data.size()) {
            ssize_t n = write(fd, data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                close(fd);
                unlink(output.c_str());
                throw FilesystemError("Failed writing MBR data to " + output.string() + ": " + strerror(err));
            }
            written += static_cast<size_t>(n);
        }
        
        if (close(fd) != 0) {
            int err = errno;
            unlink(output.c_str());
            throw FilesystemError("Failed closing " + output.string() + ": " + strerror(err));
        }
        
        Logs::debug("Wrote " + std::to_string(MBR_DATA_SIZE) + " bytes of MBR data to " + output.string());
    }
}
