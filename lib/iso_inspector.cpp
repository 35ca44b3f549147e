#include "lib/iso_inspector.hpp"
#include "lib/errors.hpp"
#include <fstream>
#include <sys/stat.h>

namespace ISOInspector {
    
    static const std::streamoff SECTOR_SIZE = 2048;
    static const std::streamoff PRIMARY_DESCRIPTOR_OFFSET = 16 * SECTOR_SIZE;
    static const std::streamoff BOOT_RECORD_OFFSET = 17 * SECTOR_SIZE;
    
    static std::string readBlock(std::ifstream& file, std::streamoff offset, size_t length) {
        std::string block(length, '\0');
        file.clear();
        file.seekg(offset, std::ios::beg);
        file.read(&block[0], static_cast<std::streamsize>(length));
        block.resize(static_cast<size_t>(file.gcount()));
        return block;
    }
    
    ImageInfo inspect(const std::string& imagePath) {
        struct stat st;
        if (stat(imagePath.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            throw NotFoundError(imagePath, "No such file");
        }
        
        std::ifstream file(imagePath, std::ios::binary);
        if (!file.is_open()) {
            throw NotFoundError(imagePath, "Cannot open image");
        }
        
        ImageInfo info;
        info.size = static_cast<uint64_t>(st.st_size);
        
        // ISO 9660 primary volume descriptor at sector 16
        std::string descriptor = readBlock(file, PRIMARY_DESCRIPTOR_OFFSET, SECTOR_SIZE);
        info.hasISO9660 = descriptor.size() > 6 && descriptor.compare(1, 5, "CD001") == 0;
        
        // El Torito boot record at sector 17
        std::string bootRecord = readBlock(file, BOOT_RECORD_OFFSET, SECTOR_SIZE);
        info.hasElTorito = bootRecord.find("EL TORITO") != std::string::npos;
        
        // MBR signature at the very beginning marks an isohybrid image
        std::string mbr = readBlock(file, 0, 512);
        if (mbr.size() == 512) {
            info.hasMBRSignature = static_cast<uint8_t>(mbr[510]) == 0x55 && 
                                   static_cast<uint8_t>(mbr[511]) == 0xAA;
        }
        
        if (info.hasMBRSignature) {
            for (size_t i = 446; i < 510; i += 16) {
                if (mbr[i + 4] != 0) {
                    info.hasPartitions = true;
                    break;
                }
            }
        }
        
        if (info.hasMBRSignature && info.hasPartitions && info.hasISO9660) {
            info.type = ImageType::HYBRID;
        } else if (info.hasElTorito && info.hasISO9660) {
            info.type = ImageType::EL_TORITO;
        } else if (info.hasISO9660) {
            info.type = ImageType::PURE_ISO;
        }
        
        return info;
    }
    
    std::string describe(ImageType type) {
        switch (type) {
            case ImageType::HYBRID: return "Hybrid ISO (MBR + ISO 9660)";
            case ImageType::EL_TORITO: return "El Torito Bootable ISO";
            case ImageType::PURE_ISO: return "Pure ISO 9660";
            default: return "Unknown/Non-standard image";
        }
    }
}
