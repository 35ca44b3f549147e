#ifndef ISO_INSPECTOR_HPP
#define ISO_INSPECTOR_HPP

#include <cstdint>
#include <string>

namespace ISOInspector {
    
    enum class ImageType {
        PURE_ISO,
        EL_TORITO,
        HYBRID,
        UNKNOWN
    };
    
    struct ImageInfo {
        uint64_t size = 0;
        bool hasISO9660 = false;
        bool hasElTorito = false;
        bool hasMBRSignature = false;
        bool hasPartitions = false;
        ImageType type = ImageType::UNKNOWN;
    };
    
    ImageInfo inspect(const std::string& imagePath);
    std::string describe(ImageType type);
}

#endif // ISO_INSPECTOR_HPP
