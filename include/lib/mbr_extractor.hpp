#ifndef MBR_EXTRACTOR_HPP
#define MBR_EXTRACTOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace MBRExtractor {
    
    // Boot code plus partition-table prefix of a hybrid image, up to but
    // excluding the disk signature. This is what xorriso's -isohybrid-mbr
    // expects and must stay fixed.
    const size_t MBR_DATA_SIZE = 432;
    
    bool hasImageExtension(const std::string& path);
    
    // Returns the first MBR_DATA_SIZE bytes of the image.
    std::vector<uint8_t> readMBR(const std::string& sourceImage);
    
    // Writes the MBR data of sourceImage into a newly created outputFile.
    // Throws AlreadyExistsError, NotFoundError or InvalidFormatError before
    // touching anything when a precondition does not hold.
    void extractMBR(const std::string& sourceImage, const std::string& outputFile);
}

#endif // MBR_EXTRACTOR_HPP
