#ifndef ISO_EXTRACTOR_HPP
#define ISO_EXTRACTOR_HPP

#include <string>
#include <vector>

namespace ISOExtractor {
    // xorriso binary, overridable with INJECTISO_XORRISO
    std::string xorrisoTool();
    
    std::vector<std::string> buildArguments(const std::string& sourceImage, 
                                            const std::string& outputDir);
    
    // Unpacks the whole image tree into outputDir, keeping the permissions
    // recorded in the image (mostly read-only). On ProcessError the caller
    // owns whatever got extracted and has to discard it.
    void extract(const std::string& sourceImage, const std::string& outputDir);
}

#endif // ISO_EXTRACTOR_HPP
