#include "lib/iso_extractor.hpp"
#include "lib/path_guard.hpp"
#include "lib/process_runner.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"

namespace ISOExtractor {
    
    std::string xorrisoTool() {
        return ProcessRunner::toolPath("INJECTISO_XORRISO", "xorriso");
    }
    
    std::vector<std::string> buildArguments(const std::string& sourceImage, 
                                            const std::string& outputDir) {
        return {
            xorrisoTool(),
            "-osirrox", "on",
            "-indev", sourceImage,
            "-extract", "/", outputDir
        };
    }
    
    void extract(const std::string& sourceImage, const std::string& outputDir) {
        auto output = PathGuard::require(outputDir, PathGuard::Requirement::EXISTING_DIRECTORY);
        auto image = PathGuard::require(sourceImage, PathGuard::Requirement::EXISTING_FILE);
        
        Logs::debug("Extracting " + image.string() + " into " + output.string());
        
        ProcessRunner::Command command;
        command.argv = buildArguments(image.string(), output.string());
        
        ProcessRunner::runChecked(command, 
            "An error occurred while extracting '" + image.string() + "'");
    }
}
