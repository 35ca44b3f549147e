#ifndef INJECTION_ORCHESTRATOR_HPP
#define INJECTION_ORCHESTRATOR_HPP

#include "lib/initrd_patcher.hpp"
#include "lib/tree_editor.hpp"
#include <string>
#include <vector>

namespace Injection {
    
    // A host file that ends up at targetPath inside the initrd
    struct InitrdInjection {
        std::string sourceFile;
        std::string targetPath;
    };
    
    struct InjectionPlan {
        std::string inputImage;
        std::string outputImage;
        std::string filesystemName = "Debian";
        std::string arch;                   // picks install.<arch>/gtk/initrd.gz
        std::vector<TreeEditor::TreeEdit> treeEdits;
        std::vector<InitrdInjection> initrdInjections;
        InitrdPatcher::PatchMode patchMode = InitrdPatcher::PatchMode::RELATIVE_TO_BASE;
    };
    
    std::string initrdPathFor(const std::string& arch);
    
    // Every check that can be made before the input is unpacked.
    void validatePlan(const InjectionPlan& plan);
    
    // Extracts the input image and its MBR, applies the tree edits, appends
    // the injections to the initrd, regenerates md5sum.txt and repacks the
    // result into outputImage. The input image is never modified. All
    // temporary directories are removed before this returns or throws.
    void injectFilesIntoISO(const InjectionPlan& plan);
}

#endif // INJECTION_ORCHESTRATOR_HPP
