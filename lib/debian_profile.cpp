#include "lib/debian_profile.hpp"
#include "lib/path_guard.hpp"
#include "utils/logs.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace DebianProfile {
    
    const std::string LOGO_SOURCE_NAME = "logo.png";
    const std::string LOGO_INITRD_PATH = "usr/share/graphics/logo_debian.png";
    
    std::string detectArch(const std::string& imageName) {
        return imageName.find("amd64") != std::string::npos ? "amd" : "386";
    }
    
    std::string detectDist(const std::string& imageName) {
        return imageName.find("debian-12") != std::string::npos ? "bookworm" : "bullseye";
    }
    
    std::string testingFor(const std::string& dist) {
        return dist == "bookworm" ? "testing" : "";
    }
    
    Tokens detectTokens(const std::string& imagePath, 
                        const std::string& archOverride,
                        const std::string& distOverride) {
        std::string name = fs::path(imagePath).filename().string();
        
        Tokens tokens;
        tokens.arch = archOverride.empty() ? detectArch(name) : archOverride;
        tokens.dist = distOverride.empty() ? detectDist(name) : distOverride;
        tokens.testing = testingFor(tokens.dist);
        return tokens;
    }
    
    void applyToPlan(Injection::InjectionPlan& plan, const Tokens& tokens, 
                     const std::string& overlayDir) {
        using TreeEditor::TreeEdit;
        
        plan.arch = tokens.arch;
        
        // The Xen kernel variant adds tens of MB and is never booted
        plan.treeEdits.push_back(TreeEdit::deleteSubtree("install." + tokens.arch + "/xen"));
        
        if (overlayDir.empty()) {
            return;
        }
        
        fs::path overlay = PathGuard::require(overlayDir, PathGuard::Requirement::EXISTING_DIRECTORY);
        plan.treeEdits.push_back(TreeEdit::copyOverlay(overlay.string()));
        
        if (fs::is_regular_file(overlay / "isolinux" / "menu.cfg")) {
            plan.treeEdits.push_back(TreeEdit::substitute("__ARCH__", tokens.arch, {"isolinux/menu.cfg"}));
        }
        if (fs::is_directory(overlay / "preseeds")) {
            plan.treeEdits.push_back(TreeEdit::substitute("__DIST__", tokens.dist, {"preseeds"}));
            plan.treeEdits.push_back(TreeEdit::substitute("__TESTING__", tokens.testing, {"preseeds"}));
        }
        
        fs::path logo = overlay / LOGO_SOURCE_NAME;
        if (fs::is_regular_file(logo)) {
            plan.initrdInjections.push_back({logo.string(), LOGO_INITRD_PATH});
        } else {
            Logs::debug("No " + LOGO_SOURCE_NAME + " in " + overlay.string() + ", initrd left as is");
        }
    }
}
