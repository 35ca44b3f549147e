#ifndef DEBIAN_PROFILE_HPP
#define DEBIAN_PROFILE_HPP

#include "lib/injection_orchestrator.hpp"
#include <string>

namespace DebianProfile {
    
    struct Tokens {
        std::string arch;       // "amd" or "386", as in install.<arch>/
        std::string dist;       // "bookworm" or "bullseye"
        std::string testing;    // "testing" for bookworm, empty otherwise
    };
    
    extern const std::string LOGO_SOURCE_NAME;
    extern const std::string LOGO_INITRD_PATH;
    
    std::string detectArch(const std::string& imageName);
    std::string detectDist(const std::string& imageName);
    std::string testingFor(const std::string& dist);
    
    // Tokens guessed from the image file name; non-empty overrides win.
    Tokens detectTokens(const std::string& imagePath, 
                        const std::string& archOverride = "",
                        const std::string& distOverride = "");
    
    // Fills in the edits Debian netinst images need: drop the unused Xen
    // kernel, copy the overlay, resolve the __ARCH__/__DIST__/__TESTING__
    // placeholders it brings and put its logo.png into the initrd.
    void applyToPlan(Injection::InjectionPlan& plan, const Tokens& tokens, 
                     const std::string& overlayDir);
}

#endif // DEBIAN_PROFILE_HPP
