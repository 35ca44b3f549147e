#include "misc/version.hpp"
#include "utils/colors.hpp"
#include <iostream>

namespace Version {
    const std::string VERSION = "1.2.0";
    const std::string PROGRAM = "injectiso";
    const std::string LICENSE = "Open Source Project";
    
    void printVersion() {
        std::cout << Colors::bold("InjectISO") << " v" << VERSION << std::endl;
        std::cout << "License: " << LICENSE << std::endl;
    }
    
    void printBanner() {
        std::cout << Colors::bold("InjectISO") << " v" << VERSION << " - ";
        std::cout << "Installer image remastering tool" << std::endl;
        std::cout << std::endl;
    }
}
