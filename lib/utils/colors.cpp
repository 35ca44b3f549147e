#include "utils/colors.hpp"
#include <unistd.h>

namespace Colors {
    const std::string RESET = "\033[0m";
    const std::string RED = "\033[31m";
    const std::string GREEN = "\033[32m";
    const std::string YELLOW = "\033[33m";
    const std::string BLUE = "\033[34m";
    const std::string CYAN = "\033[36m";
    const std::string BOLD = "\033[1m";
    
    // Escape codes only make sense on a terminal; pipelines get plain text
    static bool enabled = isatty(STDOUT_FILENO) && isatty(STDERR_FILENO);
    
    void setEnabled(bool value) {
        enabled = value;
    }
    
    std::string colorize(const std::string& text, const std::string& color) {
        if (!enabled) {
            return text;
        }
        return color + text + RESET;
    }
    
    std::string red(const std::string& text) {
        return colorize(text, RED);
    }
    
    std::string green(const std::string& text) {
        return colorize(text, GREEN);
    }
    
    std::string yellow(const std::string& text) {
        return colorize(text, YELLOW);
    }
    
    std::string blue(const std::string& text) {
        return colorize(text, BLUE);
    }
    
    std::string cyan(const std::string& text) {
        return colorize(text, CYAN);
    }
    
    std::string bold(const std::string& text) {
        return colorize(text, BOLD);
    }
}
