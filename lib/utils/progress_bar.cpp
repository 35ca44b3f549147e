#include "utils/progress_bar.hpp"
#include "utils/colors.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cmath>
#include <unistd.h>

ProgressBar::ProgressBar(size_t totalItems, const std::string& taskLabel)
    : total(totalItems), current(0), barWidth(40), 
      visible(isatty(STDOUT_FILENO) != 0), label(taskLabel) {
    startTime = std::chrono::steady_clock::now();
}

void ProgressBar::update(size_t currentItems) {
    current = currentItems;
    if (!visible) {
        return;
    }
    
    double progress = total > 0 ? static_cast<double>(current) / total : 1.0;
    int pos = static_cast<int>(barWidth * progress);
    
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - startTime).count();
    double rate = elapsed > 0 ? current / elapsed : 0;
    double remaining = (total - current) / (rate > 0 ? rate : 1);
    
    std::cout << "\r" << Colors::cyan(label) << ": [";
    
    for (int i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << Colors::green("=");
        else if (i == pos) std::cout << Colors::green(">");
        else std::cout << " ";
    }
    
    std::cout << "] " << std::fixed << std::setprecision(1) << (progress * 100.0) << "% ";
    std::cout << current << "/" << total << " files ";
    std::cout << Colors::yellow("ETA: " + formatTime(remaining));
    std::cout.flush();
}

void ProgressBar::advance() {
    update(current + 1);
}

void ProgressBar::finish() {
    update(total);
    if (!visible) {
        return;
    }
    std::cout << std::endl;
    
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - startTime).count();
    std::cout << Colors::green("Completed in " + formatTime(elapsed)) << std::endl;
}

std::string ProgressBar::formatTime(double seconds) {
    if (std::isnan(seconds) || std::isinf(seconds) || seconds < 0) {
        return "--:--";
    }
    
    int mins = static_cast<int>(seconds) / 60;
    int secs = static_cast<int>(seconds) % 60;
    
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << mins << ":" 
        << std::setfill('0') << std::setw(2) << secs;
    return oss.str();
}

std::string ProgressBar::formatSize(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}
