#ifndef PROGRESS_BAR_HPP
#define PROGRESS_BAR_HPP

#include <string>
#include <chrono>

// Single-line progress display for long per-file loops (hashing, copying).
// Renders nothing when stdout is not a terminal.
class ProgressBar {
private:
    size_t total;
    size_t current;
    int barWidth;
    bool visible;
    std::chrono::time_point<std::chrono::steady_clock> startTime;
    std::string label;
    
public:
    ProgressBar(size_t totalItems, const std::string& taskLabel = "Progress");
    void update(size_t currentItems);
    void advance();
    void finish();
    
    static std::string formatTime(double seconds);
    static std::string formatSize(size_t bytes);
};

#endif // PROGRESS_BAR_HPP
