#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Tracks completion of the per-file blame jobs of one build
 *
 * Writes progress and diagnostics to the sink it was given. Only the thread
 * coordinating a build updates the tracker, so it holds no lock.
 */
class ProgressTracker {
public:
    ProgressTracker(std::ostream& log, bool verbose = false);

    // Begin a build over totalFiles files
    void start(size_t totalFiles);

    // Record one finished file; tracked is false when blame reported it untracked
    void fileCompleted(const fs::path& filePath, bool tracked);

    // Record the end of the build
    void finish();

    // Diagnostics, info only shows when verbose
    void info(const std::string& message);
    void warning(const std::string& message);

    size_t totalFiles() const { return totalFiles_; }
    size_t completedFiles() const { return completedFiles_; }
    size_t untrackedFiles() const { return untrackedFiles_; }
    bool isComplete() const { return isComplete_; }
    bool isVerbose() const { return verbose_; }

    int getPercentage() const;
    std::chrono::milliseconds elapsed() const;

private:
    std::ostream& log_;
    bool verbose_;
    size_t totalFiles_ = 0;
    size_t completedFiles_ = 0;
    size_t untrackedFiles_ = 0;
    int lastReportedPercentage_ = -1;
    bool isComplete_ = false;
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point endTime_;
};
