#include "progress_tracker.hpp"

namespace {

// Progress lines are written at most once per step
constexpr int REPORT_STEP_PERCENT = 10;

} // namespace

ProgressTracker::ProgressTracker(std::ostream& log, bool verbose)
    : log_(log), verbose_(verbose) {
}

void ProgressTracker::start(size_t totalFiles) {
    totalFiles_ = totalFiles;
    completedFiles_ = 0;
    untrackedFiles_ = 0;
    lastReportedPercentage_ = -1;
    isComplete_ = false;
    startTime_ = std::chrono::steady_clock::now();
    endTime_ = startTime_;

    info("Scoring " + std::to_string(totalFiles) + " files");
}

void ProgressTracker::fileCompleted(const fs::path& filePath, bool tracked) {
    ++completedFiles_;

    if (!tracked) {
        ++untrackedFiles_;
        info("Skipping untracked file " + filePath.string());
    }

    if (!verbose_) {
        return;
    }

    const int percentage = getPercentage();
    if (lastReportedPercentage_ < 0 ||
        percentage - lastReportedPercentage_ >= REPORT_STEP_PERCENT ||
        completedFiles_ == totalFiles_) {
        log_ << "Progress: " << percentage << "% ("
             << completedFiles_ << "/" << totalFiles_ << " files)" << std::endl;
        lastReportedPercentage_ = percentage;
    }
}

void ProgressTracker::finish() {
    isComplete_ = true;
    endTime_ = std::chrono::steady_clock::now();

    if (verbose_) {
        log_ << "Completed in " << elapsed().count() << "ms";
        if (untrackedFiles_ > 0) {
            log_ << " (" << untrackedFiles_ << " untracked files skipped)";
        }
        log_ << std::endl;
    }
}

void ProgressTracker::info(const std::string& message) {
    if (verbose_) {
        log_ << message << std::endl;
    }
}

void ProgressTracker::warning(const std::string& message) {
    log_ << "Warning: " << message << std::endl;
}

int ProgressTracker::getPercentage() const {
    if (totalFiles_ == 0) {
        return 100;
    }
    return static_cast<int>((completedFiles_ * 100) / totalFiles_);
}

std::chrono::milliseconds ProgressTracker::elapsed() const {
    auto end = isComplete_ ? endTime_ : std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - startTime_);
}
