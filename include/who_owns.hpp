#pragma once

#include <string>
#include <filesystem>
#include <memory>
#include <chrono>
#include <ostream>
#include <thread>
#include "git_blame_source.hpp"
#include "ownership_index.hpp"
#include "pattern_matcher.hpp"
#include "progress_tracker.hpp"
#include "renderer.hpp"

namespace fs = std::filesystem;

struct WhoOwnsOptions {
    fs::path target = ".";                  // File or directory to attribute
    fs::path outputFile;                    // Empty writes to the output stream
    OutputFormat format = OutputFormat::Tree;
    RenderOptions render;                   // Top-N / percentage and path filters
    unsigned int numThreads = std::thread::hardware_concurrency();
    std::string includePatterns;            // Comma-separated list of glob patterns to include
    std::string excludePatterns;            // Comma-separated list of glob patterns to exclude
    GitBlameOptions git;                    // How git is invoked
    bool verbose = false;
    bool showTiming = false;
};

class WhoOwns {
public:
    // out receives the rendered result, log receives progress and errors
    WhoOwns(const WhoOwnsOptions& options, std::ostream& out, std::ostream& log);

    // Use a different blame source, e.g. for tests. The source must outlive this object.
    WhoOwns(const WhoOwnsOptions& options, const BlameSource& blameSource,
            std::ostream& out, std::ostream& log);

    // Build the index and render it. Returns false after reporting a fatal error.
    bool run();

    // The index built by the last successful run, nullptr before
    const OwnershipIndex* getIndex() const { return index_.get(); }

    // Get the summary of the processed target
    std::string getSummary() const;

    // Get timing information
    std::string getTimingInfo() const;

private:
    WhoOwnsOptions options_;
    std::ostream& out_;
    std::ostream& log_;
    std::unique_ptr<GitBlameSource> gitBlameSource_;
    const BlameSource& blameSource_;
    std::unique_ptr<PatternMatcher> patternMatcher_;
    std::unique_ptr<ProgressTracker> progress_;
    std::unique_ptr<OwnershipIndex> index_;

    // Timing info
    std::chrono::milliseconds duration_{0};
    std::chrono::milliseconds buildDuration_{0};
    std::chrono::milliseconds outputDuration_{0};

    void writeOutput(const Renderer& renderer);
};
