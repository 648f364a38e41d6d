#include "who_owns.hpp"
#include <fstream>
#include <stdexcept>
#include <sstream>

WhoOwns::WhoOwns(const WhoOwnsOptions& options, std::ostream& out, std::ostream& log)
    : options_(options),
      out_(out),
      log_(log),
      gitBlameSource_(std::make_unique<GitBlameSource>(options.git)),
      blameSource_(*gitBlameSource_) {
    patternMatcher_ = std::make_unique<PatternMatcher>();
    progress_ = std::make_unique<ProgressTracker>(log_, options_.verbose);
}

WhoOwns::WhoOwns(const WhoOwnsOptions& options, const BlameSource& blameSource,
                 std::ostream& out, std::ostream& log)
    : options_(options),
      out_(out),
      log_(log),
      blameSource_(blameSource) {
    patternMatcher_ = std::make_unique<PatternMatcher>();
    progress_ = std::make_unique<ProgressTracker>(log_, options_.verbose);
}

bool WhoOwns::run() {
    try {
        auto startTime = std::chrono::steady_clock::now();

        // Apply include patterns if specified
        if (!options_.includePatterns.empty()) {
            patternMatcher_->setIncludePatterns(options_.includePatterns);
            progress_->info("Using include patterns: " + options_.includePatterns);
        }

        // Apply exclude patterns if specified
        if (!options_.excludePatterns.empty()) {
            patternMatcher_->setExcludePatterns(options_.excludePatterns);
            progress_->info("Using exclude patterns: " + options_.excludePatterns);
        }

        // Validate the query before doing any blame work
        Renderer renderer(options_.format, options_.render);

        progress_->info("Attributing ownership of " + options_.target.string());

        IndexOptions indexOptions;
        indexOptions.numThreads = options_.numThreads;
        indexOptions.filter = patternMatcher_.get();
        indexOptions.progress = progress_.get();

        auto buildStart = std::chrono::steady_clock::now();
        index_ = std::make_unique<OwnershipIndex>(options_.target, blameSource_, indexOptions);
        auto buildEnd = std::chrono::steady_clock::now();
        buildDuration_ = std::chrono::duration_cast<std::chrono::milliseconds>(buildEnd - buildStart);

        // Tabular output has no row for this, so it always goes to the log
        if (!index_->rootTracked()) {
            progress_->warning(index_->root().string() + ": no owners (not tracked)");
        }

        auto outputStart = std::chrono::steady_clock::now();
        writeOutput(renderer);
        auto outputEnd = std::chrono::steady_clock::now();
        outputDuration_ = std::chrono::duration_cast<std::chrono::milliseconds>(outputEnd - outputStart);

        duration_ = std::chrono::duration_cast<std::chrono::milliseconds>(outputEnd - startTime);
        return true;
    }
    catch (const std::exception& e) {
        index_.reset();
        log_ << "Error: " << e.what() << std::endl;
        return false;
    }
}

void WhoOwns::writeOutput(const Renderer& renderer) {
    if (options_.outputFile.empty()) {
        renderer.render(*index_, out_);
        return;
    }

    std::ofstream outFile(options_.outputFile);
    if (!outFile) {
        throw std::runtime_error("Could not open output file: " + options_.outputFile.string());
    }
    renderer.render(*index_, outFile);
    progress_->info("Output written to " + options_.outputFile.string());
}

std::string WhoOwns::getSummary() const {
    std::stringstream ss;
    ss << "Ownership summary:" << std::endl;
    ss << "  Target: " << options_.target.string() << std::endl;

    if (index_) {
        ss << "  Files blamed: " << progress_->completedFiles() << std::endl;
        ss << "  Untracked files skipped: " << progress_->untrackedFiles() << std::endl;
        ss << "  Total lines: " << index_->summarize().denominator() << std::endl;
        ss << "  Owners: " << index_->summarize().size() << std::endl;
    }

    if (options_.showTiming) {
        ss << "  Build time: " << buildDuration_.count() << " ms" << std::endl;
        ss << "  Output generation time: " << outputDuration_.count() << " ms" << std::endl;
        ss << "  Total time: " << duration_.count() << " ms" << std::endl;
    }

    return ss.str();
}

std::string WhoOwns::getTimingInfo() const {
    const auto total = duration_.count() ? duration_.count() : 1;

    std::stringstream ss;
    ss << "Timing Information:" << std::endl;
    ss << "- Total time: " << duration_.count() << "ms" << std::endl;
    ss << "- Blame and aggregation time: " << buildDuration_.count() << "ms ("
       << (buildDuration_.count() * 100 / total) << "%)" << std::endl;
    ss << "- Output generation time: " << outputDuration_.count() << "ms ("
       << (outputDuration_.count() * 100 / total) << "%)" << std::endl;

    if (buildDuration_.count() > 0 && progress_->completedFiles() > 0) {
        double filesPerSecond = static_cast<double>(progress_->completedFiles()) /
                                (buildDuration_.count() / 1000.0);
        ss << "- Performance: " << static_cast<long long>(filesPerSecond) << " files/second" << std::endl;
    }

    return ss.str();
}
