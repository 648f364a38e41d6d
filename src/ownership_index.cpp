#include "ownership_index.hpp"
#include "directory_aggregator.hpp"
#include "file_scorer.hpp"
#include "ownership_error.hpp"
#include "pattern_matcher.hpp"
#include "progress_tracker.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <queue>
#include <system_error>

namespace {

// Result a worker reports for one file
struct FileOutcome {
    fs::path relative;
    std::optional<OwnershipSet> set;     // Empty when the file is untracked or failed
    std::exception_ptr error;            // Set on a fatal failure
};

/**
 * Bounded pool of blame workers. Workers pull paths from a shared queue and post
 * outcomes to a channel drained by the thread that owns the pool. The destructor
 * cancels outstanding work and joins every worker.
 */
class FileScoringPool {
public:
    FileScoringPool(const fs::path& root, const std::vector<fs::path>& files, const FileScorer& scorer)
        : root_(root), scorer_(scorer) {
        for (const auto& file : files) {
            fileQueue_.push(file);
        }
    }

    ~FileScoringPool() {
        cancelled_ = true;
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    FileScoringPool(const FileScoringPool&) = delete;
    FileScoringPool& operator=(const FileScoringPool&) = delete;

    // Start up to numThreads workers. Returns false if no thread could be created,
    // in which case the caller runs the work inline with runInline().
    bool start(unsigned int numThreads, ProgressTracker* progress) {
        for (unsigned int i = 0; i < numThreads; ++i) {
            {
                std::lock_guard<std::mutex> lock(channelMutex_);
                ++activeWorkers_;
            }
            try {
                workers_.emplace_back(&FileScoringPool::workerThread, this);
            } catch (const std::system_error& e) {
                {
                    std::lock_guard<std::mutex> lock(channelMutex_);
                    --activeWorkers_;
                }
                if (progress) {
                    progress->warning(std::string("Could not create worker thread: ") + e.what());
                }
                break;
            }
        }
        return !workers_.empty();
    }

    void runInline() {
        {
            std::lock_guard<std::mutex> lock(channelMutex_);
            ++activeWorkers_;
        }
        workerThread();
    }

    // Block until an outcome is available. Returns false once every worker has exited
    // and the channel is drained.
    bool next(FileOutcome& outcome) {
        std::unique_lock<std::mutex> lock(channelMutex_);
        channelReady_.wait(lock, [this] { return !channel_.empty() || activeWorkers_ == 0; });
        if (channel_.empty()) {
            return false;
        }
        outcome = std::move(channel_.front());
        channel_.pop();
        return true;
    }

    // Stop handing out files; in-flight blame calls finish and are drained
    void cancel() {
        cancelled_ = true;
    }

private:
    const fs::path& root_;
    const FileScorer& scorer_;

    std::queue<fs::path> fileQueue_;
    std::mutex queueMutex_;

    std::queue<FileOutcome> channel_;
    std::mutex channelMutex_;
    std::condition_variable channelReady_;
    unsigned int activeWorkers_ = 0;

    std::atomic<bool> cancelled_{false};
    std::vector<std::thread> workers_;

    void workerThread() {
        while (!cancelled_) {
            fs::path relative;
            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                if (fileQueue_.empty()) {
                    break;
                }
                relative = fileQueue_.front();
                fileQueue_.pop();
            }

            FileOutcome outcome;
            outcome.relative = relative;
            try {
                outcome.set = scorer_.scoreFile(DirectoryAggregator::resolvePath(root_, relative));
            } catch (const NotTrackedError&) {
                // Zero contribution, reported without a set
            } catch (...) {
                outcome.error = std::current_exception();
                cancelled_ = true;
            }
            post(std::move(outcome));
        }

        std::lock_guard<std::mutex> lock(channelMutex_);
        --activeWorkers_;
        channelReady_.notify_all();
    }

    void post(FileOutcome outcome) {
        std::lock_guard<std::mutex> lock(channelMutex_);
        channel_.push(std::move(outcome));
        channelReady_.notify_all();
    }
};

} // namespace

OwnershipIndex::OwnershipIndex(const fs::path& root, const BlameSource& blameSource, const IndexOptions& options)
    : root_(normalizePath(root)) {

    switch (blameSource.classify(root_)) {
        case PathKind::Directory:
            rootIsDirectory_ = true;
            buildDirectory(blameSource, options);
            break;
        case PathKind::File:
            rootIsDirectory_ = false;
            buildFile(blameSource, options);
            break;
        case PathKind::Missing:
            throw InvalidPathError(root_.string() + " does not exist");
        case PathKind::Other:
            throw InvalidPathError(root_.string() + " is neither a file nor a directory");
    }
}

void OwnershipIndex::buildFile(const BlameSource& blameSource, const IndexOptions& options) {
    std::map<fs::path, OwnershipSet> scored;
    try {
        blameSource.listTrackedFiles(root_);
        scored = scoreFiles({fs::path()}, blameSource, options);
    } catch (const NotTrackedError&) {
        // An untracked root is a benign "no owners" result
    }

    auto it = scored.find(fs::path());
    Entry entry;
    if (it != scored.end()) {
        entry.set = std::move(it->second);
    } else {
        rootTracked_ = false;
        entry.set = OwnershipSet(root_, LineCounts());
    }
    entries_.emplace(root_, std::move(entry));
}

void OwnershipIndex::buildDirectory(const BlameSource& blameSource, const IndexOptions& options) {
    std::vector<fs::path> files;
    try {
        files = blameSource.listTrackedFiles(root_);
    } catch (const NotTrackedError&) {
        rootTracked_ = false;
    }

    if (options.filter) {
        files.erase(std::remove_if(files.begin(), files.end(),
            [&options](const fs::path& file) { return !options.filter->shouldProcess(file); }),
            files.end());
    }

    std::map<fs::path, OwnershipSet> scored = scoreFiles(files, blameSource, options);

    // Every file is scored before any directory is aggregated
    std::map<fs::path, OwnershipSet> directories = DirectoryAggregator::aggregateTree(root_, scored);

    for (auto& [relative, set] : scored) {
        Entry entry;
        entry.set = std::move(set);
        entry.depth = static_cast<size_t>(std::distance(relative.begin(), relative.end()));
        entries_.emplace(DirectoryAggregator::resolvePath(root_, relative), std::move(entry));
    }

    for (auto& [relative, set] : directories) {
        Entry entry;
        entry.set = std::move(set);
        entry.directory = true;
        entry.depth = relative.empty() ? 0 : static_cast<size_t>(std::distance(relative.begin(), relative.end()));
        entries_.emplace(DirectoryAggregator::resolvePath(root_, relative), std::move(entry));
    }

    // Link children for traversal, keys are already sorted
    for (auto& [path, entry] : entries_) {
        if (path == root_) {
            continue;
        }
        fs::path relative = path.lexically_relative(root_);
        fs::path parent = DirectoryAggregator::resolvePath(root_, relative.parent_path());
        entries_.at(parent).children.push_back(path);
    }
}

std::map<fs::path, OwnershipSet> OwnershipIndex::scoreFiles(const std::vector<fs::path>& files,
                                                           const BlameSource& blameSource,
                                                           const IndexOptions& options) const {
    std::map<fs::path, OwnershipSet> scored;
    ProgressTracker* progress = options.progress;

    if (progress) {
        progress->start(files.size());
    }

    if (!files.empty()) {
        FileScorer scorer(blameSource);
        FileScoringPool pool(root_, files, scorer);

        const unsigned int requested = options.numThreads == 0 ? 1 : options.numThreads;
        const unsigned int numThreads = std::min(requested, static_cast<unsigned int>(files.size()));

        if (!pool.start(numThreads, progress)) {
            if (progress) {
                progress->warning("Falling back to single-threaded blame");
            }
            pool.runInline();
        }

        std::exception_ptr firstError;
        FileOutcome outcome;
        while (pool.next(outcome)) {
            if (outcome.error) {
                if (!firstError) {
                    firstError = outcome.error;
                    pool.cancel();
                }
                continue;
            }

            // Results after a failure are drained but never used
            if (firstError) {
                continue;
            }

            const bool tracked = outcome.set.has_value();
            if (tracked) {
                scored.emplace(outcome.relative, std::move(*outcome.set));
            }
            if (progress) {
                progress->fileCompleted(DirectoryAggregator::resolvePath(root_, outcome.relative), tracked);
            }
        }

        if (firstError) {
            std::rethrow_exception(firstError);
        }
    }

    if (progress) {
        progress->finish();
    }

    return scored;
}

bool OwnershipIndex::contains(const fs::path& path) const {
    return entries_.find(normalizePath(path)) != entries_.end();
}

bool OwnershipIndex::isDirectory(const fs::path& path) const {
    return entryFor(path).directory;
}

const OwnershipSet& OwnershipIndex::find(const fs::path& path) const {
    return entryFor(path).set;
}

const OwnershipSet& OwnershipIndex::summarize() const {
    return entryFor(root_).set;
}

const OwnershipSet& OwnershipIndex::summarize(const fs::path& path) const {
    return entryFor(path).set;
}

size_t OwnershipIndex::depth(const fs::path& path) const {
    return entryFor(path).depth;
}

std::vector<std::pair<fs::path, const OwnershipSet*>> OwnershipIndex::traversal() const {
    std::vector<std::pair<fs::path, const OwnershipSet*>> result;
    result.reserve(entries_.size());

    std::vector<fs::path> stack = {root_};
    while (!stack.empty()) {
        fs::path path = std::move(stack.back());
        stack.pop_back();

        const Entry& entry = entries_.at(path);
        result.emplace_back(path, &entry.set);

        // Push in reverse so siblings come out in order
        for (auto it = entry.children.rbegin(); it != entry.children.rend(); ++it) {
            stack.push_back(*it);
        }
    }

    return result;
}

std::vector<Ownership> OwnershipIndex::top(const OwnershipSet& set, long long n) {
    if (n < 0) {
        throw InvalidArgumentError("n must not be negative, got " + std::to_string(n));
    }

    const auto& owners = set.owners();
    const size_t count = std::min(static_cast<size_t>(n), owners.size());
    return std::vector<Ownership>(owners.begin(), owners.begin() + static_cast<std::ptrdiff_t>(count));
}

std::vector<Ownership> OwnershipIndex::topPercentage(const OwnershipSet& set, double percentage) {
    if (std::isnan(percentage) || percentage < 0.0 || percentage > 1.0) {
        throw InvalidArgumentError("percentage must be within [0, 1], got " + std::to_string(percentage));
    }

    std::vector<Ownership> result;
    if (percentage == 0.0 || set.denominator() == 0) {
        return result;
    }

    size_t cumulative = 0;
    for (const auto& owner : set.owners()) {
        result.push_back(owner);
        cumulative += owner.score.numerator();

        // Compared in line units so no division rounds the prefix short
        if (static_cast<double>(cumulative) >= percentage * static_cast<double>(set.denominator())) {
            break;
        }
    }

    return result;
}

std::vector<Ownership> OwnershipIndex::top(const OwnershipSet& set, const TopQuery& query) {
    validate(query);

    if (query.n) {
        return top(set, *query.n);
    }
    if (query.percentage) {
        return topPercentage(set, *query.percentage);
    }
    return set.owners();
}

void OwnershipIndex::validate(const TopQuery& query) {
    if (query.n && query.percentage) {
        throw InvalidArgumentError("only one of n and percentage may be given");
    }
    if (query.n && *query.n < 0) {
        throw InvalidArgumentError("n must not be negative, got " + std::to_string(*query.n));
    }
    if (query.percentage) {
        const double p = *query.percentage;
        if (std::isnan(p) || p < 0.0 || p > 1.0) {
            throw InvalidArgumentError("percentage must be within [0, 1], got " + std::to_string(p));
        }
    }
}

fs::path OwnershipIndex::normalizePath(const fs::path& path) {
    fs::path normalized = path.lexically_normal();

    // "dir/" normalizes to "dir/" with an empty filename
    if (!normalized.has_filename() && normalized.has_relative_path()) {
        normalized = normalized.parent_path();
    }
    if (normalized.empty()) {
        normalized = ".";
    }
    return normalized;
}

const OwnershipIndex::Entry& OwnershipIndex::entryFor(const fs::path& path) const {
    auto it = entries_.find(normalizePath(path));
    if (it == entries_.end()) {
        throw InvalidPathError(path.string() + " is not in the ownership index");
    }
    return it->second;
}
