#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <thread>
#include <utility>
#include <vector>
#include "blame_source.hpp"
#include "ownership.hpp"

namespace fs = std::filesystem;

class PatternMatcher;
class ProgressTracker;

struct IndexOptions {
    unsigned int numThreads = std::thread::hardware_concurrency();  // Concurrent blame calls
    const PatternMatcher* filter = nullptr;     // Applied to paths relative to the root
    ProgressTracker* progress = nullptr;        // Receives completion updates
};

// At most one of n and percentage may be set; neither selects every owner
struct TopQuery {
    std::optional<long long> n;
    std::optional<double> percentage;
};

/**
 * @brief Ownership of every file and directory under a root
 *
 * The constructor performs the whole build: tracked files are blamed on a
 * bounded pool of worker threads, then directories are aggregated bottom-up.
 * Workers hand their results to the constructing thread, which is the only
 * writer of the index. The first fatal error cancels remaining work and is
 * rethrown; no partially built index is ever observable.
 *
 * Files that turn out to be untracked are left out. When the root itself is
 * untracked the index holds a single empty set for it and rootTracked() is false.
 */
class OwnershipIndex {
public:
    // Throws InvalidPathError for a missing root, BlameUnavailableError on blame failure
    OwnershipIndex(const fs::path& root, const BlameSource& blameSource,
                   const IndexOptions& options = IndexOptions());

    const fs::path& root() const { return root_; }
    bool rootTracked() const { return rootTracked_; }
    bool rootIsDirectory() const { return rootIsDirectory_; }

    // Number of indexed paths, root included
    size_t size() const { return entries_.size(); }

    bool contains(const fs::path& path) const;
    bool isDirectory(const fs::path& path) const;

    // Throws InvalidPathError if path was not visited by the build
    const OwnershipSet& find(const fs::path& path) const;

    // The aggregate stored for the root, or for a visited directory beneath it
    const OwnershipSet& summarize() const;
    const OwnershipSet& summarize(const fs::path& path) const;

    // Visited paths in pre-order, root first, siblings ordered by path
    std::vector<std::pair<fs::path, const OwnershipSet*>> traversal() const;

    // Depth of a visited path below the root (root is 0)
    size_t depth(const fs::path& path) const;

    // First n owners. Throws InvalidArgumentError if n < 0.
    static std::vector<Ownership> top(const OwnershipSet& set, long long n);

    // Smallest prefix whose cumulative fraction reaches percentage.
    // Throws InvalidArgumentError unless 0 <= percentage <= 1.
    static std::vector<Ownership> topPercentage(const OwnershipSet& set, double percentage);

    // Throws InvalidArgumentError if both limits are set
    static std::vector<Ownership> top(const OwnershipSet& set, const TopQuery& query);

    // Validate a query without running it
    static void validate(const TopQuery& query);

    // Lexically normalized form used for index keys
    static fs::path normalizePath(const fs::path& path);

private:
    struct Entry {
        OwnershipSet set;
        bool directory = false;
        size_t depth = 0;
        std::vector<fs::path> children;   // Indexed paths, sorted
    };

    fs::path root_;
    bool rootTracked_ = true;
    bool rootIsDirectory_ = false;
    std::map<fs::path, Entry> entries_;

    void buildFile(const BlameSource& blameSource, const IndexOptions& options);
    void buildDirectory(const BlameSource& blameSource, const IndexOptions& options);

    // Blame files (relative to the root) in parallel; untracked files are omitted
    std::map<fs::path, OwnershipSet> scoreFiles(const std::vector<fs::path>& files,
                                               const BlameSource& blameSource,
                                               const IndexOptions& options) const;

    const Entry& entryFor(const fs::path& path) const;
};
