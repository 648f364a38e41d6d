#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class PathKind {
    Missing,
    File,
    Directory,
    Other       // Exists but is neither a regular file nor a directory
};

// Access to the version-control system's file listing and per-line authorship.
// Implementations must be safe to call from several worker threads at once.
class BlameSource {
public:
    virtual ~BlameSource() = default;

    // Tracked files under path, relative to path (a file path lists itself as its
    // filename). Throws NotTrackedError if nothing under path is tracked.
    virtual std::vector<fs::path> listTrackedFiles(const fs::path& path) const = 0;

    // One author identity per line of file, in line order.
    // Throws NotTrackedError or BlameUnavailableError.
    virtual std::vector<std::string> blameLines(const fs::path& file) const = 0;

    // What path is on disk. The default asks the filesystem.
    virtual PathKind classify(const fs::path& path) const;
};
