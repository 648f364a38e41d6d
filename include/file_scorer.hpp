#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "blame_source.hpp"
#include "ownership.hpp"

namespace fs = std::filesystem;

class FileScorer {
public:
    // The source must outlive the scorer
    explicit FileScorer(const BlameSource& blameSource);

    // Blame a file and rank its authors.
    // Throws NotTrackedError or BlameUnavailableError from the blame source.
    OwnershipSet scoreFile(const fs::path& filePath) const;

    // Rank authors of an already blamed file, one identity per line
    static OwnershipSet scoreLines(const fs::path& filePath, const std::vector<std::string>& lineAuthors);

private:
    const BlameSource& blameSource_;
};
