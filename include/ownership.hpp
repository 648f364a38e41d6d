#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Number of lines attributed to an owner out of the lines under a path
class Score {
public:
    // Throws InvalidArgumentError if denominator is 0 or numerator > denominator
    Score(size_t numerator, size_t denominator, fs::path path = {});

    size_t numerator() const { return numerator_; }
    size_t denominator() const { return denominator_; }
    const fs::path& path() const { return path_; }

    double fraction() const {
        return static_cast<double>(numerator_) / static_cast<double>(denominator_);
    }

private:
    size_t numerator_;
    size_t denominator_;
    fs::path path_;  // Informational only
};

struct Ownership {
    std::string name;  // Author identity, compared exactly
    Score score;

    Ownership(std::string ownerName, Score ownerScore)
        : name(std::move(ownerName)), score(std::move(ownerScore)) {}
};

// Per-owner line counts, keyed by identity
using LineCounts = std::map<std::string, size_t>;

/**
 * @brief Immutable ownership ranking for one file or directory
 *
 * Owners are sorted by fraction descending, ties broken by name ascending.
 * The numerators of all owners always sum to the denominator, which is the
 * number of blamed lines under the path. An empty set has denominator 0.
 */
class OwnershipSet {
public:
    OwnershipSet() = default;

    // Build from per-owner line counts; the denominator is their sum
    OwnershipSet(fs::path path, const LineCounts& counts);

    const fs::path& path() const { return path_; }
    size_t denominator() const { return denominator_; }
    const std::vector<Ownership>& owners() const { return owners_; }

    bool empty() const { return owners_.empty(); }
    size_t size() const { return owners_.size(); }

    // Numerator for an owner, 0 if absent
    size_t linesFor(const std::string& name) const;

    // Per-owner line counts, the inverse of construction
    LineCounts counts() const;

private:
    fs::path path_;
    size_t denominator_ = 0;
    std::vector<Ownership> owners_;
};

// Equality compares line counts only; paths are informational
bool operator==(const Score& lhs, const Score& rhs);
bool operator==(const Ownership& lhs, const Ownership& rhs);
bool operator==(const OwnershipSet& lhs, const OwnershipSet& rhs);
