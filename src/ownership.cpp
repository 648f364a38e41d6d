#include "ownership.hpp"
#include "ownership_error.hpp"
#include <algorithm>

Score::Score(size_t numerator, size_t denominator, fs::path path)
    : numerator_(numerator), denominator_(denominator), path_(std::move(path)) {
    if (denominator_ == 0) {
        throw InvalidArgumentError("score denominator must be positive");
    }
    if (numerator_ > denominator_) {
        throw InvalidArgumentError("score numerator " + std::to_string(numerator_) +
                                   " exceeds denominator " + std::to_string(denominator_));
    }
}

OwnershipSet::OwnershipSet(fs::path path, const LineCounts& counts)
    : path_(std::move(path)) {
    for (const auto& [name, lines] : counts) {
        denominator_ += lines;
    }

    owners_.reserve(counts.size());
    for (const auto& [name, lines] : counts) {
        // Owners with no lines carry no ownership
        if (lines == 0) {
            continue;
        }
        owners_.emplace_back(name, Score(lines, denominator_, path_));
    }

    // All owners share one denominator, so comparing numerators orders by fraction
    std::sort(owners_.begin(), owners_.end(), [](const Ownership& a, const Ownership& b) {
        if (a.score.numerator() != b.score.numerator()) {
            return a.score.numerator() > b.score.numerator();
        }
        return a.name < b.name;
    });
}

size_t OwnershipSet::linesFor(const std::string& name) const {
    auto it = std::find_if(owners_.begin(), owners_.end(),
        [&name](const Ownership& owner) { return owner.name == name; });
    return it == owners_.end() ? 0 : it->score.numerator();
}

LineCounts OwnershipSet::counts() const {
    LineCounts result;
    for (const auto& owner : owners_) {
        result[owner.name] = owner.score.numerator();
    }
    return result;
}

bool operator==(const Score& lhs, const Score& rhs) {
    return lhs.numerator() == rhs.numerator() && lhs.denominator() == rhs.denominator();
}

bool operator==(const Ownership& lhs, const Ownership& rhs) {
    return lhs.name == rhs.name && lhs.score == rhs.score;
}

bool operator==(const OwnershipSet& lhs, const OwnershipSet& rhs) {
    return lhs.denominator() == rhs.denominator() && lhs.owners() == rhs.owners();
}
