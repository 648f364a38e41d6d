/**
 * @file file_scorer.cpp
 * @brief Implementation of the FileScorer class, which turns one file's blame into ownership.
 *
 * A file's ownership set counts how many of its lines each author last touched.
 * The denominator is the total number of blamed lines, so the owners' numerators
 * always add up to it exactly.
 */
#include "file_scorer.hpp"

/**
 * @brief Constructor for FileScorer
 *
 * @param blameSource Source of per-line authorship; it must outlive the scorer
 */
FileScorer::FileScorer(const BlameSource& blameSource)
    : blameSource_(blameSource) {
}

/**
 * @brief Score a single file
 *
 * Requests the per-line authors of the file and counts them. Errors from the
 * blame source are not handled here: NotTrackedError and BlameUnavailableError
 * reach the caller unchanged, which decides whether they are fatal.
 *
 * @param filePath Path to the file to score
 * @return OwnershipSet Owners of the file, empty if the file has no lines
 */
OwnershipSet FileScorer::scoreFile(const fs::path& filePath) const {
    return scoreLines(filePath, blameSource_.blameLines(filePath));
}

/**
 * @brief Count line occurrences per author identity
 *
 * Identities are compared exactly. An empty sequence yields an empty set with
 * denominator 0, which is a valid result and not an error.
 *
 * @param filePath Path recorded on the resulting set
 * @param lineAuthors One author identity per line, in line order
 * @return OwnershipSet Owners ranked by share of lines
 */
OwnershipSet FileScorer::scoreLines(const fs::path& filePath, const std::vector<std::string>& lineAuthors) {
    LineCounts counts;
    for (const auto& author : lineAuthors) {
        ++counts[author];
    }
    return OwnershipSet(filePath, counts);
}
