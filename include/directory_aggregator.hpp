#pragma once

#include <filesystem>
#include <map>
#include <vector>
#include "ownership.hpp"

namespace fs = std::filesystem;

/**
 * @brief Combines child ownership sets into directory-level ownership
 *
 * A directory's denominator is the sum of its children's denominators and each
 * owner's numerator is the sum of that owner's numerators across the children.
 * Because sums are associative and commutative, aggregating a flat list of files
 * gives the same result as aggregating any grouping of them and then the groups.
 */
class DirectoryAggregator {
public:
    // Combine children (files and already aggregated subdirectories) in one step.
    // Children with no lines contribute nothing.
    static OwnershipSet aggregate(const fs::path& path, const std::vector<const OwnershipSet*>& children);
    static OwnershipSet aggregate(const fs::path& path, const std::vector<OwnershipSet>& children);

    /**
     * @brief Aggregate every directory above a set of scored files, in post-order
     *
     * @param root Path the relative keys are resolved against
     * @param files Scored files keyed by path relative to root
     * @return Directory sets keyed by path relative to root; the root itself is keyed
     *         by the empty path. Every directory is aggregated after all its children.
     */
    static std::map<fs::path, OwnershipSet> aggregateTree(const fs::path& root,
                                                         const std::map<fs::path, OwnershipSet>& files);

    // Path under root for a relative key, the root itself for the empty key
    static fs::path resolvePath(const fs::path& root, const fs::path& relative);
};
