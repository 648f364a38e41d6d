#include "directory_aggregator.hpp"
#include <functional>
#include <set>

namespace {

// Direct children of one directory, both relative to the aggregation root
struct DirectoryNode {
    std::set<fs::path> files;
    std::set<fs::path> subdirectories;
};

} // namespace

OwnershipSet DirectoryAggregator::aggregate(const fs::path& path,
                                            const std::vector<const OwnershipSet*>& children) {
    LineCounts totals;

    // Missing owners in a child simply add nothing
    for (const auto* child : children) {
        for (const auto& owner : child->owners()) {
            totals[owner.name] += owner.score.numerator();
        }
    }

    return OwnershipSet(path, totals);
}

OwnershipSet DirectoryAggregator::aggregate(const fs::path& path, const std::vector<OwnershipSet>& children) {
    std::vector<const OwnershipSet*> pointers;
    pointers.reserve(children.size());
    for (const auto& child : children) {
        pointers.push_back(&child);
    }
    return aggregate(path, pointers);
}

std::map<fs::path, OwnershipSet> DirectoryAggregator::aggregateTree(
    const fs::path& root, const std::map<fs::path, OwnershipSet>& files) {

    // Build the directory structure above the files
    std::map<fs::path, DirectoryNode> nodes;
    nodes[fs::path()];

    for (const auto& [relative, set] : files) {
        fs::path parent = relative.parent_path();
        nodes[parent].files.insert(relative);

        fs::path child = parent;
        while (!child.empty()) {
            fs::path above = child.parent_path();
            nodes[above].subdirectories.insert(child);
            child = above;
        }
    }

    std::map<fs::path, OwnershipSet> directories;

    // Post-order: a directory is combined once, after all of its children exist
    std::function<const OwnershipSet&(const fs::path&)> aggregateDirectory =
        [&](const fs::path& directory) -> const OwnershipSet& {
            const DirectoryNode& node = nodes.at(directory);

            std::vector<const OwnershipSet*> children;
            children.reserve(node.files.size() + node.subdirectories.size());

            for (const auto& file : node.files) {
                children.push_back(&files.at(file));
            }
            for (const auto& subdirectory : node.subdirectories) {
                children.push_back(&aggregateDirectory(subdirectory));
            }

            auto inserted = directories.emplace(directory,
                aggregate(resolvePath(root, directory), children));
            return inserted.first->second;
        };

    aggregateDirectory(fs::path());
    return directories;
}

fs::path DirectoryAggregator::resolvePath(const fs::path& root, const fs::path& relative) {
    if (relative.empty()) {
        return root;
    }
    return (root / relative).lexically_normal();
}
