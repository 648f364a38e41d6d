#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "ownership_index.hpp"

namespace fs = std::filesystem;

enum class OutputFormat {
    Tree,
    Csv,
    Json
};

struct RenderOptions {
    TopQuery query;                         // Owners shown per path
    bool header = true;                     // CSV header row
    std::optional<size_t> maxDepth;         // Deepest level shown below the root
    bool filesOnly = false;                 // Hide directories other than the root
    bool directoriesOnly = false;           // Hide files other than the root
};

// One flattened (path, owner, fraction) row of tabular output
struct OwnershipRow {
    fs::path path;
    std::string owner;
    double score;
};

class Renderer {
public:
    // Throws InvalidArgumentError for an invalid query or conflicting filters
    Renderer(OutputFormat format, const RenderOptions& options = RenderOptions());

    void render(const OwnershipIndex& index, std::ostream& out) const;

    // Paths selected for output, root first, in traversal order
    std::vector<std::pair<fs::path, const OwnershipSet*>> selectPaths(const OwnershipIndex& index) const;

    // Flattened rows for tabular output
    std::vector<OwnershipRow> rows(const OwnershipIndex& index) const;

    static OutputFormat formatFromString(const std::string& format);

private:
    OutputFormat format_;
    RenderOptions options_;

    void renderTree(const OwnershipIndex& index, std::ostream& out) const;
    void renderTable(const OwnershipIndex& index, std::ostream& out) const;
    void renderJson(const OwnershipIndex& index, std::ostream& out) const;

    static std::string escapeCsv(const std::string& field);
};
