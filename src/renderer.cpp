#include "renderer.hpp"
#include "ownership_error.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

// For convenience
using json = nlohmann::json;

namespace {

constexpr size_t TREE_INDENT = 2;

std::string formatPercentage(double fraction) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return ss.str();
}

} // namespace

Renderer::Renderer(OutputFormat format, const RenderOptions& options)
    : format_(format), options_(options) {
    OwnershipIndex::validate(options_.query);

    if (options_.filesOnly && options_.directoriesOnly) {
        throw InvalidArgumentError("files-only and dirs-only cannot be combined");
    }
}

void Renderer::render(const OwnershipIndex& index, std::ostream& out) const {
    switch (format_) {
        case OutputFormat::Tree:
            renderTree(index, out);
            break;
        case OutputFormat::Csv:
            renderTable(index, out);
            break;
        case OutputFormat::Json:
            renderJson(index, out);
            break;
    }
}

std::vector<std::pair<fs::path, const OwnershipSet*>> Renderer::selectPaths(const OwnershipIndex& index) const {
    auto paths = index.traversal();

    paths.erase(std::remove_if(paths.begin(), paths.end(),
        [this, &index](const std::pair<fs::path, const OwnershipSet*>& item) {
            const fs::path& path = item.first;
            if (path == index.root()) {
                return false;
            }
            if (options_.maxDepth && index.depth(path) > *options_.maxDepth) {
                return true;
            }
            const bool directory = index.isDirectory(path);
            return (options_.filesOnly && directory) || (options_.directoriesOnly && !directory);
        }),
        paths.end());

    return paths;
}

std::vector<OwnershipRow> Renderer::rows(const OwnershipIndex& index) const {
    std::vector<OwnershipRow> result;

    for (const auto& [path, set] : selectPaths(index)) {
        for (const auto& owner : OwnershipIndex::top(*set, options_.query)) {
            result.push_back(OwnershipRow{path, owner.name, owner.score.fraction()});
        }
    }

    return result;
}

void Renderer::renderTree(const OwnershipIndex& index, std::ostream& out) const {
    if (!index.rootTracked()) {
        out << index.root().string() << ": no owners (not tracked)" << std::endl;
        return;
    }

    for (const auto& [path, set] : selectPaths(index)) {
        const bool isRoot = path == index.root();
        const size_t depth = isRoot ? 0 : index.depth(path);
        const std::string indent(depth * TREE_INDENT, ' ');

        std::string label = isRoot ? path.string() : path.filename().string();
        if (index.isDirectory(path) && label.back() != '/') {
            label += "/";
        }

        out << indent << label << " (" << set->denominator()
            << (set->denominator() == 1 ? " line)" : " lines)") << std::endl;

        const auto owners = OwnershipIndex::top(*set, options_.query);
        if (owners.empty()) {
            out << indent << std::string(TREE_INDENT, ' ') << "(no owners)" << std::endl;
            continue;
        }

        size_t nameWidth = 0;
        for (const auto& owner : owners) {
            nameWidth = std::max(nameWidth, owner.name.size());
        }

        for (const auto& owner : owners) {
            out << indent << std::string(TREE_INDENT, ' ')
                << std::left << std::setw(static_cast<int>(nameWidth)) << owner.name << std::right
                << "  " << std::setw(7) << formatPercentage(owner.score.fraction())
                << "  " << owner.score.numerator() << "/" << owner.score.denominator()
                << std::endl;
        }
    }
}

void Renderer::renderTable(const OwnershipIndex& index, std::ostream& out) const {
    if (options_.header) {
        out << "path,owner,score" << std::endl;
    }

    for (const auto& row : rows(index)) {
        out << escapeCsv(row.path.string()) << ","
            << escapeCsv(row.owner) << ","
            << std::setprecision(6) << row.score << std::endl;
    }
}

void Renderer::renderJson(const OwnershipIndex& index, std::ostream& out) const {
    json report;
    report["root"] = index.root().string();
    report["tracked"] = index.rootTracked();

    json pathsJson = json::array();
    for (const auto& [path, set] : selectPaths(index)) {
        json pathJson;
        pathJson["path"] = path.string();
        pathJson["type"] = index.isDirectory(path) ? "directory" : "file";
        pathJson["lines"] = set->denominator();

        json ownersJson = json::array();
        for (const auto& owner : OwnershipIndex::top(*set, options_.query)) {
            ownersJson.push_back({
                {"name", owner.name},
                {"lines", owner.score.numerator()},
                {"score", owner.score.fraction()}
            });
        }
        pathJson["owners"] = ownersJson;

        pathsJson.push_back(pathJson);
    }
    report["paths"] = pathsJson;

    out << report.dump(2) << std::endl;
}

OutputFormat Renderer::formatFromString(const std::string& format) {
    if (format == "tree") {
        return OutputFormat::Tree;
    } else if (format == "csv") {
        return OutputFormat::Csv;
    } else if (format == "json") {
        return OutputFormat::Json;
    }
    throw InvalidArgumentError("unknown output format: " + format);
}

std::string Renderer::escapeCsv(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }

    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}
