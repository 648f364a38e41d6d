#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// Glob filter over tracked paths. `*` and `?` stay within one path component,
// `**` spans directories. Patterns without a slash also match the bare filename.
class PatternMatcher {
public:
    PatternMatcher() = default;

    // Add a single pattern
    void addIgnorePattern(const std::string& pattern);
    void addIncludePattern(const std::string& pattern);

    // Set patterns from a comma-separated string (e.g., "*.cpp,*.hpp")
    void setIncludePatterns(const std::string& patternsStr);
    void setExcludePatterns(const std::string& patternsStr);

    // A path is processed if it matches an include pattern (when any exist)
    // and no ignore pattern
    bool shouldProcess(const fs::path& filePath) const;

    bool isIgnored(const fs::path& filePath) const;
    bool isIncluded(const fs::path& filePath) const;

    bool hasIncludePatterns() const { return !includePatterns_.empty(); }
    bool hasIgnorePatterns() const { return !ignorePatterns_.empty(); }

private:
    struct Pattern {
        std::string glob;
        std::regex regex;
        bool filenameOnly;  // No slash in the glob
    };

    std::vector<Pattern> ignorePatterns_;
    std::vector<Pattern> includePatterns_;

    static Pattern compile(const std::string& glob);
    static std::regex patternToRegex(const std::string& pattern);
    static std::vector<std::string> splitPatternString(const std::string& patternsStr);
    static bool matchesAny(const std::vector<Pattern>& patterns, const fs::path& filePath);
};
