#include "pattern_matcher.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    ignorePatterns_.push_back(compile(pattern));
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    includePatterns_.push_back(compile(pattern));
}

void PatternMatcher::setIncludePatterns(const std::string& patternsStr) {
    includePatterns_.clear();
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIncludePattern(pattern);
    }
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    ignorePatterns_.clear();
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

bool PatternMatcher::shouldProcess(const fs::path& filePath) const {
    if (isIgnored(filePath)) {
        return false;
    }
    return isIncluded(filePath);
}

bool PatternMatcher::isIgnored(const fs::path& filePath) const {
    return matchesAny(ignorePatterns_, filePath);
}

bool PatternMatcher::isIncluded(const fs::path& filePath) const {
    // If no include patterns, everything is included
    if (includePatterns_.empty()) {
        return true;
    }
    return matchesAny(includePatterns_, filePath);
}

bool PatternMatcher::matchesAny(const std::vector<Pattern>& patterns, const fs::path& filePath) {
    const std::string pathStr = filePath.generic_string();
    const std::string filename = filePath.filename().string();

    for (const auto& pattern : patterns) {
        if (std::regex_match(pathStr, pattern.regex)) {
            return true;
        }
        if (pattern.filenameOnly && std::regex_match(filename, pattern.regex)) {
            return true;
        }
    }
    return false;
}

PatternMatcher::Pattern PatternMatcher::compile(const std::string& glob) {
    return Pattern{glob, patternToRegex(glob), glob.find('/') == std::string::npos};
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        // Trim whitespace
        pattern.erase(pattern.begin(), std::find_if(pattern.begin(), pattern.end(),
            [](unsigned char ch) { return !std::isspace(ch); }));
        pattern.erase(std::find_if(pattern.rbegin(), pattern.rend(),
            [](unsigned char ch) { return !std::isspace(ch); }).base(), pattern.end());

        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}

std::regex PatternMatcher::patternToRegex(const std::string& pattern) {
    std::string regexStr = "^";

    // A leading slash anchors the pattern at the root, which every path already is
    size_t i = (!pattern.empty() && pattern[0] == '/') ? 1 : 0;

    for (; i < pattern.size(); ++i) {
        const char c = pattern[i];

        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    // **/ matches any directory depth, including none
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    // Trailing ** matches anything below
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * matches any character except directory separator
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' ||
                   c == '}' || c == '+' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }

    // A trailing slash names a directory: match everything inside it
    if (!pattern.empty() && pattern.back() == '/') {
        regexStr += ".*";
    }
    regexStr += "$";

    return std::regex(regexStr);
}
