#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "blame_source.hpp"

namespace fs = std::filesystem;

// Which blame field names the owner of a line
enum class IdentityMode {
    Name,           // "author"
    Email,          // "author-mail" without the angle brackets
    NameAndEmail    // "Name <mail>"
};

struct GitBlameOptions {
    std::string gitExecutable = "git";      // Looked up on PATH unless absolute
    std::string revision;                   // Blame at this revision (empty = working tree)
    bool ignoreWhitespace = false;          // Pass -w to git blame
    IdentityMode identity = IdentityMode::Name;
};

// BlameSource backed by the git command line tool
class GitBlameSource : public BlameSource {
public:
    // One line of parsed blame output
    struct BlameLine {
        size_t lineNumber = 0;  // 1-based line number in the blamed revision
        std::string author;
    };

    // Captured result of one git invocation
    struct CommandResult {
        int exitCode = -1;
        std::string stdoutOutput;
        std::string stderrOutput;
    };

    explicit GitBlameSource(const GitBlameOptions& options = GitBlameOptions());

    std::vector<fs::path> listTrackedFiles(const fs::path& path) const override;
    std::vector<std::string> blameLines(const fs::path& file) const override;

    // Parse `git blame --line-porcelain` output in a single pass.
    // Throws BlameUnavailableError on malformed output.
    static std::vector<BlameLine> parseLinePorcelain(const std::string& output, IdentityMode identity);

    // Split NUL-separated `git ls-files -z` output
    static std::vector<fs::path> parseFileList(const std::string& output);

    // True when git's error text means the path is outside version control
    static bool isNotTrackedMessage(const std::string& stderrOutput);

    static IdentityMode identityModeFromString(const std::string& mode);
    static std::string identityModeToString(IdentityMode mode);

private:
    GitBlameOptions options_;

    // Run git with args (without the executable) and capture its output
    CommandResult runGit(const std::vector<std::string>& args) const;
};
