#include "git_blame_source.hpp"
#include "ownership_error.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <unordered_map>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Exit status used by the child when exec itself fails
constexpr int EXEC_FAILED_STATUS = 127;

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// A porcelain header is "<hash> <orig-line> <final-line> [<count>]"
bool isHeaderLine(const std::string& line) {
    const size_t space = line.find(' ');
    if (space != 40 && space != 64) {
        return false;
    }
    return std::all_of(line.begin(), line.begin() + space,
        [](unsigned char ch) { return std::isxdigit(ch); });
}

std::string stripAngleBrackets(const std::string& mail) {
    if (mail.size() >= 2 && mail.front() == '<' && mail.back() == '>') {
        return mail.substr(1, mail.size() - 2);
    }
    return mail;
}

std::string firstLine(const std::string& text) {
    const size_t newline = text.find('\n');
    return newline == std::string::npos ? text : text.substr(0, newline);
}

} // namespace

GitBlameSource::GitBlameSource(const GitBlameOptions& options)
    : options_(options) {
}

std::vector<fs::path> GitBlameSource::listTrackedFiles(const fs::path& path) const {
    fs::path workingDir = path;
    std::vector<std::string> args = {"ls-files", "-z"};

    if (classify(path) != PathKind::Directory) {
        workingDir = path.parent_path().empty() ? fs::path(".") : path.parent_path();
        args.push_back("--");
        args.push_back(path.filename().string());
    }

    args.insert(args.begin(), {"-C", workingDir.string()});
    CommandResult result = runGit(args);

    if (result.exitCode != 0) {
        if (isNotTrackedMessage(result.stderrOutput)) {
            throw NotTrackedError(path.string());
        }
        throw BlameUnavailableError("git ls-files failed for " + path.string() + ": " +
                                    firstLine(result.stderrOutput));
    }

    std::vector<fs::path> files;
    for (const auto& entry : parseFileList(result.stdoutOutput)) {
        // Submodules are listed as directories and cannot be blamed
        std::error_code ec;
        auto status = fs::symlink_status(workingDir / entry, ec);
        if (ec || !fs::exists(status) || fs::is_directory(status)) {
            continue;
        }
        files.push_back(entry);
    }

    if (files.empty()) {
        throw NotTrackedError(path.string());
    }

    return files;
}

std::vector<std::string> GitBlameSource::blameLines(const fs::path& file) const {
    const fs::path workingDir = file.parent_path().empty() ? fs::path(".") : file.parent_path();

    std::vector<std::string> args = {"-C", workingDir.string(), "blame", "--line-porcelain"};
    if (options_.ignoreWhitespace) {
        args.push_back("-w");
    }
    if (!options_.revision.empty()) {
        args.push_back(options_.revision);
    }
    args.push_back("--");
    args.push_back(file.filename().string());

    CommandResult result = runGit(args);

    if (result.exitCode != 0) {
        if (isNotTrackedMessage(result.stderrOutput)) {
            throw NotTrackedError(file.string());
        }
        throw BlameUnavailableError("git blame failed for " + file.string() + ": " +
                                    firstLine(result.stderrOutput));
    }

    std::vector<BlameLine> parsed;
    try {
        parsed = parseLinePorcelain(result.stdoutOutput, options_.identity);
    } catch (const BlameUnavailableError& e) {
        throw BlameUnavailableError(file.string() + ": " + e.detail());
    }

    std::vector<std::string> authors;
    authors.reserve(parsed.size());
    for (auto& line : parsed) {
        authors.push_back(std::move(line.author));
    }
    return authors;
}

std::vector<GitBlameSource::BlameLine> GitBlameSource::parseLinePorcelain(const std::string& output,
                                                                          IdentityMode identity) {
    std::vector<BlameLine> lines;
    std::istringstream stream(output);
    std::string line;

    bool inEntry = false;
    BlameLine current;
    std::string authorName;
    std::string authorMail;

    while (std::getline(stream, line)) {
        if (!line.empty() && line[0] == '\t') {
            // Content line closes the current entry
            if (!inEntry) {
                throw BlameUnavailableError("malformed blame output: content without header");
            }

            switch (identity) {
                case IdentityMode::Name:
                    current.author = authorName;
                    break;
                case IdentityMode::Email:
                    current.author = authorMail;
                    break;
                case IdentityMode::NameAndEmail:
                    current.author = authorName + " <" + authorMail + ">";
                    break;
            }

            if (current.lineNumber != lines.size() + 1) {
                throw BlameUnavailableError("malformed blame output: expected line " +
                                            std::to_string(lines.size() + 1) + ", got " +
                                            std::to_string(current.lineNumber));
            }

            lines.push_back(std::move(current));
            current = BlameLine();
            authorName.clear();
            authorMail.clear();
            inEntry = false;
        } else if (isHeaderLine(line)) {
            std::istringstream header(line);
            std::string hash;
            size_t originalLine = 0;
            size_t finalLine = 0;
            if (!(header >> hash >> originalLine >> finalLine) || finalLine == 0) {
                throw BlameUnavailableError("malformed blame header: " + line);
            }
            current.lineNumber = finalLine;
            inEntry = true;
        } else if (startsWith(line, "author-mail ")) {
            authorMail = stripAngleBrackets(line.substr(12));
        } else if (startsWith(line, "author ")) {
            authorName = line.substr(7);
        }
    }

    if (inEntry) {
        throw BlameUnavailableError("malformed blame output: truncated entry");
    }

    return lines;
}

std::vector<fs::path> GitBlameSource::parseFileList(const std::string& output) {
    std::vector<fs::path> files;
    size_t start = 0;

    while (start < output.size()) {
        size_t end = output.find('\0', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        if (end > start) {
            files.emplace_back(output.substr(start, end - start));
        }
        start = end + 1;
    }

    return files;
}

bool GitBlameSource::isNotTrackedMessage(const std::string& stderrOutput) {
    static const std::vector<std::string> markers = {
        "not a git repository",
        "no such path",
        "does not exist",
        "is outside repository",
        "did not match any file"
    };

    std::string lowered = stderrOutput;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    return std::any_of(markers.begin(), markers.end(),
        [&lowered](const std::string& marker) { return lowered.find(marker) != std::string::npos; });
}

IdentityMode GitBlameSource::identityModeFromString(const std::string& mode) {
    static const std::unordered_map<std::string, IdentityMode> modes = {
        {"name", IdentityMode::Name},
        {"email", IdentityMode::Email},
        {"name-email", IdentityMode::NameAndEmail}
    };

    auto it = modes.find(mode);
    if (it == modes.end()) {
        throw InvalidArgumentError("unknown identity mode: " + mode);
    }
    return it->second;
}

std::string GitBlameSource::identityModeToString(IdentityMode mode) {
    switch (mode) {
        case IdentityMode::Name:
            return "name";
        case IdentityMode::Email:
            return "email";
        case IdentityMode::NameAndEmail:
            return "name-email";
    }
    return "name";
}

GitBlameSource::CommandResult GitBlameSource::runGit(const std::vector<std::string>& args) const {
    CommandResult result;

    // Build argv before forking, the child may only call async-signal-safe functions
    std::vector<std::string> command;
    command.reserve(args.size() + 1);
    command.push_back(options_.gitExecutable);
    command.insert(command.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (auto& arg : command) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int stdoutPipe[2];
    int stderrPipe[2];
    if (pipe2(stdoutPipe, O_CLOEXEC) < 0) {
        throw BlameUnavailableError(std::string("failed to create pipe: ") + std::strerror(errno));
    }
    if (pipe2(stderrPipe, O_CLOEXEC) < 0) {
        const int savedErrno = errno;
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        throw BlameUnavailableError(std::string("failed to create pipe: ") + std::strerror(savedErrno));
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int savedErrno = errno;
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        close(stderrPipe[0]);
        close(stderrPipe[1]);
        throw BlameUnavailableError(std::string("failed to start git: ") + std::strerror(savedErrno));
    }

    if (pid == 0) {
        // Child process
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        _exit(EXEC_FAILED_STATUS);
    }

    // Parent process
    close(stdoutPipe[1]);
    close(stderrPipe[1]);

    pollfd fds[2] = {
        {stdoutPipe[0], POLLIN, 0},
        {stderrPipe[0], POLLIN, 0}
    };
    std::string* outputs[2] = {&result.stdoutOutput, &result.stderrOutput};
    int openStreams = 2;
    char buffer[4096];

    while (openStreams > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            const ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                outputs[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --openStreams;
            }
        }
    }

    for (auto& fd : fds) {
        if (fd.fd >= 0) {
            close(fd.fd);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw BlameUnavailableError(std::string("failed to wait for git: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = -1;
    }

    if (result.exitCode == EXEC_FAILED_STATUS && result.stderrOutput.empty()) {
        throw BlameUnavailableError("could not execute '" + options_.gitExecutable + "'");
    }

    return result;
}
