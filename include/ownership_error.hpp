#pragma once

#include <stdexcept>
#include <string>

// Base class for every error raised while computing ownership
class OwnershipError : public std::runtime_error {
public:
    explicit OwnershipError(const std::string& message)
        : std::runtime_error(message) {}
};

// The path is not under version control. Callers treat this as a zero contribution.
class NotTrackedError : public OwnershipError {
public:
    explicit NotTrackedError(const std::string& path)
        : OwnershipError("Not tracked: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// The blame facility failed for any reason other than "not tracked"
class BlameUnavailableError : public OwnershipError {
public:
    explicit BlameUnavailableError(const std::string& detail)
        : OwnershipError("Blame unavailable: " + detail), detail_(detail) {}

    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

// Caller misuse: conflicting query options, out-of-range values
class InvalidArgumentError : public OwnershipError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : OwnershipError("Invalid argument: " + message) {}
};

// The supplied path is neither an existing file nor a directory
class InvalidPathError : public OwnershipError {
public:
    explicit InvalidPathError(const std::string& message)
        : OwnershipError("Invalid path: " + message) {}
};
