#include "blame_source.hpp"

PathKind BlameSource::classify(const fs::path& path) const {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return PathKind::Missing;
    }
    if (fs::is_directory(status)) {
        return PathKind::Directory;
    }
    if (fs::is_regular_file(status)) {
        return PathKind::File;
    }
    return PathKind::Other;
}
