#include "file_system.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

using namespace mender;

namespace fs = std::filesystem;

bool
LocalFileSystem::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool
LocalFileSystem::is_readonly(const fs::path& path) const {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return false;
    }
    return (status.permissions() & fs::perms::owner_write) == fs::perms::none;
}

bool
LocalFileSystem::read_file(const fs::path& path, std::string& content, std::string& error) const {
    return readfile(path.string(), content, error);
}

bool
LocalFileSystem::write_file(const fs::path& path, const std::string& content, std::string& error) {
    FILE* f = fopen(path.string().c_str(), "wb");
    if (f == nullptr) {
        error = fmt::format("Failed to write file '{}': {}", path.string(), strerror(errno));
        return false;
    }

    bool ok = fwrite(content.data(), 1, content.size(), f) == content.size();
    if (fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        error = fmt::format("Failed to write file '{}'", path.string());
    }
    return ok;
}

bool
LocalFileSystem::create_parent_directories(const fs::path& path, std::string& error) {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return true;
    }

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        error = fmt::format("Failed to create directory '{}': {}", parent.string(), ec.message());
        return false;
    }
    return true;
}

bool
LocalFileSystem::rename(const fs::path& from, const fs::path& to, std::string& error) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        error = fmt::format("Failed to move file from '{}' to '{}': {}", from.string(), to.string(), ec.message());
        return false;
    }
    return true;
}

bool
LocalFileSystem::remove(const fs::path& path, std::string& error) {
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        error = fmt::format("Failed to remove file '{}': {}", path.string(),
                            ec ? ec.message() : std::string("no such file"));
        return false;
    }
    return true;
}
