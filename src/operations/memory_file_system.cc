#include "memory_file_system.hpp"

#include <fmt/format.h>

using namespace mender;

namespace fs = std::filesystem;

namespace {
fs::path
key(const fs::path& path) {
    return path.lexically_normal();
}
}  // namespace

void
MemoryFileSystem::add_file(const fs::path& path, const std::string& content, bool readonly) {
    files[key(path)] = content;
    if (readonly) {
        readonly_files.insert(key(path));
    } else {
        readonly_files.erase(key(path));
    }
}

bool
MemoryFileSystem::exists(const fs::path& path) const {
    return files.contains(key(path));
}

bool
MemoryFileSystem::is_readonly(const fs::path& path) const {
    return exists(path) && readonly_files.contains(key(path));
}

bool
MemoryFileSystem::read_file(const fs::path& path, std::string& content, std::string& error) const {
    auto it = files.find(key(path));
    if (it == files.end()) {
        error = fmt::format("Failed to read file '{}': no such file", path.string());
        return false;
    }
    content = it->second;
    return true;
}

bool
MemoryFileSystem::write_file(const fs::path& path, const std::string& content, std::string& error) {
    if (is_readonly(path)) {
        error = fmt::format("Failed to write file '{}': permission denied", path.string());
        return false;
    }
    files[key(path)] = content;
    write_count++;
    return true;
}

bool
MemoryFileSystem::create_parent_directories(const fs::path&, std::string&) {
    return true;
}

bool
MemoryFileSystem::rename(const fs::path& from, const fs::path& to, std::string& error) {
    auto it = files.find(key(from));
    if (it == files.end()) {
        error = fmt::format("Failed to move file from '{}' to '{}': no such file", from.string(), to.string());
        return false;
    }
    auto content = std::move(it->second);
    files.erase(it);
    files[key(to)] = std::move(content);
    if (readonly_files.erase(key(from)) > 0) {
        readonly_files.insert(key(to));
    }
    write_count++;
    return true;
}

bool
MemoryFileSystem::remove(const fs::path& path, std::string& error) {
    if (files.erase(key(path)) == 0) {
        error = fmt::format("Failed to remove file '{}': no such file", path.string());
        return false;
    }
    readonly_files.erase(key(path));
    write_count++;
    return true;
}
