#pragma once

#include "operations/file_system.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace mender {

// Files held in memory, keyed by their normalized path. Directories are
// implicit.
class MemoryFileSystem : public FileSystem {
   public:
    std::map<std::filesystem::path, std::string> files;
    std::set<std::filesystem::path> readonly_files;

    // Number of mutating calls that succeeded.
    int write_count = 0;

    void
    add_file(const std::filesystem::path& path, const std::string& content, bool readonly = false);

    bool
    exists(const std::filesystem::path& path) const override;

    bool
    is_readonly(const std::filesystem::path& path) const override;

    bool
    read_file(const std::filesystem::path& path, std::string& content, std::string& error) const override;

    bool
    write_file(const std::filesystem::path& path, const std::string& content, std::string& error) override;

    bool
    create_parent_directories(const std::filesystem::path& path, std::string& error) override;

    bool
    rename(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error) override;

    bool
    remove(const std::filesystem::path& path, std::string& error) override;
};

}  // namespace mender
