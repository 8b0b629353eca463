#pragma once

/*
    Everything mender does to the disk goes through a FileSystem.

    The const half is all preflight is allowed to see; the applicator gets
    the full interface. Failures are reported as `false` with a message in
    `error`.
*/

#include <filesystem>
#include <string>

namespace mender {

class FileSystem {
   public:
    virtual ~FileSystem() = default;

    virtual bool
    exists(const std::filesystem::path& path) const = 0;

    // True if the file exists and may not be written to.
    virtual bool
    is_readonly(const std::filesystem::path& path) const = 0;

    virtual bool
    read_file(const std::filesystem::path& path, std::string& content, std::string& error) const = 0;

    // Replace the whole content of `path`, creating the file if needed.
    virtual bool
    write_file(const std::filesystem::path& path, const std::string& content, std::string& error) = 0;

    virtual bool
    create_parent_directories(const std::filesystem::path& path, std::string& error) = 0;

    virtual bool
    rename(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error) = 0;

    virtual bool
    remove(const std::filesystem::path& path, std::string& error) = 0;
};

// The real disk.
class LocalFileSystem : public FileSystem {
   public:
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
