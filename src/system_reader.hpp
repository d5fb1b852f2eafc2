#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>

namespace urhwid {

// Read-only view of the platform files. Every path is interpreted relative
// to root_, so a fixture tree can stand in for a live system. All accessors
// swallow I/O errors and report "absent" (empty string / empty list / false).
class SystemReader {
public:
    explicit SystemReader(const std::string& root = "/");

    std::string read_first_line(const std::string& path) const;
    std::string read_all(const std::string& path) const;

    // Entry names, sorted
    std::vector<std::string> list_directory(const std::string& path) const;

    bool exists(const std::string& path) const;
    bool is_directory(const std::string& path) const;

    // Raw symlink target text, empty if path is not a symlink
    std::string read_link(const std::string& path) const;

    std::string get_env(const std::string& name) const;
    void set_env_override(const std::string& name, const std::string& value);

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::map<std::string, std::string> env_overrides_;
    bool env_overridden_;

    std::filesystem::path resolve(const std::string& path) const;
};

} // namespace urhwid
