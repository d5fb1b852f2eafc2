#include "system_reader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace urhwid {

SystemReader::SystemReader(const std::string& root)
    : root_(root.empty() ? std::filesystem::path("/") : std::filesystem::path(root)),
      env_overridden_(false) {
}

std::filesystem::path SystemReader::resolve(const std::string& path) const {
    std::filesystem::path p(path);
    return root_ / p.relative_path();
}

std::string SystemReader::read_first_line(const std::string& path) const {
    std::ifstream file(resolve(path));
    if (!file.is_open()) {
        return "";
    }

    std::string line;
    if (!std::getline(file, line)) {
        return "";
    }
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    return line;
}

std::string SystemReader::read_all(const std::string& path) const {
    std::ifstream file(resolve(path), std::ios::binary);
    if (!file.is_open()) {
        return "";
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> SystemReader::list_directory(const std::string& path) const {
    std::vector<std::string> entries;
    std::error_code ec;
    std::filesystem::directory_iterator it(resolve(path), ec);
    if (ec) {
        return entries;
    }

    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(it->path().filename().string());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

bool SystemReader::exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::exists(resolve(path), ec);
}

bool SystemReader::is_directory(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_directory(resolve(path), ec);
}

std::string SystemReader::read_link(const std::string& path) const {
    std::error_code ec;
    auto full = resolve(path);
    if (!std::filesystem::is_symlink(std::filesystem::symlink_status(full, ec))) {
        return "";
    }
    auto target = std::filesystem::read_symlink(full, ec);
    if (ec) {
        return "";
    }
    return target.string();
}

std::string SystemReader::get_env(const std::string& name) const {
    if (env_overridden_) {
        auto it = env_overrides_.find(name);
        return it != env_overrides_.end() ? it->second : "";
    }

    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : "";
}

void SystemReader::set_env_override(const std::string& name, const std::string& value) {
    // Once any override is set the process environment is no longer consulted
    env_overridden_ = true;
    env_overrides_[name] = value;
}

} // namespace urhwid
