#pragma once

#include <string>
#include "system_reader.hpp"

namespace urhwid {

class BoardIdentity {
public:
    static constexpr const char* BOARD_NAME_PATH = "/sys/class/dmi/id/board_name";
    static constexpr const char* OSRELEASE_PATH = "/proc/sys/kernel/osrelease";
    static constexpr const char* WSL_VALUE = "wsl";

    explicit BoardIdentity(const SystemReader& reader, bool verbose = false);

    // Normalized board name, "wsl" under WSL, or empty when absent
    std::string collect() const;

    bool is_wsl() const;

private:
    const SystemReader& reader_;
    bool verbose_;

    void log(const std::string& message) const;
};

} // namespace urhwid
