#include "board_identity.hpp"
#include "hwid_types.hpp"

#include <iostream>

namespace urhwid {

BoardIdentity::BoardIdentity(const SystemReader& reader, bool verbose)
    : reader_(reader), verbose_(verbose) {
}

std::string BoardIdentity::collect() const {
    std::string board = HwidTypeUtils::normalize_value(reader_.read_first_line(BOARD_NAME_PATH));
    if (!board.empty()) {
        log("Board name: " + board);
        return board;
    }

    // WSL kernels expose no DMI table
    if (is_wsl()) {
        log("DMI board_name unavailable, WSL detected");
        return WSL_VALUE;
    }

    log("DMI board_name unavailable");
    return "";
}

bool BoardIdentity::is_wsl() const {
    if (!reader_.get_env("WSL_DISTRO_NAME").empty() || !reader_.get_env("WSL_INTEROP").empty()) {
        return true;
    }

    std::string osrelease = HwidTypeUtils::to_lower(reader_.read_first_line(OSRELEASE_PATH));
    return osrelease.find("microsoft") != std::string::npos;
}

void BoardIdentity::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[BoardIdentity] " << message << std::endl;
    }
}

} // namespace urhwid
