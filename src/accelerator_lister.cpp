#include "accelerator_lister.hpp"
#include "hwid_types.hpp"

#include <cstdio>
#include <iostream>
#include <regex>
#include <sstream>

namespace urhwid {

NvidiaSmiLister::NvidiaSmiLister(const std::string& command, bool verbose)
    : command_(command), verbose_(verbose) {
}

std::vector<std::string> NvidiaSmiLister::list_identifiers() {
    if (command_.empty()) {
        return {};
    }

    std::string output;
    if (!execute_command(command_ + " 2>/dev/null", output)) {
        log("Diagnostic command unavailable: " + command_);
        return {};
    }

    auto uuids = parse_listing(output);
    log("Diagnostic command reported " + std::to_string(uuids.size()) + " GPU(s)");
    return uuids;
}

std::vector<std::string> NvidiaSmiLister::parse_listing(const std::string& output) {
    static const std::regex uuid_pattern(R"(UUID:\s*(GPU-[A-Za-z0-9\-]+))", std::regex::icase);

    std::vector<std::string> uuids;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        std::smatch match;
        if (std::regex_search(line, match, uuid_pattern)) {
            uuids.push_back(HwidTypeUtils::to_lower(match[1].str()));
        }
    }
    return uuids;
}

bool NvidiaSmiLister::execute_command(const std::string& command, std::string& output) {
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return false;
    }

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }

    // Non-zero status covers "command not found" from the shell
    int status = pclose(pipe);
    return status == 0;
}

void NvidiaSmiLister::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[NvidiaSmiLister] " << message << std::endl;
    }
}

} // namespace urhwid
