#include "request_emitter.hpp"

#include <fstream>
#include <iostream>

namespace urhwid {

RequestEmitter::RequestEmitter(bool verbose)
    : verbose_(verbose) {
}

std::string RequestEmitter::serialize(const LicenseRequest& request) {
    return request.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool RequestEmitter::write(const LicenseRequest& request, const std::string& output_path) const {
    try {
        log("Writing license request to: " + output_path);

        std::ofstream file(output_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "ERROR: failed to open output file for writing: " << output_path << std::endl;
            return false;
        }

        file << serialize(request);
        file.close();
        if (file.fail()) {
            std::cerr << "ERROR: failed to write output file: " << output_path << std::endl;
            return false;
        }

        log("License request written successfully");
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: writing license request: " << e.what() << std::endl;
        return false;
    }
}

void RequestEmitter::print_summary(std::ostream& out, const std::string& output_path, const std::string& hwid) {
    out << "wrote " << output_path << std::endl;
    out << "HWID: " << hwid << std::endl;
}

void RequestEmitter::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[RequestEmitter] " << message << std::endl;
    }
}

} // namespace urhwid
