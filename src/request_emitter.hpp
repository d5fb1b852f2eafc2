#pragma once

#include <ostream>
#include <string>
#include "license_request.hpp"

namespace urhwid {

class RequestEmitter {
public:
    explicit RequestEmitter(bool verbose = false);

    // Compact JSON, UTF-8 kept as is, invalid bytes replaced
    static std::string serialize(const LicenseRequest& request);

    bool write(const LicenseRequest& request, const std::string& output_path) const;

    // Two lines: "wrote <path>" and "HWID: <hash>"
    static void print_summary(std::ostream& out, const std::string& output_path, const std::string& hwid);

private:
    bool verbose_;

    void log(const std::string& message) const;
};

} // namespace urhwid
