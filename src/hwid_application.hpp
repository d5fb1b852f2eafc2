#pragma once

#include <ostream>
#include <string>
#include "collector_config.hpp"
#include "system_reader.hpp"
#include "accelerator_lister.hpp"

namespace urhwid {

struct RunOptions {
    CollectorConfig config;
    std::string output_path;   // empty: derived from the HWID
    bool verbose = false;
};

class HwidApplication {
public:
    explicit HwidApplication(const RunOptions& options);

    // Uses the live system under config.system_root and the configured diagnostic command
    int run(std::ostream& out, std::ostream& err);

    // Returns 0, EXIT_MISSING_IDENTITY, or 1 on any other failure
    int run(const SystemReader& reader, AcceleratorLister& lister, std::ostream& out, std::ostream& err);

    // Missing file keeps the defaults; unreadable or invalid JSON returns false
    static bool load_config(const std::string& config_path, CollectorConfig& config, bool verbose);

private:
    RunOptions options_;

    void log(const std::string& message) const;
};

} // namespace urhwid
