#include "hwid_application.hpp"
#include "hwid_collector.hpp"
#include "license_request.hpp"
#include "request_emitter.hpp"

#include <fstream>
#include <iostream>

namespace urhwid {

HwidApplication::HwidApplication(const RunOptions& options)
    : options_(options) {
}

int HwidApplication::run(std::ostream& out, std::ostream& err) {
    SystemReader reader(options_.config.system_root);
    NvidiaSmiLister lister(options_.config.diagnostic_command, options_.verbose);
    return run(reader, lister, out, err);
}

int HwidApplication::run(const SystemReader& reader, AcceleratorLister& lister,
                         std::ostream& out, std::ostream& err) {
    try {
        IdentityProfile profile = HwidTypeUtils::string_to_identity_profile(options_.config.profile);
        log("System root: " + reader.root().string());

        HwidCollector collector(reader, lister, options_.verbose);
        CollectionResult collection = collector.collect(profile);

        EnvironmentInfo env = EnvironmentInfo::detect(reader, collection);
        LicenseRequest request = LicenseRequestBuilder::build(collection.components,
                                                              options_.config.features,
                                                              options_.config.customer,
                                                              env);

        std::string output_path = options_.output_path.empty()
            ? LicenseRequestBuilder::default_output_name(request.hwid_sha256)
            : options_.output_path;
        log("HWID " + request.hwid_sha256 + " from " +
            std::to_string(request.hwid_components.size()) + " component(s)");

        RequestEmitter emitter(options_.verbose);
        if (!emitter.write(request, output_path)) {
            return 1;
        }

        RequestEmitter::print_summary(out, output_path, request.hwid_sha256);
        return 0;

    } catch (const MissingIdentityError& e) {
        err << "ERROR: " << e.what() << std::endl;
        return e.exit_code();
    } catch (const std::exception& e) {
        err << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}

bool HwidApplication::load_config(const std::string& config_path, CollectorConfig& config, bool verbose) {
    std::ifstream file(config_path);
    if (!file.good()) {
        if (verbose) {
            std::cerr << "[HwidApplication] Config file not found, using defaults" << std::endl;
        }
        return true;
    }

    try {
        nlohmann::json j;
        file >> j;
        config = CollectorConfig::from_json(j);
        if (verbose) {
            std::cerr << "[HwidApplication] Loaded config from: " << config_path << std::endl;
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "ERROR: invalid config " << config_path << ": " << e.what() << std::endl;
        return false;
    }
}

void HwidApplication::log(const std::string& message) const {
    if (options_.verbose) {
        std::cerr << "[HwidApplication] " << message << std::endl;
    }
}

} // namespace urhwid
