#include "license_request.hpp"
#include "hardware_fingerprint.hpp"

#include <algorithm>
#include <ctime>
#include <sys/utsname.h>

namespace urhwid {

// EnvironmentInfo implementation
nlohmann::ordered_json EnvironmentInfo::to_json() const {
    nlohmann::ordered_json j;
    j["uname"] = uname;
    j["in_docker_hint"] = in_docker_hint;
    if (gpu_count) {
        j["gpu_count"] = *gpu_count;
    }
    return j;
}

EnvironmentInfo EnvironmentInfo::from_json(const nlohmann::json& j) {
    EnvironmentInfo env;
    env.uname = j.value("uname", "");
    env.in_docker_hint = j.value("in_docker_hint", false);
    if (j.contains("gpu_count") && j["gpu_count"].is_number_integer()) {
        env.gpu_count = j["gpu_count"].get<int>();
    }
    return env;
}

EnvironmentInfo EnvironmentInfo::detect(const SystemReader& reader, const CollectionResult& collection) {
    EnvironmentInfo env;

    struct utsname uts;
    if (::uname(&uts) == 0) {
        env.uname = std::string(uts.sysname) + " " + uts.release;
    }

    env.in_docker_hint = reader.exists(LicenseRequestBuilder::DOCKER_MARKER_PATH);

    if (collection.accelerator_probed) {
        env.gpu_count = static_cast<int>(collection.accelerator.gpu_uuids.size());
    }
    return env;
}

// LicenseRequest implementation
nlohmann::ordered_json LicenseRequest::to_json() const {
    nlohmann::ordered_json j;
    j["version"] = version;
    j["timestamp"] = timestamp;
    j["customer"] = customer;
    j["features"] = features;
    j["hwid_components"] = hwid_components;
    j["hwid_sha256"] = hwid_sha256;
    j["env"] = env.to_json();
    return j;
}

LicenseRequest LicenseRequest::from_json(const nlohmann::json& j) {
    LicenseRequest req;
    req.version = j.value("version", URHWID_REQUEST_VERSION);
    req.timestamp = j.value("timestamp", static_cast<int64_t>(0));
    req.customer = j.value("customer", "");
    req.features = j.value("features", std::vector<std::string>{});
    req.hwid_components = j.value("hwid_components", std::vector<std::string>{});
    req.hwid_sha256 = j.value("hwid_sha256", "");
    if (j.contains("env") && j["env"].is_object()) {
        req.env = EnvironmentInfo::from_json(j["env"]);
    }
    return req;
}

// LicenseRequestBuilder implementation
LicenseRequest LicenseRequestBuilder::build(const ComponentSet& components,
                                            const std::vector<std::string>& features,
                                            const std::string& customer,
                                            const EnvironmentInfo& env) {
    LicenseRequest req;
    req.timestamp = current_unix_timestamp();
    req.customer = customer;
    req.features = normalize_features(features);
    req.hwid_components = HardwareFingerprint::canonicalize(components.tokens());
    req.hwid_sha256 = HardwareFingerprint::generate_from_components(req.hwid_components);
    req.env = env;
    return req;
}

std::vector<std::string> LicenseRequestBuilder::normalize_features(std::vector<std::string> features) {
    std::stable_sort(features.begin(), features.end());
    return features;
}

std::string LicenseRequestBuilder::default_output_name(const std::string& hwid) {
    return std::string(OUTPUT_PREFIX) + hwid.substr(0, OUTPUT_HWID_CHARS) + ".json";
}

int64_t LicenseRequestBuilder::current_unix_timestamp() {
    return static_cast<int64_t>(std::time(nullptr));
}

} // namespace urhwid
