#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hwid_collector.hpp"
#include "system_reader.hpp"

#ifndef URHWID_REQUEST_VERSION
#define URHWID_REQUEST_VERSION 1
#endif

namespace urhwid {

// Descriptive only, never part of the hash
struct EnvironmentInfo {
    std::string uname;
    bool in_docker_hint = false;
    std::optional<int> gpu_count;

    nlohmann::ordered_json to_json() const;
    static EnvironmentInfo from_json(const nlohmann::json& j);

    static EnvironmentInfo detect(const SystemReader& reader, const CollectionResult& collection);
};

struct LicenseRequest {
    int version = URHWID_REQUEST_VERSION;
    int64_t timestamp = 0;
    std::string customer;
    std::vector<std::string> features;
    std::vector<std::string> hwid_components;
    std::string hwid_sha256;
    EnvironmentInfo env;

    nlohmann::ordered_json to_json() const;
    static LicenseRequest from_json(const nlohmann::json& j);
};

class LicenseRequestBuilder {
public:
    static constexpr const char* DOCKER_MARKER_PATH = "/.dockerenv";
    static constexpr const char* OUTPUT_PREFIX = "license_request-";
    static constexpr size_t OUTPUT_HWID_CHARS = 12;

    static LicenseRequest build(const ComponentSet& components,
                                const std::vector<std::string>& features,
                                const std::string& customer,
                                const EnvironmentInfo& env);

    // Stable sort, duplicates kept
    static std::vector<std::string> normalize_features(std::vector<std::string> features);

    // license_request-<first 12 hex chars>.json
    static std::string default_output_name(const std::string& hwid);

    static int64_t current_unix_timestamp();
};

} // namespace urhwid
