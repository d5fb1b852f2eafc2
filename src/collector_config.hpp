#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "accelerator_lister.hpp"

#ifndef URHWID_DEFAULT_FEATURE
#define URHWID_DEFAULT_FEATURE "AutoDrive"
#endif

namespace urhwid {

struct CollectorConfig {
    std::string profile = "accelerator";
    std::vector<std::string> features = {URHWID_DEFAULT_FEATURE};
    std::string customer;
    std::string system_root = "/";
    std::string diagnostic_command = NvidiaSmiLister::DEFAULT_COMMAND;

    // Absent keys keep their defaults; wrong types throw nlohmann::json::type_error
    static CollectorConfig from_json(const nlohmann::json& j) {
        CollectorConfig config;

        if (j.contains("profile")) config.profile = j["profile"].get<std::string>();
        if (j.contains("features")) config.features = j["features"].get<std::vector<std::string>>();
        if (j.contains("customer")) config.customer = j["customer"].get<std::string>();
        if (j.contains("system_root")) config.system_root = j["system_root"].get<std::string>();
        if (j.contains("diagnostic_command")) config.diagnostic_command = j["diagnostic_command"].get<std::string>();

        return config;
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"profile", profile},
            {"features", features},
            {"customer", customer},
            {"system_root", system_root},
            {"diagnostic_command", diagnostic_command}
        };
    }
};

} // namespace urhwid
