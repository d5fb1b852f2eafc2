#include "cpu_identity.hpp"
#include "hwid_types.hpp"

#include <iostream>
#include <sstream>

namespace urhwid {

CpuIdentity::CpuIdentity(const SystemReader& reader, bool verbose)
    : reader_(reader), verbose_(verbose) {
}

const std::vector<CpuIdentityStrategy>& CpuIdentity::default_strategies() {
    static const std::vector<CpuIdentityStrategy> strategies = {
        {
            "x86",
            "vendor_id",
            {"cpufamily", "model", "stepping"},
            "flags",
            {"sse2", "sse4_2", "avx", "avx2", "avx512f"}
        },
        {
            "arm",
            "cpuimplementer",
            {"cpuarchitecture", "cpuvariant", "cpupart", "cpurevision"},
            "features",
            {"asimd", "aes", "crc32", "sha1", "sha2", "atomics", "asimdrdm"}
        }
    };
    return strategies;
}

std::optional<CpuInfo> CpuIdentity::collect() const {
    std::string text = reader_.read_all(CPUINFO_PATH);
    if (text.empty()) {
        log("Unable to read " + std::string(CPUINFO_PATH));
        return std::nullopt;
    }

    auto info = parse(text);
    if (info) {
        log("Matched " + info->strategy + " profile: " + info->vendor + " " + info->signature);
    } else {
        log("No CPU identity profile matched");
    }
    return info;
}

std::map<std::string, std::string> CpuIdentity::parse_first_block(const std::string& cpuinfo_text) {
    std::map<std::string, std::string> fields;
    std::istringstream stream(cpuinfo_text);
    std::string line;

    while (std::getline(stream, line)) {
        if (HwidTypeUtils::trim(line).empty()) {
            break;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }

        std::string key = HwidTypeUtils::normalize_value(line.substr(0, colon_pos));
        std::string value = HwidTypeUtils::to_lower(HwidTypeUtils::trim(line.substr(colon_pos + 1)));
        fields[key] = value;
    }

    return fields;
}

std::optional<CpuInfo> CpuIdentity::parse(const std::string& cpuinfo_text,
                                          const std::vector<CpuIdentityStrategy>& strategies) {
    auto fields = parse_first_block(cpuinfo_text);
    if (fields.empty()) {
        return std::nullopt;
    }

    for (const auto& strategy : strategies) {
        auto info = apply_strategy(strategy, fields);
        if (info) {
            return info;
        }
    }
    return std::nullopt;
}

std::optional<CpuInfo> CpuIdentity::apply_strategy(const CpuIdentityStrategy& strategy,
                                                   const std::map<std::string, std::string>& fields) {
    auto field = [&fields](const std::string& key) {
        auto it = fields.find(key);
        return it != fields.end() ? HwidTypeUtils::normalize_value(it->second) : std::string();
    };

    CpuInfo info;
    info.strategy = strategy.name;
    info.vendor = field(strategy.vendor_key);
    if (info.vendor.empty()) {
        return std::nullopt;
    }

    for (const auto& key : strategy.signature_keys) {
        std::string part = field(key);
        if (part.empty()) {
            return std::nullopt;
        }
        if (!info.signature.empty()) {
            info.signature += "-";
        }
        info.signature += part;
    }

    // std::set keeps the retained flags unique and sorted
    std::set<std::string> present;
    auto flags_it = fields.find(strategy.flags_key);
    if (flags_it != fields.end()) {
        std::istringstream flags(flags_it->second);
        std::string flag;
        while (flags >> flag) {
            if (strategy.isa_allow_list.count(flag)) {
                present.insert(flag);
            }
        }
    }

    for (const auto& flag : present) {
        if (!info.isa.empty()) {
            info.isa += ",";
        }
        info.isa += flag;
    }

    return info;
}

void CpuIdentity::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[CpuIdentity] " << message << std::endl;
    }
}

} // namespace urhwid
