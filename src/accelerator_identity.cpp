#include "accelerator_identity.hpp"
#include "hwid_types.hpp"

#include <iostream>
#include <regex>
#include <set>
#include <sstream>

namespace urhwid {

// DriverDirectoryProvider

DriverDirectoryProvider::DriverDirectoryProvider(const SystemReader& reader)
    : reader_(reader) {
}

ProbeResult DriverDirectoryProvider::probe() {
    if (!reader_.is_directory(GPUS_PATH)) {
        return ProbeResult::not_applicable(std::string(GPUS_PATH) + " not present");
    }

    ProbeResult result;
    for (const auto& device : reader_.list_directory(GPUS_PATH)) {
        std::string info = reader_.read_all(std::string(GPUS_PATH) + "/" + device + "/information");
        std::istringstream stream(info);
        std::string line;
        while (std::getline(stream, line)) {
            std::string lowered = HwidTypeUtils::to_lower(HwidTypeUtils::trim(line));
            if (lowered.find("gpu uuid:") == std::string::npos) {
                continue;
            }
            size_t pos = lowered.find("gpu-");
            if (pos != std::string::npos) {
                result.gpu_uuids.push_back(lowered.substr(pos));
            }
        }
    }

    if (result.gpu_uuids.empty()) {
        return ProbeResult::not_applicable("no GPU UUID in driver directory");
    }
    result.status = ProbeStatus::Found;
    return result;
}

// DiagnosticCommandProvider

DiagnosticCommandProvider::DiagnosticCommandProvider(AcceleratorLister& lister)
    : lister_(lister) {
}

ProbeResult DiagnosticCommandProvider::probe() {
    ProbeResult result;
    result.gpu_uuids = lister_.list_identifiers();
    if (result.gpu_uuids.empty()) {
        return ProbeResult::not_applicable("diagnostic command listed no GPU");
    }
    result.status = ProbeStatus::Found;
    return result;
}

// EmbeddedStorageProvider

EmbeddedStorageProvider::EmbeddedStorageProvider(const SystemReader& reader)
    : reader_(reader) {
}

bool EmbeddedStorageProvider::is_tegra() const {
    // compatible is a NUL separated list, a plain substring search covers every entry
    std::string compatible = reader_.read_all(DT_COMPATIBLE_PATH);
    if (compatible.empty()) {
        compatible = reader_.read_all(DT_COMPATIBLE_FALLBACK_PATH);
    }
    return HwidTypeUtils::to_lower(compatible).find(TEGRA_COMPATIBLE) != std::string::npos;
}

ProbeResult EmbeddedStorageProvider::probe() {
    if (!is_tegra()) {
        return ProbeResult::not_applicable("not a Tegra device");
    }

    static const std::regex emmc_pattern(R"(^mmcblk[0-9]+$)");

    // list_directory is sorted, so the first usable device is the smallest name
    for (const auto& device : reader_.list_directory(BLOCK_PATH)) {
        if (!std::regex_match(device, emmc_pattern)) {
            continue;
        }

        std::string base = std::string(BLOCK_PATH) + "/" + device;
        if (HwidTypeUtils::trim(reader_.read_first_line(base + "/removable")) != "0") {
            continue;
        }

        std::string type = HwidTypeUtils::trim(reader_.read_first_line(base + "/device/type"));
        if (!type.empty() && type != "MMC") {
            continue;
        }

        std::string cid = HwidTypeUtils::normalize_value(reader_.read_first_line(base + "/device/cid"));
        if (cid.empty()) {
            return ProbeResult::error("unable to read CID of " + device);
        }

        ProbeResult result;
        result.status = ProbeStatus::Found;
        result.storage_cid = cid;
        result.detail = device;
        return result;
    }

    return ProbeResult::error("no non-removable eMMC device");
}

// AcceleratorInfo

std::string AcceleratorInfo::token_value() const {
    if (gpu_uuids.empty()) {
        return storage_cid;
    }

    std::string joined;
    for (const auto& uuid : gpu_uuids) {
        if (!joined.empty()) {
            joined += ";";
        }
        joined += uuid;
    }
    return joined;
}

// AcceleratorIdentity

AcceleratorIdentity::AcceleratorIdentity(bool verbose)
    : verbose_(verbose) {
}

AcceleratorIdentity AcceleratorIdentity::with_default_chain(const SystemReader& reader,
                                                            AcceleratorLister& lister,
                                                            bool include_embedded_storage,
                                                            bool verbose) {
    AcceleratorIdentity identity(verbose);
    identity.add_provider(std::make_unique<DriverDirectoryProvider>(reader));
    identity.add_provider(std::make_unique<DiagnosticCommandProvider>(lister));
    if (include_embedded_storage) {
        identity.add_provider(std::make_unique<EmbeddedStorageProvider>(reader));
    }
    return identity;
}

void AcceleratorIdentity::add_provider(std::unique_ptr<AcceleratorProvider> provider) {
    providers_.push_back(std::move(provider));
}

AcceleratorInfo AcceleratorIdentity::collect() {
    AcceleratorInfo info;

    for (auto& provider : providers_) {
        ProbeResult result = provider->probe();

        if (result.status != ProbeStatus::Found) {
            log(provider->name() + (result.status == ProbeStatus::Error ? " failed: " : " not applicable: ")
                + result.detail);
            continue;
        }

        std::set<std::string> unique(result.gpu_uuids.begin(), result.gpu_uuids.end());
        info.gpu_uuids.assign(unique.begin(), unique.end());
        info.storage_cid = result.storage_cid;
        info.source = provider->name();

        log(provider->name() + " found " + info.token_value());
        return info;
    }

    return info;
}

void AcceleratorIdentity::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[AcceleratorIdentity] " << message << std::endl;
    }
}

} // namespace urhwid
