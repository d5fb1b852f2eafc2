#pragma once

#include <string>
#include <vector>
#include <memory>
#include "system_reader.hpp"
#include "accelerator_lister.hpp"

namespace urhwid {

enum class ProbeStatus {
    Found,
    NotApplicable,
    Error
};

struct ProbeResult {
    ProbeStatus status = ProbeStatus::NotApplicable;
    std::vector<std::string> gpu_uuids;
    std::string storage_cid;
    std::string detail;

    static ProbeResult not_applicable(const std::string& detail) {
        ProbeResult r;
        r.status = ProbeStatus::NotApplicable;
        r.detail = detail;
        return r;
    }

    static ProbeResult error(const std::string& detail) {
        ProbeResult r;
        r.status = ProbeStatus::Error;
        r.detail = detail;
        return r;
    }
};

// One source of accelerator/storage identity in the discovery chain
class AcceleratorProvider {
public:
    virtual ~AcceleratorProvider() = default;

    virtual std::string name() const = 0;
    virtual ProbeResult probe() = 0;
};

// /proc/driver/nvidia/gpus/<bus-id>/information
class DriverDirectoryProvider : public AcceleratorProvider {
public:
    static constexpr const char* GPUS_PATH = "/proc/driver/nvidia/gpus";

    explicit DriverDirectoryProvider(const SystemReader& reader);

    std::string name() const override { return "driver-directory"; }
    ProbeResult probe() override;

private:
    const SystemReader& reader_;
};

class DiagnosticCommandProvider : public AcceleratorProvider {
public:
    explicit DiagnosticCommandProvider(AcceleratorLister& lister);

    std::string name() const override { return "diagnostic-command"; }
    ProbeResult probe() override;

private:
    AcceleratorLister& lister_;
};

// eMMC CID of Tegra-class boards, which have no GPU UUID interface
class EmbeddedStorageProvider : public AcceleratorProvider {
public:
    static constexpr const char* DT_COMPATIBLE_PATH = "/proc/device-tree/compatible";
    static constexpr const char* DT_COMPATIBLE_FALLBACK_PATH = "/sys/firmware/devicetree/base/compatible";
    static constexpr const char* BLOCK_PATH = "/sys/block";
    static constexpr const char* TEGRA_COMPATIBLE = "nvidia,tegra";

    explicit EmbeddedStorageProvider(const SystemReader& reader);

    std::string name() const override { return "embedded-storage"; }
    ProbeResult probe() override;

    bool is_tegra() const;

private:
    const SystemReader& reader_;
};

struct AcceleratorInfo {
    std::string source;                  // provider name, empty when nothing found
    std::vector<std::string> gpu_uuids;  // unique, sorted
    std::string storage_cid;

    bool found() const { return !gpu_uuids.empty() || !storage_cid.empty(); }

    // Value of the gpu component: UUIDs joined by ';' or the CID alone
    std::string token_value() const;
};

class AcceleratorIdentity {
public:
    explicit AcceleratorIdentity(bool verbose = false);

    // Driver directory, then diagnostic command, then (optionally) eMMC CID
    static AcceleratorIdentity with_default_chain(const SystemReader& reader,
                                                  AcceleratorLister& lister,
                                                  bool include_embedded_storage,
                                                  bool verbose = false);

    void add_provider(std::unique_ptr<AcceleratorProvider> provider);

    // Runs the chain and stops at the first provider that reports Found
    AcceleratorInfo collect();

    size_t provider_count() const { return providers_.size(); }

private:
    bool verbose_;
    std::vector<std::unique_ptr<AcceleratorProvider>> providers_;

    void log(const std::string& message) const;
};

} // namespace urhwid
