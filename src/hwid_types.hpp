#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace urhwid {

// Exit code reserved for a mandatory identity that could not be determined
constexpr int EXIT_MISSING_IDENTITY = 3;

// Component label enumeration (fixed set)
enum class ComponentLabel {
    Board,
    CpuVendor,
    CpuSignature,
    CpuIsa,
    Gpu,
    MachineId,
    Dmi,
    Filesystem
};

// Identity profile enumeration
enum class IdentityProfile {
    Accelerator,
    Machine,
    Minimal
};

// Raised when a mandatory identity component is absent
class MissingIdentityError : public std::runtime_error {
public:
    explicit MissingIdentityError(const std::string& message)
        : std::runtime_error(message) {}

    int exit_code() const { return EXIT_MISSING_IDENTITY; }
};

class HwidTypeUtils {
public:
    static std::string component_label_to_string(ComponentLabel label) {
        switch (label) {
            case ComponentLabel::Board: return "brd";
            case ComponentLabel::CpuVendor: return "cpuv";
            case ComponentLabel::CpuSignature: return "cpus";
            case ComponentLabel::CpuIsa: return "cpui";
            case ComponentLabel::Gpu: return "gpu";
            case ComponentLabel::MachineId: return "mid";
            case ComponentLabel::Dmi: return "dmi";
            case ComponentLabel::Filesystem: return "fs";
            default: return "brd";
        }
    }

    static std::string identity_profile_to_string(IdentityProfile profile) {
        switch (profile) {
            case IdentityProfile::Accelerator: return "accelerator";
            case IdentityProfile::Machine: return "machine";
            case IdentityProfile::Minimal: return "minimal";
            default: return "accelerator";
        }
    }

    // Unlike the label conversion this one is fed by user input, so it throws
    static IdentityProfile string_to_identity_profile(const std::string& profile_str) {
        if (profile_str == "accelerator") return IdentityProfile::Accelerator;
        if (profile_str == "machine") return IdentityProfile::Machine;
        if (profile_str == "minimal") return IdentityProfile::Minimal;
        throw std::invalid_argument("Unknown identity profile: " + profile_str);
    }

    static std::vector<std::string> identity_profile_names() {
        return {"accelerator", "machine", "minimal"};
    }

    // Strip, drop every whitespace character and lower-case
    static std::string normalize_value(const std::string& raw);

    // Lower-case only
    static std::string to_lower(const std::string& raw);

    // Remove leading/trailing whitespace
    static std::string trim(const std::string& raw);
};

} // namespace urhwid
