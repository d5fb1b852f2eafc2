#pragma once

#include <string>
#include <vector>

namespace urhwid {

// Lists identifiers of attached accelerators through an external tool
class AcceleratorLister {
public:
    virtual ~AcceleratorLister() = default;

    // Lower-cased identifiers, unordered; empty when the tool is unavailable
    virtual std::vector<std::string> list_identifiers() = 0;
};

class NvidiaSmiLister : public AcceleratorLister {
public:
    static constexpr const char* DEFAULT_COMMAND = "nvidia-smi -L";

    explicit NvidiaSmiLister(const std::string& command = DEFAULT_COMMAND, bool verbose = false);

    std::vector<std::string> list_identifiers() override;

    // Extracts "UUID: GPU-..." entries from an `nvidia-smi -L` listing
    static std::vector<std::string> parse_listing(const std::string& output);

private:
    std::string command_;
    bool verbose_;

    bool execute_command(const std::string& command, std::string& output);
    void log(const std::string& message) const;
};

} // namespace urhwid
