#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include "system_reader.hpp"

namespace urhwid {

struct CpuInfo {
    std::string strategy;   // name of the strategy that matched
    std::string vendor;
    std::string signature;
    std::string isa;        // may be empty
};

// One architecture profile for reading the first processor block.
// Keys are given in normalized form (whitespace removed, lower-case).
struct CpuIdentityStrategy {
    std::string name;
    std::string vendor_key;
    std::vector<std::string> signature_keys;
    std::string flags_key;
    std::set<std::string> isa_allow_list;
};

class CpuIdentity {
public:
    static constexpr const char* CPUINFO_PATH = "/proc/cpuinfo";

    explicit CpuIdentity(const SystemReader& reader, bool verbose = false);

    // Reads /proc/cpuinfo and applies the default strategies
    std::optional<CpuInfo> collect() const;

    // Strategies are tried in order, first fully satisfied one wins
    static const std::vector<CpuIdentityStrategy>& default_strategies();

    static std::optional<CpuInfo> parse(const std::string& cpuinfo_text,
                                        const std::vector<CpuIdentityStrategy>& strategies = default_strategies());

    // Key/value pairs of the first processor block (up to the first blank line)
    static std::map<std::string, std::string> parse_first_block(const std::string& cpuinfo_text);

private:
    const SystemReader& reader_;
    bool verbose_;

    static std::optional<CpuInfo> apply_strategy(const CpuIdentityStrategy& strategy,
                                                 const std::map<std::string, std::string>& fields);
    void log(const std::string& message) const;
};

} // namespace urhwid
