#pragma once

#include <string>
#include <vector>
#include <map>
#include "hwid_types.hpp"

namespace urhwid {

// Present components of one run, at most one value per label
class ComponentSet {
public:
    // Empty values are soft-absent and ignored; returns whether a token was added.
    // A second value for the same label throws std::logic_error.
    bool add(ComponentLabel label, const std::string& value);

    bool contains(ComponentLabel label) const;
    std::string get(ComponentLabel label) const;
    size_t size() const { return values_.size(); }

    // "label:value" tokens in label order (not canonical)
    std::vector<std::string> tokens() const;

private:
    std::map<ComponentLabel, std::string> values_;
};

class HardwareFingerprint {
public:
    // Lexicographic byte-wise sort; the only ordering the hash depends on
    static std::vector<std::string> canonicalize(std::vector<std::string> tokens);

    // SHA-256 hex of the canonical tokens joined with '\n'
    static std::string generate_from_components(const std::vector<std::string>& tokens);
    static std::string generate_from_components(const ComponentSet& components);

    static std::string make_token(ComponentLabel label, const std::string& value);
};

} // namespace urhwid
