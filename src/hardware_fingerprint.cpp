#include "hardware_fingerprint.hpp"
#include "crypto_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace urhwid {

bool ComponentSet::add(ComponentLabel label, const std::string& value) {
    if (value.empty()) {
        return false;
    }

    if (values_.count(label)) {
        throw std::logic_error("Duplicate hardware component: " +
                               HwidTypeUtils::component_label_to_string(label));
    }

    values_[label] = value;
    return true;
}

bool ComponentSet::contains(ComponentLabel label) const {
    return values_.count(label) > 0;
}

std::string ComponentSet::get(ComponentLabel label) const {
    auto it = values_.find(label);
    return it != values_.end() ? it->second : "";
}

std::vector<std::string> ComponentSet::tokens() const {
    std::vector<std::string> result;
    for (const auto& [label, value] : values_) {
        result.push_back(HardwareFingerprint::make_token(label, value));
    }
    return result;
}

std::vector<std::string> HardwareFingerprint::canonicalize(std::vector<std::string> tokens) {
    std::sort(tokens.begin(), tokens.end());
    return tokens;
}

std::string HardwareFingerprint::generate_from_components(const std::vector<std::string>& tokens) {
    std::string combined;
    for (const auto& token : canonicalize(tokens)) {
        if (!combined.empty()) {
            combined += "\n";
        }
        combined += token;
    }
    return CryptoUtils::sha256(combined);
}

std::string HardwareFingerprint::generate_from_components(const ComponentSet& components) {
    return generate_from_components(components.tokens());
}

std::string HardwareFingerprint::make_token(ComponentLabel label, const std::string& value) {
    return HwidTypeUtils::component_label_to_string(label) + ":" + value;
}

} // namespace urhwid
