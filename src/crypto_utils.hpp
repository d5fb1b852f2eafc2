#pragma once

#include <string>
#include <vector>

namespace urhwid {

class CryptoUtils {
public:
    // Lowercase hex SHA-256 digest; throws std::runtime_error if OpenSSL fails
    static std::string sha256(const std::string& data);

    static std::string bytes_to_hex(const std::vector<unsigned char>& bytes);
};

} // namespace urhwid
