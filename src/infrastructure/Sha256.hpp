// Sha256 Header
#pragma once
#include <string>

namespace shipwright::infrastructure {

class Sha256 {
public:
    /**
     * @brief Lowercase hex SHA-256 of the input bytes.
     * @throws std::runtime_error if the digest cannot be computed.
     */
    static std::string HexDigest(const std::string& input);
};

} // namespace shipwright::infrastructure
