#include "infrastructure/Sha256.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

namespace shipwright::infrastructure {

std::string Sha256::HexDigest(const std::string& input) {
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int resultLen = 0;

    if (EVP_Digest(reinterpret_cast<const unsigned char*>(input.data()), input.size(),
                   result, &resultLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < resultLen; ++i) {
        out << std::setw(2) << static_cast<unsigned>(result[i]);
    }
    return out.str();
}

} // namespace shipwright::infrastructure
