#include "crypto/hash.hpp"

#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace mg::crypto::hash {

std::string sha256Hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    std::ostringstream oss;
    for (const unsigned char c : digest) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

}
