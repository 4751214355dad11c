#include "sha256.hpp"
#include "sodium.hpp"
#include <sodium.h>

namespace shaderchain::crypto {

Hash256 Sha256::hash(const void* data, size_t len) {
    ensure_sodium_initialized();
    Hash256 result;
    crypto_hash_sha256(result.data(),
                       static_cast<const unsigned char*>(data),
                       static_cast<unsigned long long>(len));
    return result;
}

Hash256 Sha256::hash(const bytes& data) {
    return hash(data.data(), data.size());
}

Hash256 Sha256::hash(const std::string& str) {
    return hash(str.data(), str.size());
}

std::string Sha256::hex(const std::string& str) {
    return hash_to_hex(hash(str));
}

std::string Sha256::hex(const void* data, size_t len) {
    return hash_to_hex(hash(data, len));
}

} // namespace shaderchain::crypto
