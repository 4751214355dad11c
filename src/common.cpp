#include "shaderchain/common.hpp"
#include <stdexcept>
#include <sodium.h>

namespace shaderchain {

// Utility functions
std::string bytes_to_hex(const byte* data, size_t len) {
    std::string hex(len * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data, len);
    hex.resize(len * 2);
    return hex;
}

std::string hash_to_hex(const Hash256& hash) {
    return bytes_to_hex(hash.data(), hash.size());
}

Hash256 hex_to_hash(const std::string& hex) {
    Hash256 hash;
    if (!is_hash_hex(hex) ||
        sodium_hex2bin(hash.data(), hash.size(), hex.data(), hex.size(),
                       nullptr, nullptr, nullptr) != 0) {
        throw std::invalid_argument("Invalid hex hash string");
    }
    return hash;
}

bool is_hash_hex(const std::string& hex) {
    if (hex.length() != constants::HASH_HEX_LENGTH) {
        return false;
    }
    for (char c : hex) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

// Base64 (standard alphabet, padded) through libsodium's codec

std::string base64_encode(const void* data, size_t len) {
    std::string result(sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL), '\0');
    sodium_bin2base64(result.data(), result.size(),
                      static_cast<const unsigned char*>(data), len,
                      sodium_base64_VARIANT_ORIGINAL);
    result.resize(result.size() - 1);
    return result;
}

std::string base64_encode(const bytes& data) {
    return base64_encode(data.data(), data.size());
}

std::optional<bytes> base64_decode(const std::string& encoded) {
    bytes result(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(result.data(), result.size(), encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != encoded.data() + encoded.size()) {
        return std::nullopt;
    }
    result.resize(decoded_len);
    return result;
}

} // namespace shaderchain
