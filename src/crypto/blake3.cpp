#include "blake3.hpp"
#include <blake3.h>

namespace shaderchain::crypto {

namespace {
    // Context string for key derivation, fixed for the lifetime of the protocol
    constexpr const char* TOKEN_KEY_CONTEXT = "shaderchain 2026 access token key";
}

Hash256 Blake3::keyed_hash(const Hash256& key, const std::string& message) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init_keyed(&hasher, key.data());
    blake3_hasher_update(&hasher, message.data(), message.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

Hash256 Blake3::derive_key(const std::string& secret) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init_derive_key(&hasher, TOKEN_KEY_CONTEXT);
    blake3_hasher_update(&hasher, secret.data(), secret.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

std::string Blake3::hash_to_hex(const Hash256& hash) {
    return shaderchain::hash_to_hex(hash);
}

std::optional<Hash256> Blake3::hash_from_hex(const std::string& hex) {
    if (!is_hash_hex(hex)) {
        return std::nullopt;
    }
    return hex_to_hash(hex);
}

} // namespace shaderchain::crypto
