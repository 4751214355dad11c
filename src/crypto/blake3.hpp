#pragma once

#include "shaderchain/common.hpp"
#include <optional>

namespace shaderchain::crypto {

/**
 * BLAKE3 cryptographic hash function wrapper
 *
 * Used server-side only: keyed mode authenticates access tokens.
 */
class Blake3 {
public:
    /**
     * Keyed hash (MAC) of a message
     * @param key 32-byte key
     * @param message Data to authenticate
     */
    static Hash256 keyed_hash(const Hash256& key, const std::string& message);

    /**
     * Derive a 32-byte key from an arbitrary-length secret
     */
    static Hash256 derive_key(const std::string& secret);

    /**
     * Convert hash to hex string
     */
    static std::string hash_to_hex(const Hash256& hash);

    /**
     * Parse hash from hex string
     */
    static std::optional<Hash256> hash_from_hex(const std::string& hex);
};

} // namespace shaderchain::crypto
