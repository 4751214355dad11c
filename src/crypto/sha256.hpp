#pragma once

#include "shaderchain/common.hpp"
#include <string>

namespace shaderchain::crypto {

/**
 * SHA-256 wrapper over libsodium
 *
 * Every hash that crosses the client/server boundary (shader outputs,
 * link hashes, seeds, work results) is a lower-case hex SHA-256 digest.
 */
class Sha256 {
public:
    static Hash256 hash(const bytes& data);
    static Hash256 hash(const std::string& str);
    static Hash256 hash(const void* data, size_t len);

    /**
     * Hash a string and return the 64-character hex digest
     */
    static std::string hex(const std::string& str);
    static std::string hex(const void* data, size_t len);
};

} // namespace shaderchain::crypto
