#pragma once

#include "shaderchain/common.hpp"

namespace shaderchain::crypto {

/**
 * Random number generation (CSPRNG)
 * Cryptographically secure random bytes
 */
class Random {
public:
    /**
     * Generate random bytes
     * @param size Number of bytes to generate
     * @return Random bytes
     */
    static bytes generate(size_t size);

    /**
     * Generate a random token rendered as lower-case hex
     * @param size Number of random bytes (the string is twice as long)
     */
    static std::string generate_hex(size_t size);
};

} // namespace shaderchain::crypto
