#pragma once

namespace shaderchain::crypto {

/**
 * Initialize libsodium once per process.
 * @throws CryptoException if the library cannot be initialized
 */
void ensure_sodium_initialized();

} // namespace shaderchain::crypto
