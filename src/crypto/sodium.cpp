#include "sodium.hpp"
#include "shaderchain/error.hpp"
#include <sodium.h>

namespace shaderchain::crypto {

namespace {
    struct SodiumInitializer {
        SodiumInitializer() {
            if (sodium_init() < 0) {
                throw CryptoException(ErrorCode::CryptoInitFailed, "Failed to initialize libsodium");
            }
        }
    };
}

void ensure_sodium_initialized() {
    static SodiumInitializer instance;
    (void)instance;
}

} // namespace shaderchain::crypto
