#include "random.hpp"
#include "sodium.hpp"
#include <sodium.h>

namespace shaderchain::crypto {

bytes Random::generate(size_t size) {
    ensure_sodium_initialized();
    bytes result(size);
    randombytes_buf(result.data(), size);
    return result;
}

std::string Random::generate_hex(size_t size) {
    auto data = generate(size);
    return bytes_to_hex(data.data(), data.size());
}

} // namespace shaderchain::crypto
