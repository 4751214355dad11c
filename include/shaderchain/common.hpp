#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// ShaderChain Version
#define SHADERCHAIN_VERSION_MAJOR 1
#define SHADERCHAIN_VERSION_MINOR 0
#define SHADERCHAIN_VERSION_PATCH 0
#define SHADERCHAIN_VERSION_STRING "1.0.0"

// Per-build salt mixed into the version proof shader.
// Override with -DSHADERCHAIN_BUILD_SALT=\"...\" to produce a distinct build.
#ifndef SHADERCHAIN_BUILD_SALT
    #define SHADERCHAIN_BUILD_SALT "shaderchain_v1.0.0_build_2026"
#endif

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef SHADERCHAIN_PLATFORM_WINDOWS
        #define SHADERCHAIN_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef SHADERCHAIN_PLATFORM_LINUX
        #define SHADERCHAIN_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef SHADERCHAIN_PLATFORM_MACOS
        #define SHADERCHAIN_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define SHADERCHAIN_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define SHADERCHAIN_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define SHADERCHAIN_DISALLOW_COPY_AND_MOVE(TypeName) \
    SHADERCHAIN_DISALLOW_COPY(TypeName); \
    SHADERCHAIN_DISALLOW_MOVE(TypeName)

// Constants
namespace shaderchain {
namespace constants {

// Hash constants
constexpr size_t HASH_HEX_LENGTH = 64;
constexpr size_t CHALLENGE_ID_BYTES = 16;

// Genesis sentinel: previous hash of the first link of every chain
inline const std::string GENESIS_HASH(HASH_HEX_LENGTH, '0');

// Protocol timing (milliseconds)
constexpr uint64_t CHALLENGE_TTL_MS = 60 * 1000;            // 1 minute
constexpr uint64_t ACCESS_TOKEN_TTL_MS = 5 * 60 * 1000;     // 5 minutes
constexpr uint64_t RESOURCE_TTL_MS = 60 * 60 * 1000;        // 1 hour
constexpr uint64_t SESSION_IDLE_TIMEOUT_MS = 30 * 60 * 1000; // 30 minutes

// Trust policy
constexpr int32_t INITIAL_TRUST_SCORE = 50;
constexpr int32_t MIN_TRUST_SCORE = 0;
constexpr int32_t MAX_TRUST_SCORE = 100;
constexpr int32_t TRUST_REWARD = 5;
constexpr int32_t TRUST_PENALTY = 20;
constexpr int32_t VERSION_MISMATCH_PENALTY = 30;
constexpr int32_t SHADER_MISMATCH_PENALTY = 50;

// Difficulty policy: difficulty = max(MIN, BASE - trust / STEP)
constexpr uint32_t BASE_DIFFICULTY = 5;
constexpr uint32_t MIN_DIFFICULTY = 1;
constexpr int32_t TRUST_PER_DIFFICULTY_STEP = 20;

} // namespace constants
} // namespace shaderchain

// Core types
namespace shaderchain {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

// Cryptographic types
template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<32>;

// Utility functions
std::string hash_to_hex(const Hash256& hash);
Hash256 hex_to_hash(const std::string& hex);
std::string bytes_to_hex(const byte* data, size_t len);

// True if the string is exactly 64 lower-case hex characters
bool is_hash_hex(const std::string& hex);

// Base64 encoding/decoding
std::string base64_encode(const bytes& data);
std::string base64_encode(const void* data, size_t len);
// nullopt when the input is not valid padded base64
std::optional<bytes> base64_decode(const std::string& encoded);

} // namespace shaderchain
