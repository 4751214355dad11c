#pragma once

#include "shaderchain/common.hpp"
#include <chrono>
#include <string>

namespace shaderchain {
namespace time {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

// Protocol clock: Unix time in milliseconds. Every expiry in the
// protocol (challenges, tokens, sessions) is measured against it.
uint64_t timestamp_milliseconds();

// Deadline ttl_ms after now_ms, saturating instead of wrapping
uint64_t deadline_after(uint64_t now_ms, uint64_t ttl_ms);

// Milliseconds elapsed from since_ms to now_ms, zero if the clock went back
uint64_t elapsed_between(uint64_t since_ms, uint64_t now_ms);

// Render a millisecond timestamp as ISO 8601 (UTC)
std::string format_timestamp_ms(uint64_t timestamp_ms);

// Monotonic stopwatch for solver and proof-of-work timing
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    uint64_t elapsed_milliseconds() const {
        return std::chrono::duration_cast<Milliseconds>(
            std::chrono::steady_clock::now() - start_
        ).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace time
} // namespace shaderchain
