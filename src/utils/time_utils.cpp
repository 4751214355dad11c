#include "shaderchain/time_utils.hpp"
#include <limits>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace shaderchain {
namespace time {

uint64_t timestamp_milliseconds() {
    return std::chrono::duration_cast<Milliseconds>(
        Clock::now().time_since_epoch()
    ).count();
}

uint64_t deadline_after(uint64_t now_ms, uint64_t ttl_ms) {
    if (ttl_ms > std::numeric_limits<uint64_t>::max() - now_ms) {
        return std::numeric_limits<uint64_t>::max();
    }
    return now_ms + ttl_ms;
}

uint64_t elapsed_between(uint64_t since_ms, uint64_t now_ms) {
    return now_ms > since_ms ? now_ms - since_ms : 0;
}

std::string format_timestamp_ms(uint64_t timestamp_ms) {
    TimePoint tp(std::chrono::duration_cast<Clock::duration>(Milliseconds(timestamp_ms)));
    auto time_t_val = Clock::to_time_t(tp);
    std::tm tm_val;

#ifdef SHADERCHAIN_PLATFORM_WINDOWS
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << (timestamp_ms % 1000) << 'Z';
    return oss.str();
}

} // namespace time
} // namespace shaderchain
