#pragma once

#include "shaderchain/common.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shaderchain::server {

/**
 * SessionInfo - Bookkeeping for one transport session
 *
 * The session id doubles as the client id of the trust store.
 */
struct SessionInfo {
    std::string id;
    uint64_t created_at = 0;
    uint64_t last_activity = 0;
    uint64_t challenges_completed = 0;
    uint64_t compute_time_ms = 0;
};

/**
 * SessionRegistry - Live sessions keyed by id
 *
 * Thread-safe. Sessions idle longer than the timeout are evicted by
 * cleanup_stale_sessions().
 */
class SessionRegistry {
public:
    explicit SessionRegistry(uint64_t idle_timeout_ms = constants::SESSION_IDLE_TIMEOUT_MS);

    /**
     * Create a session with a fresh random id
     */
    std::string create_session(uint64_t now_ms);

    void remove_session(const std::string& id);

    std::optional<SessionInfo> get_session(const std::string& id) const;

    /**
     * Mark activity; false if the session does not exist
     */
    bool touch(const std::string& id, uint64_t now_ms);

    /**
     * Count one completed challenge and its client compute time
     */
    bool record_challenge(const std::string& id, uint64_t compute_time_ms, uint64_t now_ms);

    /**
     * Remove sessions idle for longer than the timeout
     * @return ids of removed sessions
     */
    std::vector<std::string> cleanup_stale_sessions(uint64_t now_ms);

    size_t size() const;
    uint64_t idle_timeout_ms() const { return idle_timeout_ms_; }

private:
    uint64_t idle_timeout_ms_;
    mutable std::mutex mutex_;
    std::map<std::string, SessionInfo> sessions_;
};

} // namespace shaderchain::server
