#include "server/session.hpp"
#include "crypto/random.hpp"
#include "shaderchain/time_utils.hpp"
#include "utils/logger.hpp"

namespace shaderchain::server {

namespace {
    constexpr size_t SESSION_ID_BYTES = 16;
}

SessionRegistry::SessionRegistry(uint64_t idle_timeout_ms)
    : idle_timeout_ms_(idle_timeout_ms)
{
}

std::string SessionRegistry::create_session(uint64_t now_ms) {
    SessionInfo info;
    info.id = crypto::Random::generate_hex(SESSION_ID_BYTES);
    info.created_at = now_ms;
    info.last_activity = now_ms;

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[info.id] = info;

    SHADERCHAIN_LOG_DEBUG("Session {} opened", info.id);
    return info.id;
}

void SessionRegistry::remove_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(id) > 0) {
        SHADERCHAIN_LOG_DEBUG("Session {} closed", id);
    }
}

std::optional<SessionInfo> SessionRegistry::get_session(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SessionRegistry::touch(const std::string& id, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.last_activity = now_ms;
    return true;
}

bool SessionRegistry::record_challenge(const std::string& id, uint64_t compute_time_ms, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.challenges_completed += 1;
    it->second.compute_time_ms += compute_time_ms;
    it->second.last_activity = now_ms;
    return true;
}

std::vector<std::string> SessionRegistry::cleanup_stale_sessions(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> removed;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (time::elapsed_between(it->second.last_activity, now_ms) > idle_timeout_ms_) {
            removed.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }

    if (!removed.empty()) {
        SHADERCHAIN_LOG_INFO("Removed {} stale sessions", removed.size());
    }
    return removed;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace shaderchain::server
