#include "core/drm/stores.hpp"
#include "utils/logger.hpp"

namespace shaderchain::core {

// ChallengeRegistry

void ChallengeRegistry::insert(const DRMChallenge& challenge, const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    challenges_[challenge.challenge_id] = Entry{challenge, client_id};
}

std::optional<DRMChallenge> ChallengeRegistry::take(
    const std::string& challenge_id,
    const std::string& client_id,
    uint64_t now_ms
) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = challenges_.find(challenge_id);
    if (it == challenges_.end()) {
        return std::nullopt;
    }

    if (it->second.client_id != client_id) {
        SHADERCHAIN_LOG_WARN("Challenge {} presented by foreign client {}", challenge_id, client_id);
        return std::nullopt;
    }

    if (it->second.challenge.is_expired(now_ms)) {
        challenges_.erase(it);
        return std::nullopt;
    }

    DRMChallenge challenge = std::move(it->second.challenge);
    challenges_.erase(it);
    return challenge;
}

size_t ChallengeRegistry::purge_expired(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = challenges_.begin(); it != challenges_.end();) {
        if (it->second.challenge.is_expired(now_ms)) {
            it = challenges_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        SHADERCHAIN_LOG_DEBUG("Purged {} expired challenges", removed);
    }
    return removed;
}

size_t ChallengeRegistry::remove_client(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = challenges_.begin(); it != challenges_.end();) {
        if (it->second.client_id == client_id) {
            it = challenges_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t ChallengeRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return challenges_.size();
}

// ClientStateStore

ClientState ClientStateStore::initialize(const std::string& client_id, const std::string& version) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(client_id);
    if (it != states_.end()) {
        return it->second;
    }

    ClientState state;
    state.client_id = client_id;
    state.version = version;
    states_.emplace(client_id, state);

    SHADERCHAIN_LOG_DEBUG("Client {} initialized (version {})", client_id, version);
    return state;
}

std::optional<ClientState> ClientStateStore::get(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(client_id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ClientState> ClientStateStore::update(
    const std::string& client_id,
    const std::function<void(ClientState&)>& fn
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(client_id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    fn(it->second);
    return it->second;
}

bool ClientStateStore::remove(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.erase(client_id) > 0;
}

size_t ClientStateStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

std::vector<ClientState> ClientStateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClientState> result;
    result.reserve(states_.size());
    for (const auto& [id, state] : states_) {
        result.push_back(state);
    }
    return result;
}

double ClientStateStore::average_trust() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (states_.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& [id, state] : states_) {
        total += state.trust_score;
    }
    return total / static_cast<double>(states_.size());
}

} // namespace shaderchain::core
