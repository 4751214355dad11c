#pragma once

#include "core/drm/types.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shaderchain::core {

/**
 * ChallengeRegistry - Active, not yet verified challenges
 *
 * Thread-safe. A challenge leaves the registry exactly once, either through
 * take() or by expiring.
 */
class ChallengeRegistry {
public:
    ChallengeRegistry() = default;
    SHADERCHAIN_DISALLOW_COPY(ChallengeRegistry);

    void insert(const DRMChallenge& challenge, const std::string& client_id);

    /**
     * Remove and return a challenge
     * @return nullopt if unknown, owned by another client, or expired
     *         (expired entries are dropped)
     */
    std::optional<DRMChallenge> take(
        const std::string& challenge_id,
        const std::string& client_id,
        uint64_t now_ms
    );

    /**
     * Drop every challenge that expired before now_ms
     * @return number of challenges removed
     */
    size_t purge_expired(uint64_t now_ms);

    /**
     * Drop every challenge issued to a client
     * @return number of challenges removed
     */
    size_t remove_client(const std::string& client_id);

    size_t size() const;

private:
    struct Entry {
        DRMChallenge challenge;
        std::string client_id;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> challenges_;
};

/**
 * ClientStateStore - Per-client trust bookkeeping
 *
 * Thread-safe. update() performs an atomic read-modify-write so at most one
 * mutation of a client's state is in flight.
 */
class ClientStateStore {
public:
    ClientStateStore() = default;
    SHADERCHAIN_DISALLOW_COPY(ClientStateStore);

    /**
     * Create a fresh state (trust 50, genesis head) unless one exists
     * @return the current state of the client
     */
    ClientState initialize(const std::string& client_id, const std::string& version);

    std::optional<ClientState> get(const std::string& client_id) const;

    /**
     * Apply fn to the stored state under the store lock
     * @return updated state, or nullopt if the client is unknown
     */
    std::optional<ClientState> update(
        const std::string& client_id,
        const std::function<void(ClientState&)>& fn
    );

    /**
     * Forget a client
     * @return true if the client was known
     */
    bool remove(const std::string& client_id);

    size_t size() const;
    std::vector<ClientState> snapshot() const;

    /**
     * Mean trust score over all clients (0 when empty)
     */
    double average_trust() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ClientState> states_;
};

/**
 * DrmStores - The two mutable stores one server instance owns
 */
struct DrmStores {
    ChallengeRegistry challenges;
    ClientStateStore clients;
};

} // namespace shaderchain::core
