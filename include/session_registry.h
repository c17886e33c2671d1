#pragma once

/**
 * @file session_registry.h
 * @brief Live sessions by id
 *
 * Owned by the transport layer and passed to whatever needs to look
 * sessions up; there is no global instance.
 */

#include "session.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voice_relay {

class SessionRegistry {
public:
    /**
     * @return false if a session with the same id is already registered
     */
    bool insert(std::shared_ptr<Session> session);

    /// Remove and return the session, or null if unknown
    std::shared_ptr<Session> remove(const std::string& id);

    std::shared_ptr<Session> find(const std::string& id) const;

    size_t size() const;
    std::vector<std::string> ids() const;

    /**
     * @brief Disconnect every session and wait for them to stop
     */
    void shutdown();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace voice_relay
