#include "session_registry.h"
#include "logger.h"

namespace voice_relay {

bool SessionRegistry::insert(std::shared_ptr<Session> session) {
    if (!session) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = session->id();
    return sessions_.emplace(id, std::move(session)).second;
}

std::shared_ptr<Session> SessionRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        out.push_back(entry.first);
    }
    return out;
}

void SessionRegistry::shutdown() {
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    if (!sessions.empty()) {
        LOG_INFO("Closing " + std::to_string(sessions.size()) + " session(s)");
    }
    for (auto& entry : sessions) {
        entry.second->disconnect();
    }
    for (auto& entry : sessions) {
        entry.second->wait();
    }
}

} // namespace voice_relay
