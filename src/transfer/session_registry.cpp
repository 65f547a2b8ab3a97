#include "peerdrop/transfer/session_registry.hpp"
#include "peerdrop/core/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerdrop::transfer {

SessionRegistry::SessionRegistry(SessionFactory factory)
    : factory_(std::move(factory))
{
    if (!factory_) {
        throw std::invalid_argument("SessionRegistry requires a session factory");
    }
}

SessionRegistry::~SessionRegistry() {
    remove_all();
}

std::pair<std::shared_ptr<PeerSession>, bool> SessionRegistry::get_or_create(const PeerId& peer_id, Role role) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    
    auto it = sessions_.find(peer_id);
    if (it != sessions_.end()) {
        if (it->second->get_role() != role) {
            LOG_DEBUG("Reusing {} session for {} where a {} was requested",
                      to_string(it->second->get_role()), peer_id, to_string(role));
        }
        return {it->second, false};
    }
    
    // Created under the lock so concurrent callers for one peer see one session.
    auto session = factory_(peer_id, role);
    if (!session) {
        throw std::runtime_error("Session factory returned no session for " + peer_id);
    }
    sessions_[peer_id] = session;
    LOG_DEBUG("Registered {} session for {} ({} active)", to_string(role), peer_id, sessions_.size());
    return {session, true};
}

std::shared_ptr<PeerSession> SessionRegistry::find(const PeerId& peer_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(peer_id);
    return it != sessions_.end() ? it->second : nullptr;
}

bool SessionRegistry::contains(const PeerId& peer_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.find(peer_id) != sessions_.end();
}

void SessionRegistry::remove(const PeerId& peer_id) {
    std::shared_ptr<PeerSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer_id);
        if (it == sessions_.end()) {
            return;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    
    session->shutdown();
    LOG_DEBUG("Removed session for {}", peer_id);
}

bool SessionRegistry::remove_if_same(const PeerId& peer_id, const std::shared_ptr<PeerSession>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(peer_id);
    if (it == sessions_.end() || it->second != session) {
        return false;
    }
    
    sessions_.erase(it);
    LOG_DEBUG("Session for {} ended ({} active)", peer_id, sessions_.size());
    return true;
}

void SessionRegistry::remove_all() {
    std::unordered_map<PeerId, std::shared_ptr<PeerSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    
    for (auto& [peer_id, session] : sessions) {
        session->shutdown();
    }
    
    if (!sessions.empty()) {
        LOG_INFO("Removed all {} sessions", sessions.size());
    }
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::vector<std::shared_ptr<PeerSession>> SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<std::shared_ptr<PeerSession>> result;
    result.reserve(sessions_.size());
    for (const auto& [peer_id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

std::vector<PeerId> SessionRegistry::peers() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<PeerId> result;
    result.reserve(sessions_.size());
    for (const auto& [peer_id, session] : sessions_) {
        result.push_back(peer_id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<SessionInfo> SessionRegistry::get_all_sessions() const {
    std::vector<SessionInfo> result;
    for (const auto& session : snapshot()) {
        result.push_back(SessionInfo{
            session->get_peer_id(),
            session->get_role(),
            session->get_state(),
            session->get_bytes_sent(),
            session->get_received_bytes()
        });
    }
    std::sort(result.begin(), result.end(), [](const SessionInfo& a, const SessionInfo& b) {
        return a.peer_id < b.peer_id;
    });
    return result;
}

} // namespace peerdrop::transfer
