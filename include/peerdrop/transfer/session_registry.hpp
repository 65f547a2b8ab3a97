#pragma once

#include "peer_session.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace peerdrop::transfer {

struct SessionInfo {
    PeerId peer_id;
    Role role;
    SessionState state;
    std::uint64_t bytes_sent;
    std::uint64_t received_bytes;
};

// Owns every live session, at most one per peer. A session stays alive
// exactly as long as it is registered here.
class SessionRegistry {
public:
    using SessionFactory = std::function<std::shared_ptr<PeerSession>(const PeerId&, Role)>;
    
    explicit SessionRegistry(SessionFactory factory);
    ~SessionRegistry();
    
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;
    
    // Returns the registered session whatever its role, or creates one.
    // The flag is true when the session was created by this call.
    std::pair<std::shared_ptr<PeerSession>, bool> get_or_create(const PeerId& peer_id, Role role);
    
    std::shared_ptr<PeerSession> find(const PeerId& peer_id) const;
    bool contains(const PeerId& peer_id) const;
    
    // Shuts the session down and evicts it. Removing an absent peer is a no-op.
    void remove(const PeerId& peer_id);
    
    // Evicts the entry only if it still refers to this session; used when a
    // session reports its own end so a newer session for the peer survives.
    bool remove_if_same(const PeerId& peer_id, const std::shared_ptr<PeerSession>& session);
    
    void remove_all();
    
    std::size_t size() const;
    std::vector<std::shared_ptr<PeerSession>> snapshot() const;
    std::vector<PeerId> peers() const;
    std::vector<SessionInfo> get_all_sessions() const;
    
private:
    SessionFactory factory_;
    std::unordered_map<PeerId, std::shared_ptr<PeerSession>> sessions_;
    mutable std::mutex sessions_mutex_;
};

} // namespace peerdrop::transfer
