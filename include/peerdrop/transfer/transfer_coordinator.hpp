#pragma once

#include "peer_session.hpp"
#include "session_registry.hpp"
#include "peerdrop/network/signaling.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>

namespace peerdrop::transfer {

// Callbacks may be left empty. They are never invoked concurrently with each
// other, and never after destroy() has returned.
struct TransferCallbacks {
    std::function<void(std::uint64_t bytes, std::uint64_t total)> on_progress;
    std::function<void(const storage::FileBlob& file, const std::string& file_name,
                       const PeerId& peer_id)> on_complete;
    std::function<void(const PeerId& peer_id, const TransferResult& error)> on_error;
    std::function<void(const PeerId& peer_id, network::ConnectionState state)> on_connection_state_change;
};

class TransferCoordinator : public SessionListener,
                            public std::enable_shared_from_this<TransferCoordinator> {
    // Only create() can name this, so only create() can construct.
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };
    
public:
    // Subscribes to the transport before returning.
    static std::shared_ptr<TransferCoordinator> create(boost::asio::io_context& io_context,
                                                       std::shared_ptr<network::SignalingTransport> transport,
                                                       std::shared_ptr<network::SessionNegotiator> negotiator,
                                                       TransferCallbacks callbacks,
                                                       TransferOptions options = TransferOptions());
    
    TransferCoordinator(ConstructionTag,
                        boost::asio::io_context& io_context,
                        std::shared_ptr<network::SignalingTransport> transport,
                        std::shared_ptr<network::SessionNegotiator> negotiator,
                        TransferCallbacks callbacks,
                        TransferOptions options);
    ~TransferCoordinator() override;
    
    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;
    
    // Resolves once the offer has been handed to the transport, or with the
    // reason it could not be.
    std::future<TransferResult> send_file(const PeerId& peer_id, storage::FileBlob file);
    
    void on_signal(const network::SignalEnvelope& envelope);
    
    // Removes every session and stops listening. Idempotent.
    void destroy();
    bool is_destroyed() const { return destroyed_; }
    
    SessionRegistry& registry() { return registry_; }
    const SessionRegistry& registry() const { return registry_; }
    const TransferOptions& get_options() const { return options_; }
    
    // SessionListener
    void on_session_signal(const PeerId& peer_id, const network::SignalPayload& signal) override;
    void on_session_progress(const PeerId& peer_id, std::uint64_t bytes, std::uint64_t total) override;
    void on_session_complete(const PeerId& peer_id, storage::FileBlob file) override;
    void on_session_error(const PeerId& peer_id, const TransferResult& result) override;
    void on_session_connection_state(const PeerId& peer_id, network::ConnectionState state) override;
    void on_session_closed(const PeerId& peer_id, const std::shared_ptr<PeerSession>& session) override;
    
private:
    void start();
    void schedule_idle_sweep();
    void notify_error(const PeerId& peer_id, const TransferResult& result);
    
    boost::asio::io_context& io_context_;
    std::shared_ptr<network::SignalingTransport> transport_;
    std::shared_ptr<network::SessionNegotiator> negotiator_;
    TransferCallbacks callbacks_;
    TransferOptions options_;
    
    SessionRegistry registry_;
    
    // The idle timer is only touched from handlers on this strand.
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer idle_timer_;
    
    std::recursive_mutex callbacks_mutex_;
    std::atomic<bool> destroyed_;
};

} // namespace peerdrop::transfer
