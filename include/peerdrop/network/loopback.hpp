#pragma once

#include "peerdrop/network/negotiator.hpp"
#include "peerdrop/network/signaling.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace peerdrop::network {

// In-process negotiator and signaling relay. Every event is posted to one
// io_context, so delivery is asynchronous and strictly ordered like a real
// data channel.

class LoopbackNetwork;
class LoopbackPeerConnection;

class LoopbackDataChannel : public DataChannel,
                            public std::enable_shared_from_this<LoopbackDataChannel> {
public:
    LoopbackDataChannel(std::shared_ptr<LoopbackNetwork> network, std::string label);
    
    const std::string& label() const override { return label_; }
    bool is_open() const override;
    
    bool send_text(const std::string& text) override;
    bool send_binary(std::span<const std::uint8_t> data) override;
    std::size_t buffered_amount() const override;
    
    void close() override;
    
    void on_open(OpenHandler handler) override;
    void on_text(TextHandler handler) override;
    void on_binary(BinaryHandler handler) override;
    void on_error(ErrorHandler handler) override;
    void on_close(CloseHandler handler) override;
    
    // Test hooks
    void inject_error(const std::string& message);
    std::size_t peak_buffered_amount() const;
    
private:
    friend class LoopbackPeerConnection;
    friend class LoopbackNetwork;
    
    struct Message {
        bool binary = false;
        bool close_marker = false;
        std::string text;
        std::vector<std::uint8_t> data;
    };
    
    void link(std::shared_ptr<LoopbackDataChannel> remote);
    void open();
    void schedule_pump();
    void pump_one();
    void deliver(Message message);
    void remote_closed();
    
    std::shared_ptr<LoopbackNetwork> network_;
    std::string label_;
    std::weak_ptr<LoopbackDataChannel> remote_;
    
    mutable std::mutex mutex_;
    std::deque<Message> outbound_;
    std::size_t buffered_;
    std::size_t peak_buffered_;
    bool open_;
    bool closed_;
    bool pump_scheduled_;
    
    OpenHandler open_handler_;
    TextHandler text_handler_;
    BinaryHandler binary_handler_;
    ErrorHandler error_handler_;
    CloseHandler close_handler_;
};

class LoopbackPeerConnection : public PeerConnection,
                               public std::enable_shared_from_this<LoopbackPeerConnection> {
public:
    LoopbackPeerConnection(std::shared_ptr<LoopbackNetwork> network, std::uint64_t id, PeerId remote_peer);
    
    SessionDescription create_offer() override;
    SessionDescription create_answer() override;
    void set_remote_description(const SessionDescription& description) override;
    void add_remote_candidate(const IceCandidate& candidate) override;
    
    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override;
    
    void on_local_candidate(CandidateHandler handler) override;
    void on_state_change(StateHandler handler) override;
    void on_data_channel(DataChannelHandler handler) override;
    
    void close() override;
    
    std::uint64_t get_id() const { return id_; }
    const PeerId& get_remote_peer() const { return remote_peer_; }
    bool is_closed() const;
    std::vector<IceCandidate> get_remote_candidates() const;
    std::vector<std::shared_ptr<LoopbackDataChannel>> get_channels() const;
    
    // Test hook: report a connection-level state change as the network would.
    void simulate_state(ConnectionState state);
    
private:
    SessionDescription make_description(const std::string& type) const;
    void announce_local_candidate();
    void post_state(ConnectionState state);
    void establish(std::shared_ptr<LoopbackPeerConnection> remote);
    void pair_channel(const std::shared_ptr<LoopbackDataChannel>& local,
                      const std::shared_ptr<LoopbackPeerConnection>& remote);
    void accept_channel(std::shared_ptr<LoopbackDataChannel> channel);
    
    std::shared_ptr<LoopbackNetwork> network_;
    std::uint64_t id_;
    PeerId remote_peer_;
    
    mutable std::mutex mutex_;
    std::optional<SessionDescription> local_description_;
    std::optional<SessionDescription> remote_description_;
    std::weak_ptr<LoopbackPeerConnection> remote_;
    std::vector<std::shared_ptr<LoopbackDataChannel>> channels_;
    std::vector<IceCandidate> remote_candidates_;
    bool established_;
    bool closed_;
    
    CandidateHandler candidate_handler_;
    StateHandler state_handler_;
    DataChannelHandler data_channel_handler_;
};

class LoopbackNetwork : public std::enable_shared_from_this<LoopbackNetwork> {
public:
    explicit LoopbackNetwork(boost::asio::io_context& io_context);
    
    boost::asio::io_context& get_io_context() { return io_context_; }
    
    std::shared_ptr<LoopbackPeerConnection> create_connection(const PeerId& remote_peer);
    std::shared_ptr<LoopbackPeerConnection> find_connection(std::uint64_t id) const;
    std::vector<std::shared_ptr<LoopbackPeerConnection>> get_connections() const;
    
    // A paused network holds every queued channel message, like a receiver
    // that stopped reading.
    void set_delivery_paused(bool paused);
    bool is_delivery_paused() const { return paused_; }
    
    std::size_t get_connections_created() const { return connections_created_; }
    std::size_t get_channels_created() const { return channels_created_; }
    
private:
    friend class LoopbackDataChannel;
    friend class LoopbackPeerConnection;
    
    void register_channel(const std::shared_ptr<LoopbackDataChannel>& channel);
    void hold_channel(const std::shared_ptr<LoopbackDataChannel>& channel);
    
    boost::asio::io_context& io_context_;
    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, std::weak_ptr<LoopbackPeerConnection>> connections_;
    std::vector<std::weak_ptr<LoopbackDataChannel>> channels_;
    std::vector<std::shared_ptr<LoopbackDataChannel>> held_;
    std::uint64_t next_id_;
    std::atomic<bool> paused_;
    std::atomic<std::size_t> connections_created_;
    std::atomic<std::size_t> channels_created_;
};

class LoopbackNegotiator : public SessionNegotiator {
public:
    explicit LoopbackNegotiator(std::shared_ptr<LoopbackNetwork> network);
    
    std::shared_ptr<PeerConnection> create_connection(const PeerId& peer_id,
                                                      const NegotiatorConfig& config) override;
    
    void set_fail_connections(bool fail) { fail_connections_ = fail; }
    const NegotiatorConfig& get_last_config() const { return last_config_; }
    
private:
    std::shared_ptr<LoopbackNetwork> network_;
    std::atomic<bool> fail_connections_;
    NegotiatorConfig last_config_;
};

class LoopbackSignalingTransport;

class LoopbackSignalingHub : public std::enable_shared_from_this<LoopbackSignalingHub> {
public:
    explicit LoopbackSignalingHub(boost::asio::io_context& io_context);
    
    std::shared_ptr<LoopbackSignalingTransport> create_endpoint(const PeerId& id);
    
    void route(const PeerId& from, const PeerId& to, nlohmann::json payload);
    std::size_t get_messages_routed() const { return messages_routed_; }
    
private:
    boost::asio::io_context& io_context_;
    mutable std::mutex mutex_;
    std::unordered_map<PeerId, std::weak_ptr<LoopbackSignalingTransport>> endpoints_;
    std::atomic<std::size_t> messages_routed_;
};

class LoopbackSignalingTransport : public SignalingTransport {
public:
    LoopbackSignalingTransport(std::shared_ptr<LoopbackSignalingHub> hub, PeerId id);
    
    void send(const PeerId& to, const nlohmann::json& payload) override;
    void subscribe(SignalHandler handler) override;
    void unsubscribe() override;
    
    const PeerId& get_id() const { return id_; }
    bool is_subscribed() const;
    std::vector<nlohmann::json> get_sent_payloads() const;
    
private:
    friend class LoopbackSignalingHub;
    
    void deliver(const SignalEnvelope& envelope);
    
    std::shared_ptr<LoopbackSignalingHub> hub_;
    PeerId id_;
    mutable std::mutex mutex_;
    SignalHandler handler_;
    std::vector<nlohmann::json> sent_payloads_;
};

} // namespace peerdrop::network
