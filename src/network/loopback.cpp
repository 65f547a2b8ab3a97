#include "peerdrop/network/loopback.hpp"
#include "peerdrop/core/logger.hpp"
#include <algorithm>

namespace peerdrop::network {

namespace {
    constexpr const char* SDP_PREFIX = "v=0 peerdrop-loopback session=";
    
    std::uint64_t parse_session_id(const SessionDescription& description) {
        const std::string prefix(SDP_PREFIX);
        if (description.sdp.compare(0, prefix.size(), prefix) != 0) {
            throw NegotiationError("Unrecognised session description");
        }
        
        try {
            return std::stoull(description.sdp.substr(prefix.size()));
        } catch (const std::exception&) {
            throw NegotiationError("Malformed session id in description");
        }
    }
}

// LoopbackDataChannel

LoopbackDataChannel::LoopbackDataChannel(std::shared_ptr<LoopbackNetwork> network, std::string label)
    : network_(std::move(network))
    , label_(std::move(label))
    , buffered_(0)
    , peak_buffered_(0)
    , open_(false)
    , closed_(false)
    , pump_scheduled_(false)
{
}

bool LoopbackDataChannel::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_ && !closed_;
}

bool LoopbackDataChannel::send_text(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_ || closed_) {
            return false;
        }
        
        Message message;
        message.text = text;
        buffered_ += text.size();
        peak_buffered_ = std::max(peak_buffered_, buffered_);
        outbound_.push_back(std::move(message));
    }
    
    schedule_pump();
    return true;
}

bool LoopbackDataChannel::send_binary(std::span<const std::uint8_t> data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_ || closed_) {
            return false;
        }
        
        Message message;
        message.binary = true;
        message.data.assign(data.begin(), data.end());
        buffered_ += data.size();
        peak_buffered_ = std::max(peak_buffered_, buffered_);
        outbound_.push_back(std::move(message));
    }
    
    schedule_pump();
    return true;
}

std::size_t LoopbackDataChannel::buffered_amount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffered_;
}

std::size_t LoopbackDataChannel::peak_buffered_amount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_buffered_;
}

void LoopbackDataChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        open_ = false;
        
        // Queued behind pending messages so the remote end sees them first.
        Message marker;
        marker.close_marker = true;
        outbound_.push_back(std::move(marker));
    }
    
    LOG_TRACE("Loopback channel '{}' closing", label_);
    
    auto self = shared_from_this();
    boost::asio::post(network_->get_io_context(), [self]() {
        CloseHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            handler = self->close_handler_;
        }
        if (handler) {
            handler();
        }
    });
    
    schedule_pump();
}

void LoopbackDataChannel::on_open(OpenHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_handler_ = std::move(handler);
}

void LoopbackDataChannel::on_text(TextHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    text_handler_ = std::move(handler);
}

void LoopbackDataChannel::on_binary(BinaryHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    binary_handler_ = std::move(handler);
}

void LoopbackDataChannel::on_error(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_handler_ = std::move(handler);
}

void LoopbackDataChannel::on_close(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    close_handler_ = std::move(handler);
}

void LoopbackDataChannel::inject_error(const std::string& message) {
    auto self = shared_from_this();
    boost::asio::post(network_->get_io_context(), [self, message]() {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            handler = self->error_handler_;
        }
        if (handler) {
            handler(message);
        }
    });
}

void LoopbackDataChannel::link(std::shared_ptr<LoopbackDataChannel> remote) {
    std::lock_guard<std::mutex> lock(mutex_);
    remote_ = remote;
}

void LoopbackDataChannel::open() {
    auto self = shared_from_this();
    boost::asio::post(network_->get_io_context(), [self]() {
        OpenHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            if (self->closed_ || self->open_) {
                return;
            }
            self->open_ = true;
            handler = self->open_handler_;
        }
        LOG_TRACE("Loopback channel '{}' open", self->label_);
        if (handler) {
            handler();
        }
    });
}

void LoopbackDataChannel::schedule_pump() {
    bool hold = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pump_scheduled_ || outbound_.empty()) {
            return;
        }
        if (network_->is_delivery_paused()) {
            hold = true;
        } else {
            pump_scheduled_ = true;
        }
    }
    
    auto self = shared_from_this();
    if (hold) {
        // Queued messages outlive their owner until delivery resumes.
        network_->hold_channel(self);
        return;
    }
    
    boost::asio::post(network_->get_io_context(), [self]() {
        self->pump_one();
    });
}

void LoopbackDataChannel::pump_one() {
    Message message;
    std::shared_ptr<LoopbackDataChannel> remote;
    bool paused = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pump_scheduled_ = false;
        if (outbound_.empty()) {
            return;
        }
        paused = network_->is_delivery_paused();
        if (!paused) {
            message = std::move(outbound_.front());
            outbound_.pop_front();
            if (!message.close_marker) {
                buffered_ -= message.binary ? message.data.size() : message.text.size();
            }
            remote = remote_.lock();
        }
    }
    
    if (paused) {
        schedule_pump();
        return;
    }
    
    if (remote) {
        if (message.close_marker) {
            remote->remote_closed();
        } else {
            remote->deliver(std::move(message));
        }
    }
    
    schedule_pump();
}

void LoopbackDataChannel::deliver(Message message) {
    TextHandler text_handler;
    BinaryHandler binary_handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        text_handler = text_handler_;
        binary_handler = binary_handler_;
    }
    
    if (message.binary) {
        if (binary_handler) {
            binary_handler(std::move(message.data));
        }
    } else if (text_handler) {
        text_handler(message.text);
    }
}

void LoopbackDataChannel::remote_closed() {
    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        open_ = false;
        outbound_.clear();
        buffered_ = 0;
        handler = close_handler_;
    }
    
    LOG_TRACE("Loopback channel '{}' closed by remote", label_);
    if (handler) {
        handler();
    }
}

// LoopbackPeerConnection

LoopbackPeerConnection::LoopbackPeerConnection(std::shared_ptr<LoopbackNetwork> network,
                                               std::uint64_t id, PeerId remote_peer)
    : network_(std::move(network))
    , id_(id)
    , remote_peer_(std::move(remote_peer))
    , established_(false)
    , closed_(false)
{
}

SessionDescription LoopbackPeerConnection::make_description(const std::string& type) const {
    return SessionDescription{type, SDP_PREFIX + std::to_string(id_)};
}

SessionDescription LoopbackPeerConnection::create_offer() {
    SessionDescription offer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw NegotiationError("Connection is closed");
        }
        if (remote_description_) {
            throw NegotiationError("Cannot offer after applying a remote description");
        }
        offer = make_description("offer");
        local_description_ = offer;
    }
    
    post_state(ConnectionState::CONNECTING);
    announce_local_candidate();
    return offer;
}

SessionDescription LoopbackPeerConnection::create_answer() {
    SessionDescription answer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw NegotiationError("Connection is closed");
        }
        if (!remote_description_ || remote_description_->type != "offer") {
            throw NegotiationError("No remote offer to answer");
        }
        answer = make_description("answer");
        local_description_ = answer;
    }
    
    post_state(ConnectionState::CONNECTING);
    announce_local_candidate();
    return answer;
}

void LoopbackPeerConnection::set_remote_description(const SessionDescription& description) {
    std::shared_ptr<LoopbackPeerConnection> remote_to_establish;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw NegotiationError("Connection is closed");
        }
        
        auto remote_id = parse_session_id(description);
        auto remote = network_->find_connection(remote_id);
        if (!remote) {
            throw NegotiationError("Unknown remote session " + std::to_string(remote_id));
        }
        
        if (description.type == "offer") {
            if (local_description_) {
                throw NegotiationError("Offer received after a local description was created");
            }
        } else if (description.type == "answer") {
            if (!local_description_ || local_description_->type != "offer") {
                throw NegotiationError("Answer received without a local offer");
            }
            if (remote_description_) {
                throw NegotiationError("Remote answer already applied");
            }
            remote_to_establish = remote;
        } else {
            throw NegotiationError("Unsupported description type: " + description.type);
        }
        
        remote_description_ = description;
        remote_ = remote;
    }
    
    if (remote_to_establish) {
        establish(remote_to_establish);
    }
}

void LoopbackPeerConnection::add_remote_candidate(const IceCandidate& candidate) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw NegotiationError("Connection is closed");
    }
    if (candidate.candidate.empty()) {
        throw NegotiationError("Empty candidate");
    }
    remote_candidates_.push_back(candidate);
}

std::shared_ptr<DataChannel> LoopbackPeerConnection::create_data_channel(const std::string& label) {
    auto channel = std::make_shared<LoopbackDataChannel>(network_, label);
    std::shared_ptr<LoopbackPeerConnection> remote;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw NegotiationError("Connection is closed");
        }
        channels_.push_back(channel);
        if (established_) {
            remote = remote_.lock();
        }
    }
    
    network_->register_channel(channel);
    network_->channels_created_++;
    
    if (remote) {
        auto self = shared_from_this();
        boost::asio::post(network_->get_io_context(), [self, channel, remote]() {
            self->pair_channel(channel, remote);
        });
    }
    
    return channel;
}

void LoopbackPeerConnection::on_local_candidate(CandidateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    candidate_handler_ = std::move(handler);
}

void LoopbackPeerConnection::on_state_change(StateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_handler_ = std::move(handler);
}

void LoopbackPeerConnection::on_data_channel(DataChannelHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_channel_handler_ = std::move(handler);
}

void LoopbackPeerConnection::close() {
    std::vector<std::shared_ptr<LoopbackDataChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        channels = channels_;
    }
    
    LOG_DEBUG("Loopback connection {} closing", id_);
    
    for (auto& channel : channels) {
        channel->close();
    }
    
    post_state(ConnectionState::CLOSED);
}

bool LoopbackPeerConnection::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::vector<IceCandidate> LoopbackPeerConnection::get_remote_candidates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_candidates_;
}

std::vector<std::shared_ptr<LoopbackDataChannel>> LoopbackPeerConnection::get_channels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_;
}

void LoopbackPeerConnection::simulate_state(ConnectionState state) {
    post_state(state);
}

void LoopbackPeerConnection::announce_local_candidate() {
    auto self = shared_from_this();
    boost::asio::post(network_->get_io_context(), [self]() {
        CandidateHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            if (self->closed_) {
                return;
            }
            handler = self->candidate_handler_;
        }
        if (handler) {
            handler(IceCandidate{
                "candidate:1 1 udp 2130706431 127.0.0.1 " + std::to_string(40000 + self->id_) + " typ host",
                "0",
                0
            });
        }
    });
}

void LoopbackPeerConnection::post_state(ConnectionState state) {
    auto self = shared_from_this();
    boost::asio::post(network_->get_io_context(), [self, state]() {
        StateHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            handler = self->state_handler_;
        }
        if (handler) {
            handler(state);
        }
    });
}

void LoopbackPeerConnection::establish(std::shared_ptr<LoopbackPeerConnection> remote) {
    auto self = shared_from_this();
    boost::asio::post(network_->get_io_context(), [self, remote]() {
        std::vector<std::shared_ptr<LoopbackDataChannel>> channels;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            if (self->closed_) {
                return;
            }
            self->established_ = true;
            channels = self->channels_;
        }
        {
            std::lock_guard<std::mutex> lock(remote->mutex_);
            remote->established_ = true;
        }
        
        LOG_DEBUG("Loopback connections {} and {} established", self->id_, remote->id_);
        
        self->post_state(ConnectionState::CONNECTED);
        remote->post_state(ConnectionState::CONNECTED);
        
        for (const auto& channel : channels) {
            self->pair_channel(channel, remote);
        }
    });
}

void LoopbackPeerConnection::pair_channel(const std::shared_ptr<LoopbackDataChannel>& local,
                                          const std::shared_ptr<LoopbackPeerConnection>& remote) {
    auto remote_channel = std::make_shared<LoopbackDataChannel>(network_, local->label());
    network_->register_channel(remote_channel);
    
    local->link(remote_channel);
    remote_channel->link(local);
    
    remote->accept_channel(remote_channel);
    local->open();
    remote_channel->open();
}

void LoopbackPeerConnection::accept_channel(std::shared_ptr<LoopbackDataChannel> channel) {
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed = closed_;
        if (!closed) {
            channels_.push_back(channel);
        }
    }
    
    if (closed) {
        channel->close();
        return;
    }
    
    auto self = shared_from_this();
    boost::asio::post(network_->get_io_context(), [self, channel]() {
        DataChannelHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            handler = self->data_channel_handler_;
        }
        if (handler) {
            handler(channel);
        }
    });
}

// LoopbackNetwork

LoopbackNetwork::LoopbackNetwork(boost::asio::io_context& io_context)
    : io_context_(io_context)
    , next_id_(1)
    , paused_(false)
    , connections_created_(0)
    , channels_created_(0)
{
}

std::shared_ptr<LoopbackPeerConnection> LoopbackNetwork::create_connection(const PeerId& remote_peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    auto connection = std::make_shared<LoopbackPeerConnection>(shared_from_this(), id, remote_peer);
    connections_[id] = connection;
    connections_created_++;
    return connection;
}

std::shared_ptr<LoopbackPeerConnection> LoopbackNetwork::find_connection(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    return it != connections_.end() ? it->second.lock() : nullptr;
}

std::vector<std::shared_ptr<LoopbackPeerConnection>> LoopbackNetwork::get_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<LoopbackPeerConnection>> result;
    for (const auto& [id, weak] : connections_) {
        if (auto connection = weak.lock()) {
            result.push_back(connection);
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a->get_id() < b->get_id();
    });
    return result;
}

void LoopbackNetwork::set_delivery_paused(bool paused) {
    paused_ = paused;
    if (paused) {
        return;
    }
    
    std::vector<std::shared_ptr<LoopbackDataChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels.swap(held_);
        for (const auto& weak : channels_) {
            if (auto channel = weak.lock()) {
                channels.push_back(channel);
            }
        }
    }
    
    for (auto& channel : channels) {
        channel->schedule_pump();
    }
}

void LoopbackNetwork::hold_channel(const std::shared_ptr<LoopbackDataChannel>& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(held_.begin(), held_.end(), channel) == held_.end()) {
        held_.push_back(channel);
    }
}

void LoopbackNetwork::register_channel(const std::shared_ptr<LoopbackDataChannel>& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
                                   [](const auto& weak) { return weak.expired(); }),
                    channels_.end());
    channels_.push_back(channel);
}

// LoopbackNegotiator

LoopbackNegotiator::LoopbackNegotiator(std::shared_ptr<LoopbackNetwork> network)
    : network_(std::move(network))
    , fail_connections_(false)
{
}

std::shared_ptr<PeerConnection> LoopbackNegotiator::create_connection(const PeerId& peer_id,
                                                                      const NegotiatorConfig& config) {
    if (fail_connections_) {
        throw NegotiationError("Loopback negotiator refused a connection to " + peer_id);
    }
    
    last_config_ = config;
    return network_->create_connection(peer_id);
}

// LoopbackSignalingHub

LoopbackSignalingHub::LoopbackSignalingHub(boost::asio::io_context& io_context)
    : io_context_(io_context)
    , messages_routed_(0)
{
}

std::shared_ptr<LoopbackSignalingTransport> LoopbackSignalingHub::create_endpoint(const PeerId& id) {
    auto endpoint = std::make_shared<LoopbackSignalingTransport>(shared_from_this(), id);
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_[id] = endpoint;
    return endpoint;
}

void LoopbackSignalingHub::route(const PeerId& from, const PeerId& to, nlohmann::json payload) {
    messages_routed_++;
    
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self, from, to, payload = std::move(payload)]() {
        std::shared_ptr<LoopbackSignalingTransport> endpoint;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            auto it = self->endpoints_.find(to);
            if (it != self->endpoints_.end()) {
                endpoint = it->second.lock();
            }
        }
        
        if (!endpoint) {
            LOG_DEBUG("Dropping signal from {} to unknown endpoint {}", from, to);
            return;
        }
        
        endpoint->deliver(SignalEnvelope{from, payload});
    });
}

// LoopbackSignalingTransport

LoopbackSignalingTransport::LoopbackSignalingTransport(std::shared_ptr<LoopbackSignalingHub> hub, PeerId id)
    : hub_(std::move(hub))
    , id_(std::move(id))
{
}

void LoopbackSignalingTransport::send(const PeerId& to, const nlohmann::json& payload) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_payloads_.push_back(payload);
    }
    hub_->route(id_, to, payload);
}

void LoopbackSignalingTransport::subscribe(SignalHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void LoopbackSignalingTransport::unsubscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = nullptr;
}

bool LoopbackSignalingTransport::is_subscribed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(handler_);
}

std::vector<nlohmann::json> LoopbackSignalingTransport::get_sent_payloads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_payloads_;
}

void LoopbackSignalingTransport::deliver(const SignalEnvelope& envelope) {
    SignalHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    
    if (handler) {
        handler(envelope);
    } else {
        LOG_DEBUG("Endpoint {} has no subscriber, dropping signal from {}", id_, envelope.from);
    }
}

} // namespace peerdrop::network
