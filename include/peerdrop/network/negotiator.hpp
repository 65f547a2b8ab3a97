#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace peerdrop::network {

using PeerId = std::string;

// Opaque negotiation blob produced by create_offer/create_answer.
struct SessionDescription {
    std::string type;
    std::string sdp;
    
    bool operator==(const SessionDescription& other) const {
        return type == other.type && sdp == other.sdp;
    }
};

// Opaque network candidate blob.
struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index = 0;
    
    bool operator==(const IceCandidate& other) const {
        return candidate == other.candidate && sdp_mid == other.sdp_mid &&
               sdp_mline_index == other.sdp_mline_index;
    }
};

struct NegotiatorConfig {
    std::vector<std::string> ice_servers;
};

enum class ConnectionState {
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

const char* to_string(ConnectionState state);

// Thrown by negotiator implementations when an offer, answer or candidate
// cannot be created or applied.
class NegotiationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Ordered, message-oriented channel. Handlers may be invoked from any thread
// owned by the implementation; passing nullptr removes a handler.
class DataChannel {
public:
    using OpenHandler = std::function<void()>;
    using TextHandler = std::function<void(const std::string&)>;
    using BinaryHandler = std::function<void(std::vector<std::uint8_t>)>;
    using ErrorHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void()>;
    
    virtual ~DataChannel() = default;
    
    virtual const std::string& label() const = 0;
    virtual bool is_open() const = 0;
    
    // Both return false when the message could not be queued.
    virtual bool send_text(const std::string& text) = 0;
    virtual bool send_binary(std::span<const std::uint8_t> data) = 0;
    
    // Bytes queued by send_* and not yet handed to the network.
    virtual std::size_t buffered_amount() const = 0;
    
    virtual void close() = 0;
    
    virtual void on_open(OpenHandler handler) = 0;
    virtual void on_text(TextHandler handler) = 0;
    virtual void on_binary(BinaryHandler handler) = 0;
    virtual void on_error(ErrorHandler handler) = 0;
    virtual void on_close(CloseHandler handler) = 0;
};

class PeerConnection {
public:
    using CandidateHandler = std::function<void(const IceCandidate&)>;
    using StateHandler = std::function<void(ConnectionState)>;
    using DataChannelHandler = std::function<void(std::shared_ptr<DataChannel>)>;
    
    virtual ~PeerConnection() = default;
    
    // create_offer/create_answer also install the result as the local
    // description. All four throw NegotiationError on failure.
    virtual SessionDescription create_offer() = 0;
    virtual SessionDescription create_answer() = 0;
    virtual void set_remote_description(const SessionDescription& description) = 0;
    virtual void add_remote_candidate(const IceCandidate& candidate) = 0;
    
    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label) = 0;
    
    virtual void on_local_candidate(CandidateHandler handler) = 0;
    virtual void on_state_change(StateHandler handler) = 0;
    virtual void on_data_channel(DataChannelHandler handler) = 0;
    
    virtual void close() = 0;
};

class SessionNegotiator {
public:
    virtual ~SessionNegotiator() = default;
    
    // Throws NegotiationError if no connection can be set up.
    virtual std::shared_ptr<PeerConnection> create_connection(const PeerId& peer_id,
                                                              const NegotiatorConfig& config) = 0;
};

} // namespace peerdrop::network
