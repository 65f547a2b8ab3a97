#pragma once

#include "peerdrop/network/negotiator.hpp"
#include "peerdrop/storage/file_metadata.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace peerdrop::network {

// The offer carries the file metadata inline so the receiver knows what is
// coming before the channel opens.
struct OfferSignal {
    SessionDescription description;
    std::optional<storage::FileMetadata> metadata;
};

struct AnswerSignal {
    SessionDescription description;
};

struct CandidateSignal {
    IceCandidate candidate;
};

using SignalPayload = std::variant<OfferSignal, AnswerSignal, CandidateSignal>;

struct SignalEnvelope {
    PeerId from;
    nlohmann::json data;
};

nlohmann::json encode_signal(const SignalPayload& payload);
std::optional<SignalPayload> decode_signal(const nlohmann::json& data, std::string* error = nullptr);

const char* signal_type(const SignalPayload& payload);

// Relay that carries signaling payloads between peers. Implementations must
// deliver payloads unmodified and attributed to the sending peer.
class SignalingTransport {
public:
    using SignalHandler = std::function<void(const SignalEnvelope&)>;
    
    virtual ~SignalingTransport() = default;
    
    virtual void send(const PeerId& to, const nlohmann::json& payload) = 0;
    virtual void subscribe(SignalHandler handler) = 0;
    virtual void unsubscribe() = 0;
};

} // namespace peerdrop::network
