#include "peerdrop/network/signaling.hpp"

namespace peerdrop::network {

namespace {
    constexpr const char* TYPE_OFFER = "offer";
    constexpr const char* TYPE_ANSWER = "answer";
    constexpr const char* TYPE_CANDIDATE = "ice-candidate";
    
    void set_error(std::string* error, std::string message) {
        if (error) {
            *error = std::move(message);
        }
    }
    
    nlohmann::json description_to_json(const SessionDescription& description) {
        return nlohmann::json{{"type", description.type}, {"sdp", description.sdp}};
    }
    
    std::optional<SessionDescription> description_from_json(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        
        auto type_it = j.find("type");
        auto sdp_it = j.find("sdp");
        if (type_it == j.end() || !type_it->is_string() ||
            sdp_it == j.end() || !sdp_it->is_string()) {
            return std::nullopt;
        }
        
        return SessionDescription{type_it->get<std::string>(), sdp_it->get<std::string>()};
    }
    
    nlohmann::json candidate_to_json(const IceCandidate& candidate) {
        return nlohmann::json{
            {"candidate", candidate.candidate},
            {"sdpMid", candidate.sdp_mid},
            {"sdpMLineIndex", candidate.sdp_mline_index}
        };
    }
    
    std::optional<IceCandidate> candidate_from_json(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        
        auto candidate_it = j.find("candidate");
        if (candidate_it == j.end() || !candidate_it->is_string()) {
            return std::nullopt;
        }
        
        IceCandidate candidate;
        candidate.candidate = candidate_it->get<std::string>();
        
        auto mid_it = j.find("sdpMid");
        if (mid_it != j.end() && mid_it->is_string()) {
            candidate.sdp_mid = mid_it->get<std::string>();
        }
        
        auto index_it = j.find("sdpMLineIndex");
        if (index_it != j.end() && index_it->is_number_integer()) {
            candidate.sdp_mline_index = index_it->get<int>();
        }
        
        return candidate;
    }
}

nlohmann::json encode_signal(const SignalPayload& payload) {
    nlohmann::json j;
    
    if (const auto* offer = std::get_if<OfferSignal>(&payload)) {
        j["type"] = TYPE_OFFER;
        j["sdp"] = description_to_json(offer->description);
        if (offer->metadata) {
            j["fileName"] = offer->metadata->file_name;
            j["fileSize"] = offer->metadata->file_size;
            j["fileType"] = offer->metadata->file_type;
        }
    } else if (const auto* answer = std::get_if<AnswerSignal>(&payload)) {
        j["type"] = TYPE_ANSWER;
        j["sdp"] = description_to_json(answer->description);
    } else if (const auto* candidate = std::get_if<CandidateSignal>(&payload)) {
        j["type"] = TYPE_CANDIDATE;
        j["candidate"] = candidate_to_json(candidate->candidate);
    }
    
    return j;
}

std::optional<SignalPayload> decode_signal(const nlohmann::json& data, std::string* error) {
    if (!data.is_object()) {
        set_error(error, "Signal payload is not an object");
        return std::nullopt;
    }
    
    auto type_it = data.find("type");
    if (type_it == data.end() || !type_it->is_string()) {
        set_error(error, "Signal payload has no type");
        return std::nullopt;
    }
    
    const auto& type = type_it->get_ref<const std::string&>();
    
    if (type == TYPE_OFFER || type == TYPE_ANSWER) {
        auto sdp_it = data.find("sdp");
        auto description = sdp_it != data.end() ? description_from_json(*sdp_it) : std::nullopt;
        if (!description) {
            set_error(error, "Signal '" + type + "' has no valid sdp");
            return std::nullopt;
        }
        
        if (type == TYPE_ANSWER) {
            return SignalPayload{AnswerSignal{std::move(*description)}};
        }
        
        OfferSignal offer{std::move(*description), std::nullopt};
        
        // Metadata is optional on the wire; without it the receiver waits for
        // the metadata control frame.
        auto name_it = data.find("fileName");
        auto size_it = data.find("fileSize");
        if (name_it != data.end() && name_it->is_string() &&
            size_it != data.end() && size_it->is_number_unsigned()) {
            storage::FileMetadata metadata;
            metadata.file_name = name_it->get<std::string>();
            metadata.file_size = size_it->get<std::uint64_t>();
            
            auto file_type_it = data.find("fileType");
            if (file_type_it != data.end() && file_type_it->is_string()) {
                metadata.file_type = file_type_it->get<std::string>();
            }
            offer.metadata = std::move(metadata);
        }
        
        return SignalPayload{std::move(offer)};
    }
    
    if (type == TYPE_CANDIDATE) {
        auto candidate_it = data.find("candidate");
        auto candidate = candidate_it != data.end() ? candidate_from_json(*candidate_it) : std::nullopt;
        if (!candidate) {
            set_error(error, "Signal 'ice-candidate' has no valid candidate");
            return std::nullopt;
        }
        return SignalPayload{CandidateSignal{std::move(*candidate)}};
    }
    
    set_error(error, "Unknown signal type: " + type);
    return std::nullopt;
}

const char* signal_type(const SignalPayload& payload) {
    switch (payload.index()) {
        case 0: return TYPE_OFFER;
        case 1: return TYPE_ANSWER;
        default: return TYPE_CANDIDATE;
    }
}

} // namespace peerdrop::network
