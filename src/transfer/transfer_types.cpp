#include "peerdrop/transfer/transfer_types.hpp"

namespace peerdrop::transfer {

bool is_terminal(SessionState state) {
    return state == SessionState::CLOSED || state == SessionState::FAILED;
}

bool is_legal_transition(SessionState from, SessionState to) {
    if (is_terminal(from)) {
        return false;
    }
    
    switch (to) {
        case SessionState::CHANNEL_OPEN:
            return from == SessionState::NEGOTIATING;
        case SessionState::TRANSFERRING:
            return from == SessionState::CHANNEL_OPEN;
        case SessionState::COMPLETE:
            return from == SessionState::TRANSFERRING;
        case SessionState::CLOSED:
            return true;
        case SessionState::FAILED:
            return from != SessionState::COMPLETE;
        case SessionState::NEGOTIATING:
            return false;
    }
    return false;
}

bool is_terminal_error(TransferError error) {
    switch (error) {
        case TransferError::NEGOTIATION_FAILURE:
        case TransferError::CHANNEL_ERROR:
        case TransferError::FILE_TOO_LARGE:
        case TransferError::TIMEOUT:
            return true;
        default:
            return false;
    }
}

const char* to_string(Role role) {
    return role == Role::SENDER ? "sender" : "receiver";
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::NEGOTIATING: return "negotiating";
        case SessionState::CHANNEL_OPEN: return "channel-open";
        case SessionState::TRANSFERRING: return "transferring";
        case SessionState::COMPLETE: return "complete";
        case SessionState::CLOSED: return "closed";
        case SessionState::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "success";
        case TransferError::NEGOTIATION_FAILURE: return "negotiation failure";
        case TransferError::CHANNEL_ERROR: return "channel error";
        case TransferError::MALFORMED_FRAME: return "malformed frame";
        case TransferError::UNKNOWN_PEER: return "unknown peer";
        case TransferError::INVALID_STATE: return "invalid state";
        case TransferError::FILE_TOO_LARGE: return "file too large";
        case TransferError::TIMEOUT: return "timeout";
        case TransferError::SHUT_DOWN: return "shut down";
    }
    return "unknown";
}

} // namespace peerdrop::transfer
