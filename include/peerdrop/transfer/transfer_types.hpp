#pragma once

#include <string>
#include <cstdint>

namespace peerdrop::transfer {

using PeerId = std::string;

enum class Role {
    SENDER,
    RECEIVER
};

enum class SessionState {
    NEGOTIATING,
    CHANNEL_OPEN,
    TRANSFERRING,
    COMPLETE,
    CLOSED,
    FAILED
};

enum class TransferError {
    SUCCESS = 0,
    NEGOTIATION_FAILURE,
    CHANNEL_ERROR,
    MALFORMED_FRAME,
    UNKNOWN_PEER,
    INVALID_STATE,
    FILE_TOO_LARGE,
    TIMEOUT,
    SHUT_DOWN
};

struct TransferResult {
    TransferError error;
    std::string message;
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

// Closed and Failed are terminal; Failed is reachable from every other
// non-terminal state, Closed from every state except Failed.
bool is_terminal(SessionState state);
bool is_legal_transition(SessionState from, SessionState to);

// Terminal errors tear the session down; the rest are only reported.
bool is_terminal_error(TransferError error);

const char* to_string(Role role);
const char* to_string(SessionState state);
const char* to_string(TransferError error);

} // namespace peerdrop::transfer
