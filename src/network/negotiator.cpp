#include "peerdrop/network/negotiator.hpp"

namespace peerdrop::network {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::NEW: return "new";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::FAILED: return "failed";
        case ConnectionState::CLOSED: return "closed";
    }
    return "unknown";
}

} // namespace peerdrop::network
