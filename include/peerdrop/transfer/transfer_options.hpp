#pragma once

#include "peerdrop/network/negotiator.hpp"
#include "peerdrop/transfer/chunk_codec.hpp"
#include "peerdrop/transfer/flow_control.hpp"
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace peerdrop::core {
    class Config;
}

namespace peerdrop::transfer {

struct TransferOptions {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::size_t high_water_chunks = DEFAULT_HIGH_WATER_CHUNKS;
    std::chrono::milliseconds backoff = DEFAULT_BACKOFF;
    
    // Largest file a receiver accepts, declared or actually received.
    std::uint64_t max_file_size = 1ULL << 30;
    
    // Non-terminal sessions idle for longer than this are failed with
    // TIMEOUT. Zero disables the sweep.
    std::chrono::milliseconds idle_timeout{0};
    
    network::NegotiatorConfig negotiator{{"stun:stun.l.google.com:19302",
                                          "stun:stun1.l.google.com:19302"}};
    
    // Keys that were present but not a non-negative integer. Their
    // defaults are kept and validate() fails.
    std::vector<std::string> rejected_keys;
    
    static TransferOptions from_config(const core::Config& config);
    
    bool validate() const;
};

} // namespace peerdrop::transfer
