#include "peerdrop/transfer/transfer_options.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"

namespace peerdrop::transfer {

namespace {
    // Largest millisecond value that still fits std::chrono::milliseconds.
    constexpr std::uint64_t MAX_MILLISECONDS =
        static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max());
    
    std::uint64_t read_unsigned(const core::Config& config, const std::string& key,
                                std::uint64_t current, std::uint64_t limit,
                                std::vector<std::string>& rejected) {
        if (!config.get(key)) {
            return current;
        }
        
        auto value = config.get_as<std::uint64_t>(key);
        if (!value || *value > limit) {
            LOG_WARN("Ignoring invalid value '{}' for {}", *config.get(key), key);
            rejected.push_back(key);
            return current;
        }
        return *value;
    }
}

TransferOptions TransferOptions::from_config(const core::Config& config) {
    TransferOptions options;
    auto& rejected = options.rejected_keys;
    
    options.chunk_size = static_cast<std::size_t>(read_unsigned(
        config, "transfer.chunk_size", options.chunk_size, MAX_CHUNK_SIZE, rejected));
    options.high_water_chunks = static_cast<std::size_t>(read_unsigned(
        config, "transfer.buffer_high_water_chunks", options.high_water_chunks,
        std::numeric_limits<std::size_t>::max(), rejected));
    options.backoff = std::chrono::milliseconds(read_unsigned(
        config, "transfer.backoff_ms", options.backoff.count(), MAX_MILLISECONDS, rejected));
    options.max_file_size = read_unsigned(
        config, "transfer.max_file_size", options.max_file_size,
        std::numeric_limits<std::uint64_t>::max(), rejected);
    options.idle_timeout = std::chrono::milliseconds(read_unsigned(
        config, "transfer.idle_timeout_ms", options.idle_timeout.count(), MAX_MILLISECONDS, rejected));
    
    auto servers = config.get("negotiation.ice_servers");
    if (servers) {
        options.negotiator.ice_servers.clear();
        for (const auto& server : core::utils::StringUtils::split(*servers, ',')) {
            auto trimmed = core::utils::StringUtils::trim(server);
            if (!trimmed.empty()) {
                options.negotiator.ice_servers.push_back(trimmed);
            }
        }
    }
    
    return options;
}

bool TransferOptions::validate() const {
    if (!rejected_keys.empty()) {
        return false;
    }
    if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
        return false;
    }
    // The flow controller's high-water mark is chunk_size * high_water_chunks.
    if (high_water_chunks == 0 ||
        high_water_chunks > std::numeric_limits<std::size_t>::max() / chunk_size) {
        return false;
    }
    return backoff.count() > 0 && idle_timeout.count() >= 0;
}

} // namespace peerdrop::transfer
