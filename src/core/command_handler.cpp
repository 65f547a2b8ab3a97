#include "peerdrop/core/command_handler.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/network/control_frame.hpp"
#include "peerdrop/network/loopback.hpp"
#include "peerdrop/storage/file_metadata.hpp"
#include "peerdrop/transfer/chunk_codec.hpp"
#include "peerdrop/transfer/transfer_coordinator.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>

namespace peerdrop::core {

namespace {
    const std::string SENDER_ID = "local-sender";
    const std::string RECEIVER_ID = "local-receiver";
}

// SendCommandHandler Implementation
SendCommandHandler::SendCommandHandler(std::chrono::seconds timeout)
    : timeout_(timeout) {
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    if (!utils::FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    auto options = transfer::TransferOptions::from_config(Config::instance());
    if (!options.validate()) {
        return CommandResult::error("Invalid transfer configuration");
    }
    
    auto blob = storage::FileBlob::load(file_path);
    if (!blob) {
        return CommandResult::error("Failed to read file: " + file_path.string());
    }
    if (blob->size() > options.max_file_size) {
        return CommandResult::error("File exceeds transfer.max_file_size (" +
                                    utils::StringUtils::format_bytes(options.max_file_size) + ")");
    }
    
    std::cout << "Sending " << blob->name << " (" << utils::StringUtils::format_bytes(blob->size())
              << ", " << transfer::ChunkCodec(options.chunk_size).chunk_count(blob->size())
              << " chunks)\n";
    
    try {
        boost::asio::io_context io_context;
        auto hub = std::make_shared<network::LoopbackSignalingHub>(io_context);
        auto network = std::make_shared<network::LoopbackNetwork>(io_context);
        auto negotiator = std::make_shared<network::LoopbackNegotiator>(network);
        
        std::mutex result_mutex;
        std::optional<storage::FileBlob> received;
        std::optional<transfer::TransferResult> failure;
        std::atomic<bool> finished{false};
        
        transfer::TransferCallbacks sender_callbacks;
        sender_callbacks.on_progress = [](std::uint64_t bytes, std::uint64_t total) {
            auto percent = total > 0 ? bytes * 100 / total : 100;
            std::cout << "\r  sent " << utils::StringUtils::format_bytes(bytes) << " / "
                      << utils::StringUtils::format_bytes(total) << " (" << percent << "%)" << std::flush;
        };
        sender_callbacks.on_error = [&](const transfer::PeerId& peer_id, const transfer::TransferResult& error) {
            std::lock_guard<std::mutex> lock(result_mutex);
            LOG_ERROR("Sender error for {}: {}", peer_id, error.message);
            failure = error;
            finished = true;
        };
        
        transfer::TransferCallbacks receiver_callbacks;
        receiver_callbacks.on_complete = [&](const storage::FileBlob& file, const std::string& file_name,
                                             const transfer::PeerId& peer_id) {
            std::lock_guard<std::mutex> lock(result_mutex);
            LOG_INFO("Received {} from {}", file_name, peer_id);
            received = file;
            finished = true;
        };
        receiver_callbacks.on_error = [&](const transfer::PeerId& peer_id, const transfer::TransferResult& error) {
            std::lock_guard<std::mutex> lock(result_mutex);
            LOG_ERROR("Receiver error for {}: {}", peer_id, error.message);
            failure = error;
            finished = true;
        };
        receiver_callbacks.on_connection_state_change = [](const transfer::PeerId& peer_id,
                                                           network::ConnectionState state) {
            LOG_DEBUG("Receiver sees {} as {}", peer_id, network::to_string(state));
        };
        
        auto sender = transfer::TransferCoordinator::create(io_context, hub->create_endpoint(SENDER_ID),
                                                            negotiator, sender_callbacks, options);
        auto receiver = transfer::TransferCoordinator::create(io_context, hub->create_endpoint(RECEIVER_ID),
                                                              negotiator, receiver_callbacks, options);
        
        auto offer_sent = sender->send_file(RECEIVER_ID, std::move(*blob));
        
        auto deadline = std::chrono::steady_clock::now() + timeout_;
        while (std::chrono::steady_clock::now() < deadline) {
            if (finished && sender->registry().size() == 0 && receiver->registry().size() == 0) {
                break;
            }
            io_context.restart();
            io_context.run_for(std::chrono::milliseconds(50));
        }
        std::cout << "\n";
        
        auto offer_result = offer_sent.get();
        
        sender->destroy();
        receiver->destroy();
        io_context.restart();
        io_context.poll();
        
        if (!offer_result) {
            return CommandResult::error("Offer failed: " + offer_result.message);
        }
        
        std::lock_guard<std::mutex> lock(result_mutex);
        if (failure) {
            return CommandResult::error(std::string(transfer::to_string(failure->error)) + ": " + failure->message);
        }
        if (!received) {
            return CommandResult::error("Transfer timed out after " + std::to_string(timeout_.count()) + "s");
        }
        
        std::cout << "✓ Received " << received->name << " (" << utils::StringUtils::format_bytes(received->size());
        if (!received->content_type.empty()) {
            std::cout << ", " << received->content_type;
        }
        std::cout << ")\n";
        
        if (args.size() >= 3) {
            std::ofstream out(args[2], std::ios::binary);
            if (!out) {
                return CommandResult::error("Cannot write " + args[2]);
            }
            out.write(reinterpret_cast<const char*>(received->data.data()),
                      static_cast<std::streamsize>(received->data.size()));
            if (!out) {
                return CommandResult::error("Failed writing " + args[2]);
            }
            std::cout << "  Written to " << args[2] << "\n";
        }
        
        return CommandResult::ok("Transfer complete");
        
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// ChunksCommandHandler Implementation
CommandResult ChunksCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    auto blob = storage::FileBlob::load(file_path);
    if (!blob) {
        return CommandResult::error("Failed to read file: " + file_path.string());
    }
    
    auto options = transfer::TransferOptions::from_config(Config::instance());
    if (!options.validate()) {
        return CommandResult::error("Invalid transfer options; transfer.chunk_size must be between 1 and " +
                                    std::to_string(transfer::MAX_CHUNK_SIZE));
    }
    
    transfer::ChunkCodec codec(options.chunk_size);
    auto chunks = codec.split(blob->data);
    
    std::cout << network::encode_control_frame(network::MetadataFrame{blob->metadata()}) << "\n";
    
    std::size_t index = 0;
    for (auto chunk : chunks) {
        std::cout << "  chunk " << index++ << ": " << chunk.size() << " bytes\n";
    }
    
    std::cout << network::encode_control_frame(network::EndFrame{}) << "\n";
    std::cout << chunks.size() << " chunks of at most " << codec.get_chunk_size() << " bytes\n";
    
    return CommandResult::ok();
}

// ConfigCommandHandler Implementation
CommandResult ConfigCommandHandler::execute(const std::vector<std::string>& args) {
    auto& config = Config::instance();
    
    if (args.size() >= 2) {
        if (!config.save_to_file(args[1])) {
            return CommandResult::error("Failed to write configuration to " + args[1]);
        }
        std::cout << "Configuration written to " << args[1] << "\n";
        return CommandResult::ok();
    }
    
    for (const auto& [key, value] : config.get_all()) {
        std::cout << key << " = " << value << "\n";
    }
    
    auto options = transfer::TransferOptions::from_config(config);
    if (!options.validate()) {
        return CommandResult::error("Configuration is not valid for transfers");
    }
    return CommandResult::ok();
}

}
