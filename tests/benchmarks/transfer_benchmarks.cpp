#include <benchmark/benchmark.h>
#include "peerdrop/transfer/chunk_codec.hpp"
#include "peerdrop/transfer/transfer_coordinator.hpp"
#include "peerdrop/network/control_frame.hpp"
#include "peerdrop/network/loopback.hpp"
#include "peerdrop/network/signaling.hpp"
#include "peerdrop/core/logger.hpp"
#include <random>

using namespace peerdrop::transfer;
using namespace peerdrop::network;
using peerdrop::storage::FileBlob;
using peerdrop::storage::FileMetadata;

namespace {
    std::vector<std::uint8_t> random_bytes(std::size_t size) {
        std::vector<std::uint8_t> data(size);
        std::mt19937 gen(42);
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& byte : data) {
            byte = static_cast<std::uint8_t>(dist(gen));
        }
        return data;
    }
}

static void BM_ChunkSplit(benchmark::State& state) {
    auto data = random_bytes(state.range(0));
    ChunkCodec codec;
    
    for (auto _ : state) {
        std::size_t total = 0;
        for (auto chunk : codec.split(data)) {
            total += chunk.size();
        }
        benchmark::DoNotOptimize(total);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkSplit)->Range(1024, 16*1024*1024);

static void BM_ChunkAssemble(benchmark::State& state) {
    auto data = random_bytes(state.range(0));
    ChunkCodec codec;
    
    std::vector<std::vector<std::uint8_t>> chunks;
    for (auto chunk : codec.split(data)) {
        chunks.emplace_back(chunk.begin(), chunk.end());
    }
    
    for (auto _ : state) {
        auto assembled = ChunkCodec::assemble(chunks);
        benchmark::DoNotOptimize(assembled);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkAssemble)->Range(1024, 16*1024*1024);

static void BM_MetadataFrameEncode(benchmark::State& state) {
    MetadataFrame frame{FileMetadata("quarterly-report-final.pdf", 52428800, "application/pdf")};
    
    for (auto _ : state) {
        auto text = encode_control_frame(frame);
        benchmark::DoNotOptimize(text);
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MetadataFrameEncode);

static void BM_MetadataFrameDecode(benchmark::State& state) {
    auto text = encode_control_frame(MetadataFrame{FileMetadata("quarterly-report-final.pdf", 52428800,
                                                                "application/pdf")});
    
    for (auto _ : state) {
        auto frame = decode_control_frame(text);
        benchmark::DoNotOptimize(frame);
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MetadataFrameDecode);

static void BM_SignalRoundTrip(benchmark::State& state) {
    OfferSignal offer{SessionDescription{"offer", std::string(400, 'x')},
                      FileMetadata("photo.jpg", 4194304, "image/jpeg")};
    
    for (auto _ : state) {
        auto decoded = decode_signal(encode_signal(offer));
        benchmark::DoNotOptimize(decoded);
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SignalRoundTrip);

// Whole transfer between two coordinators over the loopback network
static void BM_LoopbackTransfer(benchmark::State& state) {
    peerdrop::core::Logger::initialize("benchmark.log", peerdrop::core::LogLevel::Warn);
    auto data = random_bytes(state.range(0));
    
    TransferOptions options;
    options.backoff = std::chrono::milliseconds(1);
    
    for (auto _ : state) {
        boost::asio::io_context io_context;
        auto hub = std::make_shared<LoopbackSignalingHub>(io_context);
        auto network = std::make_shared<LoopbackNetwork>(io_context);
        auto negotiator = std::make_shared<LoopbackNegotiator>(network);
        
        bool done = false;
        TransferCallbacks receiver_callbacks;
        receiver_callbacks.on_complete = [&](const FileBlob&, const std::string&, const std::string&) {
            done = true;
        };
        receiver_callbacks.on_error = [&](const std::string&, const TransferResult&) {
            done = true;
        };
        
        auto sender = TransferCoordinator::create(io_context, hub->create_endpoint("sender"),
                                                  negotiator, TransferCallbacks(), options);
        auto receiver = TransferCoordinator::create(io_context, hub->create_endpoint("receiver"),
                                                    negotiator, receiver_callbacks, options);
        
        sender->send_file("receiver", FileBlob("bench.bin", "", data));
        while (!done) {
            io_context.restart();
            io_context.run_for(std::chrono::milliseconds(1));
        }
        
        sender->destroy();
        receiver->destroy();
        io_context.restart();
        io_context.poll();
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
    peerdrop::core::Logger::shutdown();
}
BENCHMARK(BM_LoopbackTransfer)->Range(64*1024, 8*1024*1024)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
