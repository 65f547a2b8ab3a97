#include "peerdrop/transfer/chunk_codec.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerdrop::transfer {

ChunkSequence::ChunkSequence(std::span<const std::uint8_t> bytes, std::size_t chunk_size)
    : bytes_(bytes)
    , chunk_size_(chunk_size)
    , count_(0)
{
    if (chunk_size_ == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }
    count_ = bytes_.size() / chunk_size_ + (bytes_.size() % chunk_size_ != 0 ? 1 : 0);
}

std::span<const std::uint8_t> ChunkSequence::chunk_at(std::size_t index) const {
    if (index >= count_) {
        throw std::out_of_range("Chunk index out of range");
    }
    
    std::size_t offset = index * chunk_size_;
    std::size_t length = std::min(chunk_size_, bytes_.size() - offset);
    return bytes_.subspan(offset, length);
}

ChunkCodec::ChunkCodec(std::size_t chunk_size) : chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }
}

ChunkSequence ChunkCodec::split(std::span<const std::uint8_t> bytes) const {
    return ChunkSequence(bytes, chunk_size_);
}

std::size_t ChunkCodec::chunk_count(std::uint64_t total_bytes) const {
    return static_cast<std::size_t>(total_bytes / chunk_size_ + (total_bytes % chunk_size_ != 0 ? 1 : 0));
}

std::vector<std::uint8_t> ChunkCodec::assemble(const std::vector<std::vector<std::uint8_t>>& chunks) {
    std::size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size();
    }
    
    std::vector<std::uint8_t> result;
    result.reserve(total);
    for (const auto& chunk : chunks) {
        result.insert(result.end(), chunk.begin(), chunk.end());
    }
    
    return result;
}

} // namespace peerdrop::transfer
