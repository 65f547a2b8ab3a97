#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <vector>

namespace peerdrop::transfer {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 16384;
constexpr std::size_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

// Lazy view of a byte buffer as consecutive slices of at most chunk_size
// bytes. Nothing is copied; the viewed buffer must outlive the sequence.
class ChunkSequence {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::span<const std::uint8_t>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = value_type;
        
        iterator() = default;
        iterator(const ChunkSequence* sequence, std::size_t index)
            : sequence_(sequence), index_(index) {}
        
        value_type operator*() const { return sequence_->chunk_at(index_); }
        iterator& operator++() { ++index_; return *this; }
        iterator operator++(int) { auto copy = *this; ++index_; return copy; }
        
        bool operator==(const iterator& other) const {
            return sequence_ == other.sequence_ && index_ == other.index_;
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }
        
    private:
        const ChunkSequence* sequence_ = nullptr;
        std::size_t index_ = 0;
    };
    
    ChunkSequence(std::span<const std::uint8_t> bytes, std::size_t chunk_size);
    
    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, count_); }
    
    std::size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    std::size_t chunk_size() const { return chunk_size_; }
    
    std::span<const std::uint8_t> chunk_at(std::size_t index) const;
    
private:
    std::span<const std::uint8_t> bytes_;
    std::size_t chunk_size_;
    std::size_t count_;
};

class ChunkCodec {
public:
    explicit ChunkCodec(std::size_t chunk_size = DEFAULT_CHUNK_SIZE);
    
    std::size_t get_chunk_size() const { return chunk_size_; }
    
    ChunkSequence split(std::span<const std::uint8_t> bytes) const;
    std::size_t chunk_count(std::uint64_t total_bytes) const;
    
    static std::vector<std::uint8_t> assemble(const std::vector<std::vector<std::uint8_t>>& chunks);
    
private:
    std::size_t chunk_size_;
};

} // namespace peerdrop::transfer
