#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace peerdrop::transfer {

constexpr std::size_t DEFAULT_HIGH_WATER_CHUNKS = 10;
constexpr std::chrono::milliseconds DEFAULT_BACKOFF{100};

// Sender-side backpressure against the channel's own send buffer. The
// sender asks before every enqueue; when the channel holds more than the
// high-water mark it waits get_retry_delay() and asks again. There is no
// signal from the receiver.
class FlowController {
public:
    FlowController(std::size_t chunk_size,
                   std::size_t high_water_chunks = DEFAULT_HIGH_WATER_CHUNKS,
                   std::chrono::milliseconds retry_delay = DEFAULT_BACKOFF);
    
    bool should_wait(std::size_t buffered_amount) const;
    
    void on_wait();
    void on_enqueued(std::size_t buffered_amount);
    
    std::size_t get_high_water_mark() const { return high_water_mark_; }
    std::chrono::milliseconds get_retry_delay() const { return retry_delay_; }
    
    std::uint32_t get_wait_count() const { return wait_count_; }
    std::size_t get_peak_buffered() const { return peak_buffered_; }
    
private:
    std::size_t high_water_mark_;
    std::chrono::milliseconds retry_delay_;
    
    std::uint32_t wait_count_;
    std::size_t peak_buffered_;
};

} // namespace peerdrop::transfer
