#include "peerdrop/transfer/flow_control.hpp"
#include <algorithm>

namespace peerdrop::transfer {

FlowController::FlowController(std::size_t chunk_size,
                               std::size_t high_water_chunks,
                               std::chrono::milliseconds retry_delay)
    : high_water_mark_(chunk_size * high_water_chunks)
    , retry_delay_(retry_delay)
    , wait_count_(0)
    , peak_buffered_(0)
{
}

bool FlowController::should_wait(std::size_t buffered_amount) const {
    return buffered_amount > high_water_mark_;
}

void FlowController::on_wait() {
    wait_count_++;
}

void FlowController::on_enqueued(std::size_t buffered_amount) {
    peak_buffered_ = std::max(peak_buffered_, buffered_amount);
}

} // namespace peerdrop::transfer
