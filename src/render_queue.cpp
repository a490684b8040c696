#include "scoreboard/render_queue.hpp"
#include <algorithm>

namespace scoreboard {

RenderSlot::RenderSlot(RenderSlot&& other) noexcept : queue_(other.queue_) {
    other.queue_ = nullptr;
}

RenderSlot& RenderSlot::operator=(RenderSlot&& other) noexcept {
    if (this != &other) {
        release();
        queue_ = other.queue_;
        other.queue_ = nullptr;
    }
    return *this;
}

RenderSlot::~RenderSlot() {
    release();
}

void RenderSlot::release() {
    if (queue_) {
        queue_->release_one();
        queue_ = nullptr;
    }
}

RenderQueue::RenderQueue(int capacity) : capacity_(std::max(capacity, 1)) {}

std::expected<RenderSlot, AdmissionFailure> RenderQueue::acquire(
    Clock::time_point deadline, std::stop_token stop) {

    std::unique_lock lock(mutex_);
    bool admitted = freed_.wait_until(lock, stop, deadline,
                                      [this] { return in_use_ < capacity_; });
    if (!admitted) {
        return std::unexpected(stop.stop_requested() ? AdmissionFailure::Cancelled
                                                     : AdmissionFailure::TimedOut);
    }

    ++in_use_;
    return RenderSlot(this);
}

std::optional<RenderSlot> RenderQueue::try_acquire() {
    std::lock_guard lock(mutex_);
    if (in_use_ >= capacity_) return std::nullopt;
    ++in_use_;
    return RenderSlot(this);
}

int RenderQueue::in_use() const {
    std::lock_guard lock(mutex_);
    return in_use_;
}

void RenderQueue::release_one() {
    {
        std::lock_guard lock(mutex_);
        --in_use_;
    }
    freed_.notify_one();
}

} // namespace scoreboard
