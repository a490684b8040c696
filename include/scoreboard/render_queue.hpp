#pragma once

#include "scoreboard/types.hpp"
#include <condition_variable>
#include <expected>
#include <mutex>
#include <optional>
#include <stop_token>

namespace scoreboard {

class RenderQueue;

// Reservation of one render slot; released exactly once, on destruction,
// move-assignment or release().
class RenderSlot {
public:
    RenderSlot() = default;
    RenderSlot(RenderSlot&& other) noexcept;
    RenderSlot& operator=(RenderSlot&& other) noexcept;
    ~RenderSlot();

    RenderSlot(const RenderSlot&) = delete;
    RenderSlot& operator=(const RenderSlot&) = delete;

    bool held() const { return queue_ != nullptr; }
    void release();

private:
    friend class RenderQueue;
    explicit RenderSlot(RenderQueue* queue) : queue_(queue) {}

    RenderQueue* queue_ = nullptr;
};

enum class AdmissionFailure : uint8_t {
    TimedOut,
    Cancelled,
};

// Counting admission gate bounding how many renders compose at once.
class RenderQueue {
public:
    explicit RenderQueue(int capacity = 2);

    RenderQueue(const RenderQueue&) = delete;
    RenderQueue& operator=(const RenderQueue&) = delete;

    std::expected<RenderSlot, AdmissionFailure> acquire(
        Clock::time_point deadline, std::stop_token stop = {});

    std::optional<RenderSlot> try_acquire();

    int capacity() const { return capacity_; }
    int in_use() const;

private:
    friend class RenderSlot;
    void release_one();

    const int capacity_;
    int in_use_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable_any freed_;
};

} // namespace scoreboard
