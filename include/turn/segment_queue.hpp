#ifndef SEGMENT_QUEUE_HPP
#define SEGMENT_QUEUE_HPP

#include "audio/audio_segment.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Bounded FIFO between a session's transport reader and its loop thread.
// Queued segments are never dropped; a full queue rejects the newcomer.
class SegmentQueue {
public:
    explicit SegmentQueue(size_t maxDepth = 4) : maxDepth_(maxDepth) {}

    enum class PushResult { Queued, Full, Stopped };

    PushResult push(AudioSegment&& segment) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return PushResult::Stopped;
        if (queue_.size() >= maxDepth_) return PushResult::Full;

        queue_.push_back(std::move(segment));
        cv_.notify_one();
        return PushResult::Queued;
    }

    // Waits until a segment arrives, the deadline passes or stop() is called.
    // Returns true only when a segment was taken.
    bool popUntil(AudioSegment& out, std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return !queue_.empty() || stopped_; });
        if (stopped_ || queue_.empty()) return false;

        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        queue_.clear();
        cv_.notify_all();
    }

    bool stopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t maxDepth() const { return maxDepth_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AudioSegment> queue_;
    const size_t maxDepth_;
    bool stopped_ = false;
};

#endif
