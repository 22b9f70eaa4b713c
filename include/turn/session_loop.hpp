#ifndef SESSION_LOOP_HPP
#define SESSION_LOOP_HPP

#include "turn/segment_queue.hpp"
#include "turn/turn_controller.hpp"

#include <atomic>
#include <chrono>

// Duty cycle of one session: takes queued segments in arrival order and, between them,
// forces a flush once the buffered turn has gone quiet for `forceAfter`.
class SessionLoop {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        Clock::duration pollInterval = std::chrono::seconds(1);
        Clock::duration forceAfter = std::chrono::seconds(2);
        size_t queueDepth = 4;
    };

    SessionLoop(TurnController& controller, Options options);

    // Called from the transport thread.
    SegmentQueue::PushResult submit(AudioSegment segment);

    // Blocks until stop(). Discards whatever is still buffered on the way out.
    void run();

    // Disconnect: cancels in-flight work and wakes run().
    void stop();

    bool running() const { return running_.load(); }
    size_t pending() const { return queue_.size(); }

private:
    TurnController& controller_;
    Options options_;
    SegmentQueue queue_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
};

#endif
