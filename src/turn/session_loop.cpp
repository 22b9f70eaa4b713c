#include "turn/session_loop.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <string>
#include <utility>

static const char* kTag = "Session Loop";

// Constructor
SessionLoop::SessionLoop(TurnController& controller, Options options)
    : controller_(controller), options_(options), queue_(options.queueDepth) {}

SegmentQueue::PushResult SessionLoop::submit(AudioSegment segment) {
    const SegmentQueue::PushResult r = queue_.push(std::move(segment));
    if (r == SegmentQueue::PushResult::Full) {
        logging::warn(kTag, "segment queue full (" + std::to_string(queue_.maxDepth()) + "), segment rejected");
    }
    return r;
}

void SessionLoop::run() {
    running_.store(true);

    Clock::time_point nextPoll = Clock::now() + options_.pollInterval;

    while (!stopping_.load()) {
        const Clock::time_point now = Clock::now();

        if (now >= nextPoll) {
            controller_.flushIfStale(now, options_.forceAfter);
            nextPoll = Clock::now() + options_.pollInterval;
            continue;
        }

        // Wake no later than the next poll tick, or just past the moment the buffer goes stale.
        Clock::time_point wakeAt = nextPoll;
        Clock::time_point staleAt;
        if (controller_.nextStaleDeadline(options_.forceAfter, staleAt)) {
            wakeAt = std::min(wakeAt, staleAt + std::chrono::milliseconds(1));
        }

        AudioSegment segment;
        if (queue_.popUntil(segment, wakeAt)) {
            controller_.onSegment(segment);
        } else if (Clock::now() >= wakeAt) {
            nextPoll = std::min(nextPoll, wakeAt);
        }
    }

    controller_.discard();
    running_.store(false);
}

void SessionLoop::stop() {
    if (stopping_.exchange(true)) return;
    controller_.cancel();
    queue_.stop();
}
