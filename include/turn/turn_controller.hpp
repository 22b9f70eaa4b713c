#ifndef TURN_CONTROLLER_HPP
#define TURN_CONTROLLER_HPP

#include "audio/audio_segment.hpp"
#include "eot/turn_oracle.hpp"
#include "respond/responder.hpp"
#include "stt/transcriber.hpp"
#include "turn/session_sink.hpp"
#include "turn/turn_buffer.hpp"

#include <atomic>
#include <mutex>
#include <string>

// Per-session turn state: Idle -> Buffering -> Flushing -> Idle.
// Oracle and transcriber run concurrently per segment; a complete verdict or a stale
// buffer flushes the turn to the responder. Collaborator failures never escape.
class TurnController {
public:
    enum class State { Idle, Buffering, Flushing };
    using Clock = TurnBuffer::Clock;

    TurnController(TurnOracle& oracle, Transcriber& transcriber, Responder& responder, SessionSink& sink);

    TurnController(const TurnController&) = delete;
    TurnController& operator=(const TurnController&) = delete;

    void onSegment(const AudioSegment& segment);

    // Flushes the buffered turn if nothing was appended for longer than `timeout`.
    // Returns true if a flush happened.
    bool flushIfStale(Clock::time_point now, Clock::duration timeout);

    // Session teardown: drops buffered text without dispatching it.
    void discard();

    // Abandons in-flight work; results arriving afterwards are dropped.
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

    State state() const;
    std::string bufferedText() const;
    bool bufferActive() const;

    // False when there is nothing buffered.
    bool nextStaleDeadline(Clock::duration timeout, Clock::time_point& deadline) const;

private:
    void processSegment(const AudioSegment& segment);
    bool flush(float probability, const char* reason);

    TurnOracle& oracle_;
    Transcriber& transcriber_;
    Responder& responder_;
    SessionSink& sink_;

    mutable std::mutex mutex_;
    TurnBuffer buffer_;
    State state_ = State::Idle;

    std::atomic<bool> cancelled_{false};
};

const char* toString(TurnController::State state);

#endif
