#include "turn/turn_controller.hpp"

#include "core/logging.hpp"

#include <cstdio>
#include <exception>
#include <future>

static const char* kTag = "Turn Controller";

const char* toString(TurnController::State state) {
    switch (state) {
        case TurnController::State::Idle: return "IDLE";
        case TurnController::State::Buffering: return "BUFFERING";
        case TurnController::State::Flushing: return "FLUSHING";
    }
    return "?";
}

// Constructor
TurnController::TurnController(TurnOracle& oracle, Transcriber& transcriber, Responder& responder, SessionSink& sink)
    : oracle_(oracle), transcriber_(transcriber), responder_(responder), sink_(sink) {}

void TurnController::onSegment(const AudioSegment& segment) {
    try {
        processSegment(segment);
    } catch (const std::exception& e) {
        logging::error(kTag, std::string("segment dropped: ") + e.what());
    }
}

void TurnController::processSegment(const AudioSegment& segment) {
    if (cancelled_.load()) return;
    if (segment.empty()) {
        logging::debug(kTag, "empty segment discarded");
        return;
    }

    // Oracle and transcriber run side by side; both must finish before the buffer is touched.
    std::future<EotVerdict> pending = std::async(std::launch::async, [this, &segment] {
        return oracle_.evaluate(segment);
    });

    std::string text;
    bool transcribed = true;
    try {
        text = transcriber_.transcribe(segment);
    } catch (const std::exception& e) {
        logging::warn(kTag, std::string("transcription failed, segment dropped: ") + e.what());
        transcribed = false;
    }

    EotVerdict verdict;
    try {
        verdict = pending.get();
    } catch (const std::exception& e) {
        logging::error(kTag, std::string("oracle threw, treating turn as complete: ") + e.what());
        verdict = EotVerdict{};
    }

    if (cancelled_.load()) {
        logging::debug(kTag, "session cancelled, late segment result discarded");
        return;
    }
    if (!transcribed) return;

    std::string buffered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!buffer_.append(text, Clock::now())) {
            logging::debug(kTag, "no speech in segment, state unchanged");
            return;
        }
        if (state_ == State::Idle) state_ = State::Buffering;
        buffered = buffer_.peek();
    }

    char prob[32];
    std::snprintf(prob, sizeof(prob), "%.3f", verdict.probability);

    if (!verdict.isComplete) {
        logging::info(kTag, std::string("partial (eot=") + prob + "): " + buffered);
        sink_.sendTranscription(buffered, verdict.probability, true);
        return;
    }

    flush(verdict.probability, "end of turn");
}

bool TurnController::flushIfStale(Clock::time_point now, Clock::duration timeout) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Buffering || !buffer_.isStale(now, timeout)) return false;
    }
    return flush(1.0f, "timeout");
}

bool TurnController::flush(float probability, const char* reason) {
    std::string text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!buffer_.isActive()) return false;
        text = buffer_.peek();
        // Cleared before dispatch so a responder failure can never replay the same turn.
        buffer_.clear();
        state_ = State::Flushing;
    }

    logging::info(kTag, std::string("turn finalized (") + reason + "): " + text);

    if (!cancelled_.load()) {
        sink_.sendTranscription(text, probability, false);
        try {
            responder_.respond(text, sink_, cancelled_);
        } catch (const std::exception& e) {
            logging::error(kTag, std::string("responder failed: ") + e.what());
            sink_.sendError(std::string("response failed: ") + e.what());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::Idle;
    return true;
}

void TurnController::discard() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffer_.isActive()) {
        logging::info(kTag, "session closed, discarding buffered text: " + buffer_.peek());
    }
    buffer_.clear();
    if (state_ == State::Buffering) state_ = State::Idle;
}

TurnController::State TurnController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string TurnController::bufferedText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.peek();
}

bool TurnController::bufferActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.isActive();
}

bool TurnController::nextStaleDeadline(Clock::duration timeout, Clock::time_point& deadline) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Buffering || !buffer_.isActive()) return false;
    deadline = buffer_.staleAt(timeout);
    return true;
}
