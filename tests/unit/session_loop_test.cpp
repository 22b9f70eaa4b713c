#include "unit/test_support.hpp"

#include "turn/session_loop.hpp"

using std::chrono::milliseconds;

struct LoopRig {
    ScriptedOracle oracle;
    ScriptedTranscriber stt;
    RecordingResponder responder;
    RecordingSink sink;
    TurnController controller{oracle, stt, responder, sink};
    SessionLoop loop;
    std::thread thread;

    explicit LoopRig(SessionLoop::Options options) : loop(controller, options) {
        thread = std::thread([this] { loop.run(); });
    }

    ~LoopRig() {
        loop.stop();
        if (thread.joinable()) thread.join();
    }

    SegmentQueue::PushResult say(const std::string& text, float prob, bool complete) {
        stt.push(text);
        oracle.push(prob, complete);
        return loop.submit(makeSegment());
    }
};

static SessionLoop::Options fastOptions() {
    SessionLoop::Options o;
    o.pollInterval = milliseconds(100);
    o.forceAfter = milliseconds(300);
    o.queueDepth = 4;
    return o;
}

// Scenario C
static void test_forced_flush_without_new_audio() {
    LoopRig r(fastOptions());
    const auto start = std::chrono::steady_clock::now();
    r.say("I need...", 0.1f, false);

    EXPECT_TRUE(waitFor([&] { return r.sink.count("transcription") == 1; }));
    EXPECT_TRUE(r.responder.turns().empty());

    // force-after + 0.1 s
    EXPECT_TRUE(waitFor([&] { return r.responder.turns().size() == 1; }, milliseconds(400)));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(elapsed >= milliseconds(300));

    auto turns = r.responder.turns();
    if (!turns.empty()) EXPECT_EQ(turns[0], std::string("I need..."));
    EXPECT_TRUE(waitFor([&] { return !r.controller.bufferActive(); }));
    EXPECT_TRUE(r.controller.state() == TurnController::State::Idle);
}

// Default timing: a 1 s poll tick must not delay the 2 s forced flush to 3 s.
static void test_forced_flush_is_not_quantized_to_poll() {
    SessionLoop::Options o;
    o.pollInterval = milliseconds(1000);
    o.forceAfter = milliseconds(2000);
    LoopRig r(o);

    r.say("hold on", 0.1f, false);
    EXPECT_TRUE(waitFor([&] { return r.sink.count("transcription") == 1; }));
    EXPECT_TRUE(waitFor([&] { return r.responder.turns().size() == 1; }, milliseconds(2500)));
}

static void test_continuing_speech_postpones_flush() {
    LoopRig r(fastOptions());
    r.say("so", 0.1f, false);
    std::this_thread::sleep_for(milliseconds(200));
    r.say("what I was", 0.1f, false);
    std::this_thread::sleep_for(milliseconds(200));
    EXPECT_TRUE(r.responder.turns().empty());

    r.say("saying", 0.9f, true);
    EXPECT_TRUE(waitFor([&] { return r.responder.turns().size() == 1; }));
    auto turns = r.responder.turns();
    if (!turns.empty()) EXPECT_EQ(turns[0], std::string("so what I was saying"));
}

static void test_segments_during_flush_keep_order() {
    LoopRig r(fastOptions());
    r.responder.setDelay(milliseconds(200));

    r.say("first turn", 0.9f, true);
    EXPECT_TRUE(waitFor([&] { return r.controller.state() == TurnController::State::Flushing; }));

    EXPECT_TRUE(r.say("second", 0.1f, false) == SegmentQueue::PushResult::Queued);
    EXPECT_TRUE(r.say("turn", 0.9f, true) == SegmentQueue::PushResult::Queued);

    EXPECT_TRUE(waitFor([&] { return r.responder.turns().size() == 2; }));
    auto turns = r.responder.turns();
    if (turns.size() == 2) {
        EXPECT_EQ(turns[0], std::string("first turn"));
        EXPECT_EQ(turns[1], std::string("second turn"));
    }
}

static void test_full_queue_rejects_newcomer() {
    SessionLoop::Options o = fastOptions();
    o.queueDepth = 2;
    LoopRig r(o);
    r.responder.setDelay(milliseconds(300));

    r.say("busy", 0.9f, true);
    EXPECT_TRUE(waitFor([&] { return r.controller.state() == TurnController::State::Flushing; }));

    EXPECT_TRUE(r.say("a", 0.1f, false) == SegmentQueue::PushResult::Queued);
    EXPECT_TRUE(r.say("b", 0.1f, false) == SegmentQueue::PushResult::Queued);
    EXPECT_TRUE(r.loop.submit(makeSegment()) == SegmentQueue::PushResult::Full);
}

static void test_disconnect_discards_buffered_text() {
    LoopRig r(fastOptions());
    r.say("never mind", 0.1f, false);
    EXPECT_TRUE(waitFor([&] { return r.controller.bufferActive(); }));

    r.loop.stop();
    r.thread.join();

    EXPECT_TRUE(!r.loop.running());
    EXPECT_TRUE(!r.controller.bufferActive());
    EXPECT_TRUE(r.responder.turns().empty());
    EXPECT_TRUE(r.loop.submit(makeSegment()) == SegmentQueue::PushResult::Stopped);
}

int main() {
    runTest("scenario C: forced flush without new audio", test_forced_flush_without_new_audio);
    runTest("forced flush is not quantized to poll", test_forced_flush_is_not_quantized_to_poll);
    runTest("continuing speech postpones flush", test_continuing_speech_postpones_flush);
    runTest("segments during flush keep order", test_segments_during_flush_keep_order);
    runTest("full queue rejects newcomer", test_full_queue_rejects_newcomer);
    runTest("disconnect discards buffered text", test_disconnect_discards_buffered_text);
    return testSummary();
}
