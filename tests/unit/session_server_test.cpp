#include "unit/test_support.hpp"

#include "net/frame_codec.hpp"
#include "net/session_server.hpp"

#include <nlohmann/json.hpp>

#include <memory>

using json = nlohmann::json;
using std::chrono::milliseconds;

// Responder that echoes through the sink, like a real one would.
class EchoResponder : public Responder {
public:
    void respond(const std::string& userText, SessionSink& sink, const std::atomic<bool>&) override {
        sink.sendResponse("you said: " + userText);
        sink.sendAudio("RIFF....");
        sink.sendAudioEnd();
    }
};

static SessionLoop::Options options() {
    SessionLoop::Options o;
    o.pollInterval = milliseconds(500);
    o.forceAfter = milliseconds(2000);
    return o;
}

struct ServerRig {
    ScriptedOracle oracle;
    ScriptedTranscriber stt;
    std::atomic<int> responders{0};
    SessionServer server;

    ServerRig()
        : server("127.0.0.1", 0, oracle, stt,
                 [this]() {
                     ++responders;
                     return std::unique_ptr<Responder>(std::make_unique<EchoResponder>());
                 },
                 options()) {
        server.start();
    }
};

static json readMessage(socket_t s) {
    Frame f;
    while (readFrame(s, f) == FrameStatus::Ok) {
        if (f.type == FrameType::Message) return json::parse(f.payload);
    }
    return json();
}

static void test_conversation_over_tcp() {
    ServerRig rig;
    socket_t s = connectTcp("127.0.0.1", rig.server.port());

    rig.stt.push("I can't seem to, um...");
    rig.oracle.push(0.2f, false);
    writeFrame(s, FrameType::AudioSegment, pcmFromSegment(makeSegment()));

    json m = readMessage(s);
    EXPECT_EQ(m.value("type", ""), std::string("transcription"));
    EXPECT_EQ(m.value("text", ""), std::string("I can't seem to, um..."));
    EXPECT_TRUE(m["metadata"].value("is_partial", false));

    rig.stt.push("find my keys");
    rig.oracle.push(0.9f, true);
    writeFrame(s, FrameType::AudioSegment, pcmFromSegment(makeSegment()));

    m = readMessage(s);
    EXPECT_EQ(m.value("text", ""), std::string("I can't seem to, um... find my keys"));
    EXPECT_TRUE(!m["metadata"].value("is_partial", true));

    m = readMessage(s);
    EXPECT_EQ(m.value("type", ""), std::string("response"));
    EXPECT_EQ(m.value("text", ""), std::string("you said: I can't seem to, um... find my keys"));

    Frame audio;
    EXPECT_TRUE(readFrame(s, audio) == FrameStatus::Ok);
    EXPECT_TRUE(audio.type == FrameType::AudioChunk);

    m = readMessage(s);
    EXPECT_EQ(m.value("type", ""), std::string("audio_end"));

    writeFrame(s, FrameType::Hangup, std::string());
    EXPECT_TRUE(waitFor([&] { return rig.server.activeSessions() == 0; }));
    closesock(s);
}

static void test_malformed_segment_is_ignored() {
    ServerRig rig;
    socket_t s = connectTcp("127.0.0.1", rig.server.port());

    writeFrame(s, FrameType::AudioSegment, "odd");
    rig.stt.push("still here");
    rig.oracle.push(0.9f, true);
    writeFrame(s, FrameType::AudioSegment, pcmFromSegment(makeSegment()));

    const json m = readMessage(s);
    EXPECT_EQ(m.value("text", ""), std::string("still here"));
    EXPECT_EQ(rig.oracle.calls(), 1);
    closesock(s);
}

static void test_overlong_segment_is_discarded() {
    ServerRig rig;
    socket_t s = connectTcp("127.0.0.1", rig.server.port());

    rig.stt.push("eight seconds");
    rig.oracle.push(0.9f, true);

    // 20 s of audio is dropped; the session stays open and the next in-range segment
    // is the first one transcribed.
    writeFrame(s, FrameType::AudioSegment, pcmFromSegment(makeSegment((size_t)AudioSegment::kSampleRate * 20)));
    writeFrame(s, FrameType::AudioSegment, pcmFromSegment(makeSegment(AudioSegment::kMaxSamples)));

    const json m = readMessage(s);
    EXPECT_EQ(m.value("type", ""), std::string("transcription"));
    EXPECT_EQ(m.value("text", ""), std::string("eight seconds"));
    EXPECT_EQ(rig.oracle.calls(), 1);
    EXPECT_EQ(rig.server.activeSessions(), (size_t)1);
    closesock(s);
}

static void test_sessions_are_isolated() {
    ServerRig rig;
    socket_t a = connectTcp("127.0.0.1", rig.server.port());
    socket_t b = connectTcp("127.0.0.1", rig.server.port());
    EXPECT_TRUE(waitFor([&] { return rig.server.activeSessions() == 2; }));
    EXPECT_TRUE(waitFor([&] { return rig.responders.load() == 2; }));

    rig.stt.push("alpha");
    rig.oracle.push(0.1f, false);
    writeFrame(a, FrameType::AudioSegment, pcmFromSegment(makeSegment()));
    EXPECT_EQ(readMessage(a).value("text", ""), std::string("alpha"));

    rig.stt.push("beta");
    rig.oracle.push(0.9f, true);
    writeFrame(b, FrameType::AudioSegment, pcmFromSegment(makeSegment()));
    // b's turn does not include a's buffered fragment.
    EXPECT_EQ(readMessage(b).value("text", ""), std::string("beta"));

    closesock(a);
    closesock(b);
    EXPECT_TRUE(waitFor([&] { return rig.server.activeSessions() == 0; }));
}

static void test_oversized_frame_closes_session() {
    ServerRig rig;
    socket_t s = connectTcp("127.0.0.1", rig.server.port());

    const char header[5] = {0x01, 0x10, 0, 0, 0};
    sendAll(s, header, sizeof(header));

    const json m = readMessage(s);
    EXPECT_EQ(m.value("type", ""), std::string("error"));
    EXPECT_TRUE(waitFor([&] { return rig.server.activeSessions() == 0; }));

    Frame f;
    EXPECT_TRUE(readFrame(s, f) == FrameStatus::Closed);
    closesock(s);
}

int main() {
    runTest("conversation over tcp", test_conversation_over_tcp);
    runTest("malformed segment is ignored", test_malformed_segment_is_ignored);
    runTest("overlong segment is discarded", test_overlong_segment_is_discarded);
    runTest("sessions are isolated", test_sessions_are_isolated);
    runTest("oversized frame closes session", test_oversized_frame_closes_session);
    return testSummary();
}
