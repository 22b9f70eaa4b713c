#include "unit/test_support.hpp"
#include "unit/fake_http_server.hpp"

#include "net/http_client.hpp"
#include "respond/chat_responder.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static ChatResponder::Config configFor(const FakeHttpServer& llm) {
    ChatResponder::Config cfg;
    cfg.llmEndpoint = llm.url("/v1/chat/completions");
    cfg.model = "test-model";
    cfg.apiKey = "secret";
    cfg.systemPrompt = "Be brief.";
    cfg.timeoutMs = 2000;
    return cfg;
}

static const char* kReply = R"({"choices":[{"message":{"role":"assistant","content":"It is sunny."}}]})";

static void test_reply_is_sent_and_remembered() {
    FakeHttpServer llm;
    llm.respondWith(200, kReply);

    ChatResponder responder(configFor(llm));
    RecordingSink sink;
    std::atomic<bool> cancelled{false};
    responder.respond("What's the weather today?", sink, cancelled);

    const auto notes = sink.notes();
    EXPECT_EQ(notes.size(), (size_t)1);
    if (!notes.empty()) {
        EXPECT_EQ(notes[0].kind, std::string("response"));
        EXPECT_EQ(notes[0].text, std::string("It is sunny."));
    }

    const auto reqs = llm.requests();
    EXPECT_EQ(reqs.size(), (size_t)1);
    if (!reqs.empty()) {
        EXPECT_TRUE(reqs[0].headers.find("Authorization: Bearer secret") != std::string::npos);
        const json body = json::parse(reqs[0].body);
        EXPECT_EQ(body["model"].get<std::string>(), std::string("test-model"));
        EXPECT_EQ(body["messages"].size(), (size_t)2);
        EXPECT_EQ(body["messages"][0]["role"].get<std::string>(), std::string("system"));
        EXPECT_EQ(body["messages"][1]["content"].get<std::string>(), std::string("What's the weather today?"));
    }

    EXPECT_EQ(responder.history().size(), (size_t)2);
}

static void test_history_feeds_next_request() {
    FakeHttpServer llm;
    llm.respondWith(200, kReply);
    ChatResponder responder(configFor(llm));

    const json first = json::parse(responder.buildChatRequest("hi"));
    EXPECT_EQ(first["messages"].size(), (size_t)2);

    RecordingSink sink;
    std::atomic<bool> cancelled{false};
    responder.respond("hi", sink, cancelled);

    const json second = json::parse(responder.buildChatRequest("and tomorrow?"));
    EXPECT_EQ(second["messages"].size(), (size_t)4);
    EXPECT_EQ(second["messages"][2]["role"].get<std::string>(), std::string("assistant"));
}

static void test_history_is_bounded() {
    FakeHttpServer llm;
    llm.respondWith(200, kReply);
    ChatResponder::Config cfg = configFor(llm);
    cfg.maxHistoryTurns = 2;
    ChatResponder responder(cfg);

    RecordingSink sink;
    std::atomic<bool> cancelled{false};
    for (int i = 0; i < 5; ++i) responder.respond("turn " + std::to_string(i), sink, cancelled);

    EXPECT_EQ(responder.history().size(), (size_t)4);
    EXPECT_EQ(responder.history().front().content, std::string("turn 3"));
}

static void test_llm_failure_throws() {
    FakeHttpServer llm;
    llm.respondWith(503, "overloaded");
    ChatResponder responder(configFor(llm));
    RecordingSink sink;
    std::atomic<bool> cancelled{false};

    bool threw = false;
    try {
        responder.respond("hello", sink, cancelled);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    EXPECT_TRUE(threw);
    EXPECT_TRUE(sink.notes().empty());
    EXPECT_TRUE(responder.history().empty());
}

static void test_parse_chat_reply_errors() {
    const char* bad[] = {
        "not json",
        R"({"error":{"message":"quota exceeded"}})",
        R"({"choices":[]})",
        R"({"choices":[{"message":{"content":null}}]})",
        R"([1,2,3])",
    };
    for (const char* body : bad) {
        bool threw = false;
        try {
            ChatResponder::parseChatReply(body);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        EXPECT_TRUE(threw);
    }
    EXPECT_EQ(ChatResponder::parseChatReply(kReply), std::string("It is sunny."));
}

static void test_speech_is_streamed_in_chunks() {
    FakeHttpServer llm;
    llm.respondWith(200, kReply);
    FakeHttpServer tts;
    tts.respondWith(200, std::string(10000, 'A'), "audio/wav");

    ChatResponder::Config cfg = configFor(llm);
    cfg.ttsEndpoint = tts.url("/v1/audio/speech");
    cfg.audioChunkBytes = 4096;
    ChatResponder responder(cfg);

    RecordingSink sink;
    std::atomic<bool> cancelled{false};
    responder.respond("hi", sink, cancelled);

    EXPECT_EQ(sink.count("response"), (size_t)1);
    EXPECT_EQ(sink.count("audio"), (size_t)3);
    EXPECT_EQ(sink.count("audio_end"), (size_t)1);

    const auto reqs = tts.requests();
    if (!reqs.empty()) {
        const json body = json::parse(reqs[0].body);
        EXPECT_EQ(body["input"].get<std::string>(), std::string("It is sunny."));
    }
}

static void test_cancelled_before_reply_sends_nothing() {
    FakeHttpServer llm;
    llm.respondWith(200, kReply);
    ChatResponder responder(configFor(llm));
    RecordingSink sink;
    std::atomic<bool> cancelled{true};
    responder.respond("hi", sink, cancelled);
    EXPECT_TRUE(sink.notes().empty());
}

int main() {
    CurlGlobal curl;
    runTest("reply is sent and remembered", test_reply_is_sent_and_remembered);
    runTest("history feeds next request", test_history_feeds_next_request);
    runTest("history is bounded", test_history_is_bounded);
    runTest("llm failure throws", test_llm_failure_throws);
    runTest("parse chat reply errors", test_parse_chat_reply_errors);
    runTest("speech is streamed in chunks", test_speech_is_streamed_in_chunks);
    runTest("cancelled before reply sends nothing", test_cancelled_before_reply_sends_nothing);
    return testSummary();
}
