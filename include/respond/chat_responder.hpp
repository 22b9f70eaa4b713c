#ifndef CHAT_RESPONDER_HPP
#define CHAT_RESPONDER_HPP

#include "respond/responder.hpp"

#include <string>
#include <vector>
#include <cstddef>

// Responder backed by an OpenAI-compatible chat completions endpoint and,
// optionally, a speech endpoint returning WAV audio. Holds one session's history.
class ChatResponder : public Responder {
public:
    struct Config {
        std::string llmEndpoint;
        std::string model;
        std::string apiKey;
        std::string systemPrompt;
        long timeoutMs = 30000;

        std::string ttsEndpoint;   // empty: text only
        std::string ttsVoice = "alloy";

        size_t maxHistoryTurns = 8;
        size_t audioChunkBytes = 32 * 1024;
    };

    struct Message {
        std::string role;
        std::string content;
    };

    explicit ChatResponder(Config config);

    void respond(const std::string& userText, SessionSink& sink, const std::atomic<bool>& cancelled) override;

    const std::vector<Message>& history() const { return history_; }

    // Exposed for tests.
    std::string buildChatRequest(const std::string& userText) const;
    static std::string parseChatReply(const std::string& body);

private:
    std::string complete(const std::string& userText);
    std::string synthesize(const std::string& text);
    void remember(const std::string& userText, const std::string& reply);

    Config config_;
    std::vector<Message> history_;
};

#endif
