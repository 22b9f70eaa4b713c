#include "respond/chat_responder.hpp"

#include "core/logging.hpp"
#include "net/http_client.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

static const char* kTag = "Responder";

// Constructor
ChatResponder::ChatResponder(Config config) : config_(std::move(config)) {}

std::string ChatResponder::buildChatRequest(const std::string& userText) const {
    json messages = json::array();
    if (!config_.systemPrompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", config_.systemPrompt}});
    }
    for (const auto& m : history_) {
        messages.push_back({{"role", m.role}, {"content", m.content}});
    }
    messages.push_back({{"role", "user"}, {"content", userText}});

    json body;
    body["model"] = config_.model;
    body["messages"] = messages;
    body["stream"] = false;
    return body.dump();
}

std::string ChatResponder::parseChatReply(const std::string& body) {
    const json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) throw std::runtime_error("LLM returned invalid JSON");

    if (j.contains("error")) {
        const json& err = j["error"];
        const std::string msg = (err.is_object() && err.contains("message") && err["message"].is_string())
                                    ? err["message"].get<std::string>()
                                    : err.dump();
        throw std::runtime_error("LLM error: " + msg);
    }

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        throw std::runtime_error("LLM response has no choices");
    }
    const json& choice = j["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        throw std::runtime_error("LLM response has no message");
    }
    const json& message = choice["message"];
    const auto content = message.find("content");
    if (content == message.end() || !content->is_string() || content->get<std::string>().empty()) {
        throw std::runtime_error("LLM returned an empty reply");
    }
    return content->get<std::string>();
}

std::string ChatResponder::complete(const std::string& userText) {
    std::vector<std::string> headers;
    if (!config_.apiKey.empty()) headers.push_back("Authorization: Bearer " + config_.apiKey);

    const HttpResponse r = HttpClient::post(config_.llmEndpoint, buildChatRequest(userText),
                                            "application/json", config_.timeoutMs, headers);
    if (r.status != 200) {
        throw std::runtime_error("LLM HTTP " + std::to_string(r.status) + ": " + r.body.substr(0, 200));
    }
    return parseChatReply(r.body);
}

std::string ChatResponder::synthesize(const std::string& text) {
    json body;
    body["model"] = "tts-1";
    body["input"] = text;
    body["voice"] = config_.ttsVoice;
    body["response_format"] = "wav";

    std::vector<std::string> headers;
    if (!config_.apiKey.empty()) headers.push_back("Authorization: Bearer " + config_.apiKey);

    const HttpResponse r = HttpClient::post(config_.ttsEndpoint, body.dump(), "application/json",
                                            config_.timeoutMs, headers);
    if (r.status != 200) {
        throw std::runtime_error("TTS HTTP " + std::to_string(r.status));
    }
    return r.body;
}

void ChatResponder::remember(const std::string& userText, const std::string& reply) {
    history_.push_back({"user", userText});
    history_.push_back({"assistant", reply});

    const size_t maxMessages = config_.maxHistoryTurns * 2;
    if (history_.size() > maxMessages) {
        history_.erase(history_.begin(), history_.begin() + (std::ptrdiff_t)(history_.size() - maxMessages));
    }
}

void ChatResponder::respond(const std::string& userText, SessionSink& sink, const std::atomic<bool>& cancelled) {
    const std::string reply = complete(userText);
    if (cancelled.load()) return;

    remember(userText, reply);
    logging::info(kTag, "reply: " + reply);
    if (!sink.sendResponse(reply)) return;

    if (config_.ttsEndpoint.empty()) return;

    const std::string audio = synthesize(reply);
    for (size_t off = 0; off < audio.size(); off += config_.audioChunkBytes) {
        if (cancelled.load()) return;
        if (!sink.sendAudio(audio.substr(off, config_.audioChunkBytes))) return;
    }
    sink.sendAudioEnd();
}
