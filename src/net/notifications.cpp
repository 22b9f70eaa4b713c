#include "net/notifications.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace notifications {

// Transcripts can carry broken UTF-8 split across tokens; replace rather than throw.
static std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string transcription(const std::string& text, float eotProbability, bool isPartial) {
    json j;
    j["type"] = "transcription";
    j["text"] = text;
    j["metadata"] = {{"eot_probability", eotProbability}, {"is_partial", isPartial}};
    return dump(j);
}

std::string response(const std::string& text) {
    return dump(json{{"type", "response"}, {"text", text}});
}

std::string audioEnd() {
    return dump(json{{"type", "audio_end"}});
}

std::string error(const std::string& message) {
    return dump(json{{"type", "error"}, {"message", message}});
}

} // namespace notifications
