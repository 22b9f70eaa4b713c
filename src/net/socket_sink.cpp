#include "net/socket_sink.hpp"

#include "core/logging.hpp"
#include "net/notifications.hpp"

bool SocketSink::send(FrameType type, const std::string& payload) {
    if (closed_.load()) return false;

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!writeFrame(sock_, type, payload)) {
        if (!closed_.exchange(true)) logging::warn("Session", "write failed: " + lastSocketError());
        return false;
    }
    return true;
}

bool SocketSink::sendTranscription(const std::string& text, float eotProbability, bool isPartial) {
    return send(FrameType::Message, notifications::transcription(text, eotProbability, isPartial));
}

bool SocketSink::sendResponse(const std::string& text) {
    return send(FrameType::Message, notifications::response(text));
}

bool SocketSink::sendAudio(const std::string& bytes) {
    return send(FrameType::AudioChunk, bytes);
}

bool SocketSink::sendAudioEnd() {
    return send(FrameType::Message, notifications::audioEnd());
}

bool SocketSink::sendError(const std::string& message) {
    return send(FrameType::Message, notifications::error(message));
}
