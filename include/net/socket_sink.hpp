#ifndef SOCKET_SINK_HPP
#define SOCKET_SINK_HPP

#include "net/frame_codec.hpp"
#include "turn/session_sink.hpp"

#include <atomic>
#include <mutex>
#include <string>

// SessionSink writing framed messages to one client socket. Writes from the
// loop thread and the reader thread are serialized.
class SocketSink : public SessionSink {
public:
    explicit SocketSink(socket_t sock) : sock_(sock) {}

    bool sendTranscription(const std::string& text, float eotProbability, bool isPartial) override;
    bool sendResponse(const std::string& text) override;
    bool sendAudio(const std::string& bytes) override;
    bool sendAudioEnd() override;
    bool sendError(const std::string& message) override;

    // Later sends become no-ops returning false.
    void close() { closed_.store(true); }
    bool closed() const { return closed_.load(); }

private:
    bool send(FrameType type, const std::string& payload);

    socket_t sock_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

#endif
