#ifndef SESSION_SINK_HPP
#define SESSION_SINK_HPP

#include <string>

// Outbound half of a session's transport. Every call returns false once the client is gone.
class SessionSink {
public:
    virtual ~SessionSink() = default;

    virtual bool sendTranscription(const std::string& text, float eotProbability, bool isPartial) = 0;
    virtual bool sendResponse(const std::string& text) = 0;
    virtual bool sendAudio(const std::string& bytes) = 0;
    virtual bool sendAudioEnd() = 0;
    virtual bool sendError(const std::string& message) = 0;
};

#endif
