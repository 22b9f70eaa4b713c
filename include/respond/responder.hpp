#ifndef RESPONDER_HPP
#define RESPONDER_HPP

#include "turn/session_sink.hpp"

#include <atomic>
#include <string>

// Turns a finalized user turn into a reply (text and synthesized audio) delivered through the sink.
// Throws on failure. Should return early once `cancelled` becomes true.
class Responder {
public:
    virtual ~Responder() = default;
    virtual void respond(const std::string& userText, SessionSink& sink, const std::atomic<bool>& cancelled) = 0;
};

#endif
