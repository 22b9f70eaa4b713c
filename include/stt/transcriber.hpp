#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include "audio/audio_segment.hpp"

#include <string>

// Speech-to-text for one segment. Returns "" when nothing was said; throws on failure.
class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual std::string transcribe(const AudioSegment& segment) = 0;
};

#endif
