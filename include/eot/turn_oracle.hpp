#ifndef TURN_ORACLE_HPP
#define TURN_ORACLE_HPP

#include "audio/audio_segment.hpp"

struct EotVerdict {
    float probability = 1.0f;
    bool isComplete = true;
};

// Decides whether a segment ends the speaker's turn. Implementations must not throw
// and must be safe to call from several sessions at once.
class TurnOracle {
public:
    virtual ~TurnOracle() = default;
    virtual EotVerdict evaluate(const AudioSegment& segment) = 0;
};

#endif
