#ifndef UTTERANCE_RECORDER_HPP
#define UTTERANCE_RECORDER_HPP

#include "audio/audio_segment.hpp"

#include <vector>
#include <cstdint>

// RMS voice-activity segmenter: cuts microphone audio into speech segments at short pauses.
// Whether a pause ends the turn is decided server-side.
class UtteranceRecorder {
public:
    struct Config {
        int sampleRate = AudioSegment::kSampleRate;
        int channels = 1;

        int framesPerBuffer = 160;

        float vadStartRms = 0.014f;
        float vadStopRms = 0.011f;
        int startHangMs = 80;
        int stopHangMs = 550;

        int maxUtteranceMs = AudioSegment::kMaxDurationMs;
        int preRollMs = 250;
    };

    explicit UtteranceRecorder(Config config);

    // Returns true once a segment is complete; fetch it with takeSegment().
    bool feed(const int16_t* samples, int frames);

    bool isListening() const { return listening_; }
    bool hasUtterance() const { return finished_; }

    const std::vector<int16_t>& utterance() const { return utterance_; }

    // Moves the finished segment out and re-arms the recorder.
    AudioSegment takeSegment();

    void reset();

private:
    Config config_;

    bool listening_ = false;
    bool finished_ = false;

    int msPerBuffer_ = 0;
    int speechMs_ = 0;
    int silenceMs_ = 0;
    int utteranceMs_ = 0;

    std::vector<int16_t> preRoll_;
    std::vector<int16_t> utterance_;

    static float rms(const int16_t* x, int n);
    void pushPreRoll(const int16_t* x, int n);
    void finish();
};

#endif
