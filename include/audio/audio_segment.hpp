#ifndef AUDIO_SEGMENT_HPP
#define AUDIO_SEGMENT_HPP

#include <vector>
#include <cstdint>
#include <cstddef>

// One VAD-delimited chunk of mono PCM16 speech.
struct AudioSegment {
    static constexpr int kSampleRate = 16000;
    static constexpr int kMaxDurationMs = 8000;
    static constexpr size_t kMaxSamples = (size_t)kSampleRate * kMaxDurationMs / 1000;

    std::vector<int16_t> samples;
    int sampleRate = kSampleRate;

    bool empty() const { return samples.empty(); }
    int durationMs() const {
        return sampleRate > 0 ? (int)((samples.size() * 1000) / (size_t)sampleRate) : 0;
    }
};

#endif
