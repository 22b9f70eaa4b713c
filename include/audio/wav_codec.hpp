#ifndef WAV_CODEC_HPP
#define WAV_CODEC_HPP

#include <string>
#include <vector>
#include <cstdint>

struct WavData {
    int sampleRate = 0;
    int channels = 0;
    std::vector<int16_t> samples;   // interleaved
};

// 16-bit PCM RIFF/WAVE file image, little-endian.
std::string encodeWav(const int16_t* samples, size_t count, int sampleRate, int channels = 1);

// Parses a 16-bit PCM WAV image. Returns false for anything else.
bool decodeWav(const std::string& bytes, WavData& out);

#endif
