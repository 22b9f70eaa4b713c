#include "audio/wav_codec.hpp"

#include <algorithm>
#include <cstring>

static void putU16(std::string& out, uint16_t v) {
    out.push_back((char)(v & 0xff));
    out.push_back((char)((v >> 8) & 0xff));
}

static void putU32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((char)((v >> (8 * i)) & 0xff));
}

static uint16_t getU16(const unsigned char* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}

static uint32_t getU32(const unsigned char* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

std::string encodeWav(const int16_t* samples, size_t count, int sampleRate, int channels) {
    const uint32_t dataBytes = (uint32_t)(count * sizeof(int16_t));
    const uint16_t blockAlign = (uint16_t)(channels * 2);

    std::string out;
    out.reserve(44 + dataBytes);
    out.append("RIFF", 4);
    putU32(out, 36 + dataBytes);
    out.append("WAVE", 4);

    out.append("fmt ", 4);
    putU32(out, 16);
    putU16(out, 1);                 // PCM
    putU16(out, (uint16_t)channels);
    putU32(out, (uint32_t)sampleRate);
    putU32(out, (uint32_t)sampleRate * blockAlign);
    putU16(out, blockAlign);
    putU16(out, 16);

    out.append("data", 4);
    putU32(out, dataBytes);
    for (size_t i = 0; i < count; ++i) putU16(out, (uint16_t)samples[i]);
    return out;
}

bool decodeWav(const std::string& bytes, WavData& out) {
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t n = bytes.size();
    if (n < 12 || std::memcmp(p, "RIFF", 4) != 0 || std::memcmp(p + 8, "WAVE", 4) != 0) return false;

    uint16_t format = 0, channels = 0, bits = 0;
    uint32_t rate = 0;
    bool gotFmt = false;

    size_t pos = 12;
    while (pos + 8 <= n) {
        const uint32_t size = getU32(p + pos + 4);
        const size_t body = pos + 8;

        if (std::memcmp(p + pos, "fmt ", 4) == 0) {
            if (size < 16 || body + 16 > n) return false;
            format = getU16(p + body);
            channels = getU16(p + body + 2);
            rate = getU32(p + body + 4);
            bits = getU16(p + body + 14);
            gotFmt = true;
        } else if (std::memcmp(p + pos, "data", 4) == 0) {
            if (!gotFmt || format != 1 || bits != 16 || channels == 0) return false;
            // Streamed WAVs often carry a placeholder size; clamp to what we actually have.
            const size_t avail = std::min<size_t>(size, n - body);
            out.sampleRate = (int)rate;
            out.channels = (int)channels;
            out.samples.resize(avail / 2);
            for (size_t i = 0; i < out.samples.size(); ++i) {
                out.samples[i] = (int16_t)getU16(p + body + 2 * i);
            }
            return true;
        }
        pos = body + size + (size & 1);
    }
    return false;
}
