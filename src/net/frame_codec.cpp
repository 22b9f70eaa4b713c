#include "net/frame_codec.hpp"

std::string encodeFrame(FrameType type, const std::string& payload) {
    const uint32_t n = (uint32_t)payload.size();

    std::string out;
    out.reserve(kFrameHeaderSize + payload.size());
    out.push_back((char)type);
    out.push_back((char)((n >> 24) & 0xff));
    out.push_back((char)((n >> 16) & 0xff));
    out.push_back((char)((n >> 8) & 0xff));
    out.push_back((char)(n & 0xff));
    out += payload;
    return out;
}

FrameStatus decodeFrameHeader(const char* header, FrameType& type, uint32_t& length) {
    const auto* h = reinterpret_cast<const unsigned char*>(header);
    if (h[0] < (uint8_t)FrameType::AudioSegment || h[0] > (uint8_t)FrameType::Hangup) {
        return FrameStatus::UnknownType;
    }
    type = (FrameType)h[0];
    length = ((uint32_t)h[1] << 24) | ((uint32_t)h[2] << 16) | ((uint32_t)h[3] << 8) | (uint32_t)h[4];
    if (length > kMaxFramePayload) return FrameStatus::TooLarge;
    return FrameStatus::Ok;
}

FrameStatus readFrame(socket_t s, Frame& out) {
    char header[kFrameHeaderSize];
    if (!recvAll(s, header, sizeof(header))) return FrameStatus::Closed;

    uint32_t length = 0;
    const FrameStatus st = decodeFrameHeader(header, out.type, length);
    if (st != FrameStatus::Ok) return st;

    out.payload.resize(length);
    if (length > 0 && !recvAll(s, &out.payload[0], length)) return FrameStatus::Closed;
    return FrameStatus::Ok;
}

bool writeFrame(socket_t s, FrameType type, const std::string& payload) {
    const std::string bytes = encodeFrame(type, payload);
    return sendAll(s, bytes.data(), bytes.size());
}

bool segmentFromPcm(const std::string& payload, AudioSegment& out) {
    if (payload.empty() || (payload.size() % 2) != 0) return false;
    if (payload.size() / 2 > AudioSegment::kMaxSamples) return false;

    const auto* p = reinterpret_cast<const unsigned char*>(payload.data());
    out.sampleRate = AudioSegment::kSampleRate;
    out.samples.resize(payload.size() / 2);
    for (size_t i = 0; i < out.samples.size(); ++i) {
        out.samples[i] = (int16_t)(uint16_t)(p[2 * i] | (p[2 * i + 1] << 8));
    }
    return true;
}

std::string pcmFromSegment(const AudioSegment& segment) {
    std::string out;
    out.reserve(segment.samples.size() * 2);
    for (int16_t s : segment.samples) {
        const uint16_t u = (uint16_t)s;
        out.push_back((char)(u & 0xff));
        out.push_back((char)((u >> 8) & 0xff));
    }
    return out;
}
