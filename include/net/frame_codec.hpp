#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include "audio/audio_segment.hpp"
#include "net/socket.hpp"

#include <cstdint>
#include <string>

// Session wire format: u8 type | u32 big-endian length | payload.
enum class FrameType : uint8_t {
    AudioSegment = 0x01,    // client -> server, PCM16LE mono 16 kHz
    Message = 0x02,         // server -> client, JSON
    AudioChunk = 0x03,      // server -> client, synthesized audio bytes
    Hangup = 0x04,          // client -> server
};

struct Frame {
    FrameType type = FrameType::Message;
    std::string payload;
};

static constexpr size_t kFrameHeaderSize = 5;
static constexpr uint32_t kMaxFramePayload = 1024 * 1024;

std::string encodeFrame(FrameType type, const std::string& payload);

enum class FrameStatus { Ok, Closed, TooLarge, UnknownType };

// Parses a 5-byte header. Fails on unknown types or oversized payloads.
FrameStatus decodeFrameHeader(const char* header, FrameType& type, uint32_t& length);

// Blocking read of one full frame from a socket.
FrameStatus readFrame(socket_t s, Frame& out);
bool writeFrame(socket_t s, FrameType type, const std::string& payload);

// PCM16LE payload <-> segment. False for empty or odd-sized payloads.
bool segmentFromPcm(const std::string& payload, AudioSegment& out);
std::string pcmFromSegment(const AudioSegment& segment);

#endif
