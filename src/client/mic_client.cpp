#include "client/mic_client.hpp"

#include "audio/utterance_recorder.hpp"
#include "audio/wav_codec.hpp"
#include "core/logging.hpp"
#include "net/frame_codec.hpp"

#include <nlohmann/json.hpp>
#include <portaudio.h>

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

using json = nlohmann::json;

static const char* kTag = "Mic Client";

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Constructor
MicClient::MicClient(std::string server_ip, int port) : server_ip_(std::move(server_ip)), port_(port) {}

// Destructor
MicClient::~MicClient() {
    stop();
    if (receiver_.joinable()) receiver_.join();
    if (sock_ != kInvalidSocket) closesock(sock_);
}

void MicClient::stop() {
    if (!running_.exchange(false)) return;
    if (sock_ != kInvalidSocket) {
        std::lock_guard<std::mutex> lock(send_mutex_);
        writeFrame(sock_, FrameType::Hangup, std::string());
        shutdownsock(sock_);
    }
}

void MicClient::handleMessage(const std::string& text) {
    const json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        logging::warn(kTag, "unparsable message: " + text);
        return;
    }

    const std::string type = j.value("type", "");
    if (type == "transcription") {
        const json meta = j.value("metadata", json::object());
        const bool partial = meta.value("is_partial", false);
        const double prob = meta.value("eot_probability", 0.0);
        std::cout << (partial ? "... " : "YOU: ") << j.value("text", "")
                  << "  (eot=" << prob << ")" << std::endl;
    } else if (type == "response") {
        std::cout << "ASSISTANT: " << j.value("text", "") << "\n" << std::endl;
    } else if (type == "audio_end") {
        std::string audio;
        audio.swap(pendingAudio_);
        play(audio);
    } else if (type == "error") {
        logging::error(kTag, "server: " + j.value("message", ""));
    } else {
        logging::debug(kTag, "unhandled message: " + text);
    }
}

void MicClient::play(const std::string& wavBytes) {
    WavData wav;
    if (!decodeWav(wavBytes, wav)) {
        logging::warn(kTag, "reply audio is not 16-bit PCM WAV, skipped");
        return;
    }

    playing_.store(true);
    try {
        PaStream* out = nullptr;
        pa_check(Pa_OpenDefaultStream(&out, 0, wav.channels, paInt16, wav.sampleRate,
                                      paFramesPerBufferUnspecified, nullptr, nullptr),
                 "Pa_OpenDefaultStream (output)");
        pa_check(Pa_StartStream(out), "Pa_StartStream (output)");

        const unsigned long frames = (unsigned long)(wav.samples.size() / (size_t)wav.channels);
        const PaError e = Pa_WriteStream(out, wav.samples.data(), frames);
        if (e != paNoError && e != paOutputUnderflowed) {
            logging::warn(kTag, std::string("playback: ") + Pa_GetErrorText(e));
        }

        Pa_StopStream(out);
        Pa_CloseStream(out);
    } catch (const std::exception& e) {
        logging::error(kTag, e.what());
    }
    playing_.store(false);
}

// Thread function that prints server messages and collects reply audio
void MicClient::receiveLoop() {
    while (running_.load()) {
        Frame frame;
        const FrameStatus st = readFrame(sock_, frame);
        if (st != FrameStatus::Ok) {
            if (running_.load()) logging::warn(kTag, "server connection closed");
            break;
        }

        if (frame.type == FrameType::Message) {
            handleMessage(frame.payload);
        } else if (frame.type == FrameType::AudioChunk) {
            pendingAudio_ += frame.payload;
        }
    }
    running_.store(false);
}

int MicClient::run() {
    sock_ = connectTcp(server_ip_, port_);
    running_.store(true);
    receiver_ = std::thread(&MicClient::receiveLoop, this);

    pa_check(Pa_Initialize(), "Pa_Initialize");

    UtteranceRecorder::Config config;
    UtteranceRecorder recorder(config);

    PaStreamParameters inParams{};
    inParams.device = Pa_GetDefaultInputDevice();
    if (inParams.device == paNoDevice) {
        Pa_Terminate();
        throw std::runtime_error("No default input device");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    logging::info(kTag, std::string("input device: ") + (info ? info->name : "(unknown)"));

    inParams.channelCount = 1;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
    inParams.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    pa_check(
        Pa_OpenStream(&stream, &inParams, nullptr,
                      config.sampleRate, config.framesPerBuffer,
                      paNoFlag, nullptr, nullptr),
        "Pa_OpenStream"
    );

    pa_check(Pa_StartStream(stream), "Pa_StartStream");

    logging::info(kTag, "listening... (speak, then pause)");

    std::vector<int16_t> buff(config.framesPerBuffer);

    while (running_.load() && !stopRequested_.load()) {
        PaError e = Pa_ReadStream(stream, buff.data(), config.framesPerBuffer);
        if (e == paInputOverflowed) {
            continue;
        }
        if (e != paNoError) {
            logging::error(kTag, std::string("Pa_ReadStream: ") + Pa_GetErrorText(e));
            break;
        }

        if (playing_.load()) {
            recorder.reset();
            continue;
        }

        const bool done = recorder.feed(buff.data(), config.framesPerBuffer);

        if (done && recorder.hasUtterance()) {
            const AudioSegment segment = recorder.takeSegment();
            logging::debug(kTag, "sending " + std::to_string(segment.durationMs()) + " ms segment");

            std::lock_guard<std::mutex> lock(send_mutex_);
            if (!writeFrame(sock_, FrameType::AudioSegment, pcmFromSegment(segment))) {
                logging::error(kTag, "send failed: " + lastSocketError());
                break;
            }
        }
    }

    Pa_StopStream(stream);
    Pa_CloseStream(stream);

    stop();
    if (receiver_.joinable()) receiver_.join();
    Pa_Terminate();

    return 0;
}
