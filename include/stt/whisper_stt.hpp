#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/transcriber.hpp"

#include <string>
#include <vector>
#include <mutex>

struct whisper_context;

class WhisperSTT : public Transcriber {
public:
    explicit WhisperSTT(const std::string& modelPath, int threads = 4);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::string transcribe(const AudioSegment& segment) override;

private:
    whisper_context* context_ = nullptr;
    int threads_;

    // whisper_full is not reentrant on a single context.
    std::mutex mutex_;
};

#endif
