#include "stt/whisper_stt.hpp"

#include "stt/transcript_text.hpp"

#include <whisper.h>

#include <stdexcept>

// Constructor
WhisperSTT::WhisperSTT(const std::string& modelPath, int threads) : threads_(threads) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + modelPath);
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

// Converts a 16 kHz mono segment into text
std::string WhisperSTT::transcribe(const AudioSegment& segment) {
    if (segment.empty()) return {};
    if (segment.sampleRate != WHISPER_SAMPLE_RATE) {
        throw std::runtime_error("whisper expects " + std::to_string(WHISPER_SAMPLE_RATE) +
                                 " Hz audio, got " + std::to_string(segment.sampleRate));
    }

    std::vector<float> pcm(segment.samples.size());
    for (size_t i = 0; i < pcm.size(); ++i) pcm[i] = (float)segment.samples[i] / 32768.0f;

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = threads_;
    params.language = "en";
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.single_segment = true;

    params.no_speech_thold = 0.6f;

    std::lock_guard<std::mutex> lock(mutex_);

    const int rc = whisper_full(context_, params, pcm.data(), (int)pcm.size());
    if (rc != 0) throw std::runtime_error("whisper_full failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text(context_, i);
    return cleanTranscript(out);
}
