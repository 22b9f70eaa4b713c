#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <string>
#include <cstddef>
#include <functional>

// Runtime configuration, sourced from the process environment.
struct Settings {
    // Turn-completion oracle
    bool eotEnabled = true;
    float eotThreshold = 0.5f;
    double eotForceAfterSec = 2.0;
    double eotTimeoutSec = 0.3;
    std::string eotApiEndpoint = "http://127.0.0.1:8500/predict";

    // Session loop
    double pollIntervalSec = 1.0;
    size_t segmentQueueDepth = 4;

    // Transport
    std::string bindIp = "0.0.0.0";
    int port = 8765;

    // Transcriber
    std::string whisperModel = "models/whisper/ggml-base.en-q5_1.bin";
    int whisperThreads = 4;

    // Responder
    std::string llmApiEndpoint = "http://127.0.0.1:11434/v1/chat/completions";
    std::string llmModel = "llama3.2";
    std::string llmApiKey;
    std::string llmSystemPrompt =
        "You are a helpful voice assistant. Keep answers short and conversational.";
    double llmTimeoutSec = 30.0;
    std::string ttsApiEndpoint;
    std::string ttsVoice = "alloy";

    std::string logLevel = "info";

    // Lookup returns nullptr for unset variables. Throws std::invalid_argument on bad values.
    using Lookup = std::function<const char*(const char*)>;
    static Settings fromEnvironment();
    static Settings fromLookup(const Lookup& lookup);

    // Throws std::invalid_argument when the combination of values is unusable.
    void validate() const;
};

#endif
