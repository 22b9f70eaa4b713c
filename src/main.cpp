#include "core/logging.hpp"
#include "core/settings.hpp"
#include "eot/eot_client.hpp"
#include "net/http_client.hpp"
#include "net/session_server.hpp"
#include "respond/chat_responder.hpp"
#include "stt/whisper_stt.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

static std::atomic<bool> g_stop{false};

static void onSignal(int) { g_stop.store(true); }

static std::chrono::steady_clock::duration seconds(double s) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(s));
}

int main() {
    Settings settings;
    try {
        settings = Settings::fromEnvironment();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] [ERROR] " << e.what() << std::endl;
        return 2;
    }

    logging::Level level = logging::Level::Info;
    if (!logging::parseLevel(settings.logLevel, level)) {
        logging::warn("Config", "unknown LOG_LEVEL '" + settings.logLevel + "', using info");
    }
    logging::setLevel(level);

    try {
        CurlGlobal curl;

        // STT model init
        logging::info("Whisper STT", "loading " + settings.whisperModel);
        WhisperSTT stt(settings.whisperModel, settings.whisperThreads);

        // EOT oracle init
        EotClient::Config eotConfig;
        eotConfig.apiEndpoint = settings.eotApiEndpoint;
        eotConfig.threshold = settings.eotThreshold;
        eotConfig.enabled = settings.eotEnabled;
        eotConfig.timeoutMs = (long)(settings.eotTimeoutSec * 1000.0);
        EotClient eot(eotConfig);

        if (!eot.healthy()) {
            logging::warn("EOT Client", "service not healthy yet; verdicts will fail open until it is");
        }

        ChatResponder::Config chat;
        chat.llmEndpoint = settings.llmApiEndpoint;
        chat.model = settings.llmModel;
        chat.apiKey = settings.llmApiKey;
        chat.systemPrompt = settings.llmSystemPrompt;
        chat.timeoutMs = (long)(settings.llmTimeoutSec * 1000.0);
        chat.ttsEndpoint = settings.ttsApiEndpoint;
        chat.ttsVoice = settings.ttsVoice;

        SessionLoop::Options options;
        options.pollInterval = seconds(settings.pollIntervalSec);
        options.forceAfter = seconds(settings.eotForceAfterSec);
        options.queueDepth = settings.segmentQueueDepth;

        // Session server init
        SessionServer server(settings.bindIp, settings.port, eot, stt,
            [chat]() -> std::unique_ptr<Responder> { return std::make_unique<ChatResponder>(chat); },
            options);

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
#ifndef _WIN32
        std::signal(SIGPIPE, SIG_IGN);
#endif

        server.start();

        logging::info("Backend", "running... Ctrl+C to quit.");
        while (!g_stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        logging::info("Backend", "shutting down");
        server.stop();
    } catch (const std::exception& e) {
        logging::error("Backend", e.what());
        return 1;
    }

    return 0;
}
