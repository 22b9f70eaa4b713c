#include "core/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

static std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

static bool parseBool(const char* name, const std::string& value) {
    const std::string v = lowered(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument(std::string(name) + ": expected a boolean, got '" + value + "'");
}

static double parseDouble(const char* name, const std::string& value) {
    size_t used = 0;
    double d = 0.0;
    try {
        d = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + ": expected a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(std::string(name) + ": trailing characters in '" + value + "'");
    }
    if (!std::isfinite(d)) {
        throw std::invalid_argument(std::string(name) + ": expected a finite number, got '" + value + "'");
    }
    return d;
}

static long parseInt(const char* name, const std::string& value) {
    size_t used = 0;
    long n = 0;
    try {
        n = std::stol(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + ": expected an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(std::string(name) + ": trailing characters in '" + value + "'");
    }
    return n;
}

static int parseIntInRange(const char* name, const std::string& value, long lo, long hi) {
    const long n = parseInt(name, value);
    if (n < lo || n > hi) {
        throw std::invalid_argument(std::string(name) + " must be within " + std::to_string(lo) + ".." +
                                    std::to_string(hi) + ", got '" + value + "'");
    }
    return (int)n;
}

Settings Settings::fromEnvironment() {
    return fromLookup([](const char* name) { return std::getenv(name); });
}

Settings Settings::fromLookup(const Lookup& lookup) {
    Settings s;

    auto str = [&](const char* name, std::string& field) {
        if (const char* v = lookup(name)) field = v;
    };
    auto flag = [&](const char* name, bool& field) {
        if (const char* v = lookup(name)) field = parseBool(name, v);
    };
    auto real = [&](const char* name, double& field) {
        if (const char* v = lookup(name)) field = parseDouble(name, v);
    };

    flag("EOT_ENABLED", s.eotEnabled);
    if (const char* v = lookup("EOT_THRESHOLD")) s.eotThreshold = (float)parseDouble("EOT_THRESHOLD", v);
    real("EOT_FORCE_AFTER", s.eotForceAfterSec);
    real("EOT_TIMEOUT", s.eotTimeoutSec);
    str("EOT_API_ENDPOINT", s.eotApiEndpoint);

    real("SESSION_POLL_INTERVAL", s.pollIntervalSec);
    if (const char* v = lookup("SEGMENT_QUEUE_DEPTH")) {
        const long depth = parseInt("SEGMENT_QUEUE_DEPTH", v);
        if (depth < 1) throw std::invalid_argument("SEGMENT_QUEUE_DEPTH must be at least 1");
        s.segmentQueueDepth = (size_t)depth;
    }

    str("SERVER_BIND", s.bindIp);
    if (const char* v = lookup("SERVER_PORT")) s.port = parseIntInRange("SERVER_PORT", v, 1, 65535);

    str("WHISPER_MODEL", s.whisperModel);
    if (const char* v = lookup("WHISPER_THREADS")) s.whisperThreads = parseIntInRange("WHISPER_THREADS", v, 1, 1024);

    str("LLM_API_ENDPOINT", s.llmApiEndpoint);
    str("LLM_MODEL", s.llmModel);
    str("LLM_API_KEY", s.llmApiKey);
    str("LLM_SYSTEM_PROMPT", s.llmSystemPrompt);
    real("LLM_TIMEOUT", s.llmTimeoutSec);
    str("TTS_API_ENDPOINT", s.ttsApiEndpoint);
    str("TTS_VOICE", s.ttsVoice);

    str("LOG_LEVEL", s.logLevel);

    s.validate();
    return s;
}

void Settings::validate() const {
    if (!(eotThreshold >= 0.0f && eotThreshold <= 1.0f)) {
        throw std::invalid_argument("EOT_THRESHOLD must be within [0, 1]");
    }
    if (!std::isfinite(pollIntervalSec) || !std::isfinite(eotForceAfterSec) ||
        !std::isfinite(eotTimeoutSec) || !std::isfinite(llmTimeoutSec)) {
        throw std::invalid_argument("durations must be finite");
    }
    if (!(pollIntervalSec > 0.0)) {
        throw std::invalid_argument("SESSION_POLL_INTERVAL must be positive");
    }
    if (!(eotForceAfterSec > pollIntervalSec)) {
        throw std::invalid_argument("EOT_FORCE_AFTER must exceed SESSION_POLL_INTERVAL");
    }
    if (!(eotTimeoutSec > 0.0 && eotTimeoutSec < eotForceAfterSec)) {
        throw std::invalid_argument("EOT_TIMEOUT must be positive and below EOT_FORCE_AFTER");
    }
    if (eotEnabled && eotApiEndpoint.empty()) {
        throw std::invalid_argument("EOT_API_ENDPOINT is required when EOT_ENABLED is true");
    }
    if (segmentQueueDepth < 1) {
        throw std::invalid_argument("SEGMENT_QUEUE_DEPTH must be at least 1");
    }
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("SERVER_PORT must be within 1..65535");
    }
    if (whisperThreads < 1) {
        throw std::invalid_argument("WHISPER_THREADS must be at least 1");
    }
    if (!(llmTimeoutSec > 0.0)) {
        throw std::invalid_argument("LLM_TIMEOUT must be positive");
    }
}
