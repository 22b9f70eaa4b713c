#include "eot/eot_client.hpp"

#include "audio/wav_codec.hpp"
#include "core/logging.hpp"
#include "net/http_client.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <utility>

using json = nlohmann::json;

static const char* kTag = "EOT Client";

// Constructor
EotClient::EotClient(Config config) : config_(std::move(config)) {
    char buff[64];
    std::snprintf(buff, sizeof(buff), "%.2f", config_.threshold);
    logging::info(kTag, "endpoint=" + config_.apiEndpoint + " threshold=" + buff +
                        " enabled=" + (config_.enabled ? "true" : "false") +
                        " timeout_ms=" + std::to_string(config_.timeoutMs));
}

EotVerdict EotClient::failOpen() {
    EotVerdict v;
    v.probability = 1.0f;
    v.isComplete = true;
    return v;
}

std::vector<int16_t> EotClient::trailingWindow(const std::vector<int16_t>& samples, size_t maxSamples) {
    if (samples.size() <= maxSamples) return samples;
    return std::vector<int16_t>(samples.end() - (std::ptrdiff_t)maxSamples, samples.end());
}

bool EotClient::parseProbability(const std::string& body, float& probability) {
    const json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;

    const char* keys[] = {"eot_prob", "probability"};
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && it->is_number()) {
            probability = std::min(1.0f, std::max(0.0f, it->get<float>()));
            return true;
        }
    }
    return false;
}

EotVerdict EotClient::evaluate(const AudioSegment& segment) {
    if (!config_.enabled) {
        logging::debug(kTag, "disabled, defaulting to is_complete=true");
        return failOpen();
    }

    const size_t maxSamples = (size_t)segment.sampleRate * (size_t)config_.windowMs / 1000;
    const std::vector<int16_t> window = trailingWindow(segment.samples, maxSamples);
    const std::string wav = encodeWav(window.data(), window.size(), segment.sampleRate);

    HttpResponse response;
    try {
        response = HttpClient::post(config_.apiEndpoint, wav, "application/octet-stream", config_.timeoutMs);
    } catch (const HttpError& e) {
        logging::error(kTag, std::string("request failed, failing open: ") + e.what());
        return failOpen();
    }

    if (response.status != 200) {
        logging::error(kTag, "service error HTTP " + std::to_string(response.status) + ", failing open");
        return failOpen();
    }

    float probability = 0.0f;
    if (!parseProbability(response.body, probability)) {
        logging::error(kTag, "malformed response, failing open: " + response.body.substr(0, 200));
        return failOpen();
    }

    EotVerdict v;
    v.probability = probability;
    v.isComplete = probability >= config_.threshold;

    char buff[96];
    std::snprintf(buff, sizeof(buff), "prob=%.3f is_complete=%s", v.probability, v.isComplete ? "true" : "false");
    logging::debug(kTag, buff);
    return v;
}

std::string EotClient::healthUrl() const {
    // http://host:port/predict -> http://host:port/health
    const std::string& url = config_.apiEndpoint;
    const size_t scheme = url.find("://");
    const size_t pathStart = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    const std::string base = pathStart == std::string::npos ? url : url.substr(0, pathStart);
    return base + "/health";
}

bool EotClient::healthy() const {
    if (!config_.enabled) return true;
    try {
        const HttpResponse r = HttpClient::get(healthUrl(), std::max(config_.timeoutMs, 1000L));
        return r.status == 200;
    } catch (const HttpError& e) {
        logging::warn(kTag, std::string("health check failed: ") + e.what());
        return false;
    }
}
