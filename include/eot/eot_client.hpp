#ifndef EOT_CLIENT_HPP
#define EOT_CLIENT_HPP

#include "eot/turn_oracle.hpp"

#include <string>
#include <vector>
#include <cstdint>

// Client of the end-of-turn classifier service (POST /predict, GET /health).
// Any failure yields a complete verdict so a conversation can never stall on it.
class EotClient : public TurnOracle {
public:
    struct Config {
        std::string apiEndpoint = "http://127.0.0.1:8500/predict";
        float threshold = 0.5f;
        bool enabled = true;
        long timeoutMs = 300;
        int windowMs = AudioSegment::kMaxDurationMs;
    };

    explicit EotClient(Config config);

    EotVerdict evaluate(const AudioSegment& segment) override;

    bool healthy() const;

    const Config& config() const { return config_; }

    // Keeps the last maxSamples samples; turn-ending cues sit at the end of speech.
    static std::vector<int16_t> trailingWindow(const std::vector<int16_t>& samples, size_t maxSamples);

    // Reads {"eot_prob", ...} or {"probability", ...}. Returns false if no numeric probability.
    static bool parseProbability(const std::string& body, float& probability);

    static EotVerdict failOpen();

private:
    std::string healthUrl() const;

    Config config_;
};

#endif
