#include "audio/utterance_recorder.hpp"

#include <cmath>
#include <algorithm>
#include <utility>

// Constructor
UtteranceRecorder::UtteranceRecorder(Config config) : config_(config) {
    msPerBuffer_ = (int)std::lround(1000.0 * config_.framesPerBuffer / config_.sampleRate);
    preRoll_.reserve((config_.preRollMs * config_.sampleRate) / 1000);
    utterance_.reserve(((size_t)config_.maxUtteranceMs * config_.sampleRate) / 1000);
}

// Resets recording variables
void UtteranceRecorder::reset() {
    listening_ = false;
    finished_ = false;
    speechMs_ = 0;
    silenceMs_ = 0;
    utteranceMs_ = 0;
    preRoll_.clear();
    utterance_.clear();
}

AudioSegment UtteranceRecorder::takeSegment() {
    AudioSegment segment;
    segment.sampleRate = config_.sampleRate;
    if (finished_) segment.samples = std::move(utterance_);
    reset();
    return segment;
}

float UtteranceRecorder::rms(const int16_t* x, int n) {
    double acc = 0.0;
    for (int i = 0; i < n; ++i) {
        const double v = x[i] / 32768.0;
        acc += v * v;
    }
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

void UtteranceRecorder::pushPreRoll(const int16_t* x, int n) {
    const int maxPre = (config_.preRollMs * config_.sampleRate) / 1000;
    preRoll_.insert(preRoll_.end(), x, x + n);
    if ((int)preRoll_.size() > maxPre) {
        const int extra = (int)preRoll_.size() - maxPre;
        preRoll_.erase(preRoll_.begin(), preRoll_.begin() + extra);
    }
}

void UtteranceRecorder::finish() {
    finished_ = true;
    listening_ = false;
}

bool UtteranceRecorder::feed(const int16_t* samples, int frames) {
    if (finished_) return true;

    const float r = rms(samples, frames);

    if (!listening_) {
        pushPreRoll(samples, frames);
        if (r >= config_.vadStartRms) {
            speechMs_ += msPerBuffer_;
            if (speechMs_ >= config_.startHangMs) {
                listening_ = true;
                utterance_.insert(utterance_.end(), preRoll_.begin(), preRoll_.end());
                utteranceMs_ = (int)((preRoll_.size() * 1000) / (size_t)config_.sampleRate);
                preRoll_.clear();
                silenceMs_ = 0;
            }
        } else {
            speechMs_ = 0;
        }
        return false;
    }

    utterance_.insert(utterance_.end(), samples, samples + frames);
    utteranceMs_ += msPerBuffer_;

    if (r <= config_.vadStopRms) {
        silenceMs_ += msPerBuffer_;
        if (silenceMs_ >= config_.stopHangMs) {
            finish();
            return true;
        }
    } else {
        silenceMs_ = 0;
    }

    if (utteranceMs_ >= config_.maxUtteranceMs) {
        finish();
        return true;
    }

    return false;
}
