#include "turn/turn_buffer.hpp"

#include <algorithm>
#include <cctype>

bool TurnBuffer::append(const std::string& text, Clock::time_point now) {
    const bool blank = std::all_of(text.begin(), text.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) return false;

    fragments_.push_back(text);
    lastUpdate_ = now;
    active_ = true;
    return true;
}

std::string TurnBuffer::peek() const {
    std::string out;
    for (size_t i = 0; i < fragments_.size(); ++i) {
        if (i) out += ' ';
        out += fragments_[i];
    }
    return out;
}

bool TurnBuffer::isStale(Clock::time_point now, Clock::duration timeout) const {
    return active_ && (now - lastUpdate_) > timeout;
}

void TurnBuffer::clear() {
    fragments_.clear();
    active_ = false;
}
