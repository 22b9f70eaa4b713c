#ifndef TURN_BUFFER_HPP
#define TURN_BUFFER_HPP

#include <chrono>
#include <string>
#include <vector>

// Text fragments of one in-progress user turn.
// Only ever appended to or cleared as a whole.
class TurnBuffer {
public:
    using Clock = std::chrono::steady_clock;

    // Ignores empty or whitespace-only text, leaving the last update time untouched.
    // Returns true if the fragment was stored.
    bool append(const std::string& text, Clock::time_point now = Clock::now());

    // Fragments joined with single spaces, in arrival order.
    std::string peek() const;

    bool isStale(Clock::time_point now, Clock::duration timeout) const;

    // Instant after which isStale() turns true. Only meaningful while active.
    Clock::time_point staleAt(Clock::duration timeout) const { return lastUpdate_ + timeout; }

    void clear();

    bool isActive() const { return active_; }
    size_t fragmentCount() const { return fragments_.size(); }
    Clock::time_point lastUpdate() const { return lastUpdate_; }

private:
    std::vector<std::string> fragments_;
    Clock::time_point lastUpdate_{};
    bool active_ = false;
};

#endif
