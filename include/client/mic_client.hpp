#ifndef MIC_CLIENT_HPP
#define MIC_CLIENT_HPP

#include "net/socket.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

// Developer client: microphone -> VAD segments -> server, server messages -> console,
// synthesized replies -> speakers.
class MicClient {
public:
    MicClient(std::string server_ip, int port);
    ~MicClient();

    MicClient(const MicClient&) = delete;
    MicClient& operator=(const MicClient&) = delete;

    // Blocks until stop() or the server disconnects. Throws std::runtime_error on audio/socket setup errors.
    int run();
    void stop();

    // Async-signal-safe: only flags the capture loop to wind down.
    void requestStop() { stopRequested_.store(true); }

private:
    void receiveLoop();
    void handleMessage(const std::string& json);
    void play(const std::string& wavBytes);

    std::string server_ip_;
    int port_;

    socket_t sock_{kInvalidSocket};
    std::mutex send_mutex_;
    std::thread receiver_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    // Capture is muted while a reply plays so the assistant does not hear itself.
    std::atomic<bool> playing_{false};

    std::string pendingAudio_;
};

#endif
