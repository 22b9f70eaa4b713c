#ifndef SESSION_SERVER_HPP
#define SESSION_SERVER_HPP

#include "eot/turn_oracle.hpp"
#include "net/socket.hpp"
#include "net/socket_sink.hpp"
#include "respond/responder.hpp"
#include "stt/transcriber.hpp"
#include "turn/session_loop.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// TCP listener; each accepted connection is one conversational session with its
// own turn controller, loop thread and responder.
class SessionServer {
public:
    using ResponderFactory = std::function<std::unique_ptr<Responder>()>;

    SessionServer(std::string bind_ip, int port,
                  TurnOracle& oracle, Transcriber& transcriber,
                  ResponderFactory responders, SessionLoop::Options options);
    ~SessionServer();

    SessionServer(const SessionServer&) = delete;
    SessionServer& operator=(const SessionServer&) = delete;

    // Binds and starts accepting. Throws std::runtime_error if the socket cannot be bound.
    void start();
    void stop();

    // Bound port; differs from the requested one when 0 was asked for.
    int port() const { return port_; }
    size_t activeSessions() const;

private:
    struct Connection {
        socket_t sock = kInvalidSocket;
        std::string peer;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void run();
    void serve(Connection& conn);
    void readLoop(Connection& conn, const std::string& tag, SessionLoop& loop, SocketSink& sink);
    void reapFinished();

    std::string bind_ip_;
    int port_;
    TurnOracle& oracle_;
    Transcriber& transcriber_;
    ResponderFactory responders_;
    SessionLoop::Options options_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    socket_t sock_{kInvalidSocket};

    mutable std::mutex conns_mutex_;
    std::list<std::unique_ptr<Connection>> conns_;
};

#endif
