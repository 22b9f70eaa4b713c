#include "net/session_server.hpp"

#include "core/logging.hpp"
#include "net/frame_codec.hpp"
#include "net/socket_sink.hpp"
#include "turn/turn_controller.hpp"

#include <stdexcept>
#include <utility>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <arpa/inet.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
#endif

static const char* kTag = "Session Server";

// Constructor
SessionServer::SessionServer(std::string bind_ip, int port,
                             TurnOracle& oracle, Transcriber& transcriber,
                             ResponderFactory responders, SessionLoop::Options options)
    : bind_ip_(std::move(bind_ip)), port_(port), oracle_(oracle), transcriber_(transcriber),
      responders_(std::move(responders)), options_(options) {}

// Destructor
SessionServer::~SessionServer() { stop(); }

// Binds the listening socket and starts the accept thread
void SessionServer::start() {
    if (running_.load()) return;

#ifdef _WIN32
    WSADATA wsa{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0) throw std::runtime_error("WSAStartup failed");
#endif

    socket_t s = ::socket(AF_INET, SOCK_STREAM, 0);
    if (s == kInvalidSocket) throw std::runtime_error("socket() failed: " + lastSocketError());

    int reuse = 1;
#ifdef _WIN32
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, (const char*)&reuse, sizeof(reuse));
#else
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (::inet_pton(AF_INET, bind_ip_.c_str(), &addr.sin_addr) != 1) {
        closesock(s);
        throw std::runtime_error("invalid bind ip: " + bind_ip_);
    }

    if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(s, 16) < 0) {
        const std::string err = lastSocketError();
        closesock(s);
        throw std::runtime_error("bind/listen on " + bind_ip_ + ":" + std::to_string(port_) + " failed: " + err);
    }

    sockaddr_in bound{};
#ifdef _WIN32
    int blen = sizeof(bound);
#else
    socklen_t blen = sizeof(bound);
#endif
    if (::getsockname(s, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) port_ = ntohs(bound.sin_port);

    sock_ = s;
    running_.store(true);
    thread_ = std::thread(&SessionServer::run, this);
    logging::info(kTag, "listening on " + bind_ip_ + ":" + std::to_string(port_));
}

// Stops accepting and tears down every open session
void SessionServer::stop() {
    if (!running_.exchange(false)) return;

    if (sock_ != kInvalidSocket) {
        shutdownsock(sock_);
        closesock(sock_);
        sock_ = kInvalidSocket;
    }
    if (thread_.joinable()) thread_.join();

    std::list<std::unique_ptr<Connection>> conns;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        conns.swap(conns_);
        for (auto& c : conns) {
            if (c->sock != kInvalidSocket) shutdownsock(c->sock);
        }
    }
    for (auto& c : conns) {
        if (c->thread.joinable()) c->thread.join();
    }

#ifdef _WIN32
    WSACleanup();
#endif
}

size_t SessionServer::activeSessions() const {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    size_t n = 0;
    for (const auto& c : conns_) {
        if (!c->done.load()) ++n;
    }
    return n;
}

void SessionServer::reapFinished() {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        for (auto it = conns_.begin(); it != conns_.end();) {
            if ((*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = conns_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& c : finished) {
        if (c->thread.joinable()) c->thread.join();
    }
}

// Accept loop
void SessionServer::run() {
    while (running_.load()) {
        sockaddr_in src{};
#ifdef _WIN32
        int slen = sizeof(src);
#else
        socklen_t slen = sizeof(src);
#endif
        const socket_t client = ::accept(sock_, reinterpret_cast<sockaddr*>(&src), &slen);
        if (client == kInvalidSocket) {
            if (running_.load()) logging::error(kTag, "accept() failed: " + lastSocketError());
            break;
        }

        reapFinished();

        char ipstr[INET_ADDRSTRLEN]{};
        const char* ok = ::inet_ntop(AF_INET, &src.sin_addr, ipstr, sizeof(ipstr));

        std::unique_ptr<Connection> conn = std::make_unique<Connection>();
        conn->sock = client;
        conn->peer = std::string(ok ? ipstr : "?") + ":" + std::to_string(ntohs(src.sin_port));

        Connection& ref = *conn;
        {
            std::lock_guard<std::mutex> lock(conns_mutex_);
            if (!running_.load()) {
                closesock(client);
                break;
            }
            conns_.push_back(std::move(conn));
            ref.thread = std::thread(&SessionServer::serve, this, std::ref(ref));
        }
    }
}

// One session: a reader (this thread) feeding a loop thread
void SessionServer::serve(Connection& conn) {
    const std::string tag = "Session " + conn.peer;
    logging::info(tag, "connected");

    SocketSink sink(conn.sock);

    try {
        std::unique_ptr<Responder> responder = responders_();
        TurnController controller(oracle_, transcriber_, *responder, sink);
        SessionLoop loop(controller, options_);

        std::thread loopThread([&loop, &tag] {
            try {
                loop.run();
            } catch (const std::exception& e) {
                logging::error(tag, std::string("session loop failed: ") + e.what());
            }
        });

        try {
            readLoop(conn, tag, loop, sink);
        } catch (const std::exception& e) {
            logging::error(tag, std::string("reader failed: ") + e.what());
        }

        loop.stop();
        loopThread.join();
    } catch (const std::exception& e) {
        logging::error(tag, std::string("session failed: ") + e.what());
    }

    sink.close();
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        closesock(conn.sock);
        conn.sock = kInvalidSocket;
    }
    logging::info(tag, "disconnected");
    conn.done.store(true);
}

// Feeds decoded segments into the loop until hangup, EOF or a bad frame
void SessionServer::readLoop(Connection& conn, const std::string& tag, SessionLoop& loop, SocketSink& sink) {
    while (true) {
        Frame frame;
        const FrameStatus st = readFrame(conn.sock, frame);
        if (st == FrameStatus::Closed) break;
        if (st != FrameStatus::Ok) {
            logging::warn(tag, st == FrameStatus::TooLarge ? "oversized frame, closing" : "unknown frame type, closing");
            sink.sendError("protocol error");
            break;
        }

        if (frame.type == FrameType::Hangup) break;
        if (frame.type != FrameType::AudioSegment) {
            logging::debug(tag, "ignoring unexpected frame type " + std::to_string((int)frame.type));
            continue;
        }

        if (frame.payload.size() / 2 > AudioSegment::kMaxSamples) {
            logging::warn(tag, "segment of " + std::to_string(frame.payload.size() / 2 * 1000 / AudioSegment::kSampleRate) +
                               " ms exceeds " + std::to_string(AudioSegment::kMaxDurationMs) + " ms, discarded");
            continue;
        }

        AudioSegment segment;
        if (!segmentFromPcm(frame.payload, segment)) {
            logging::debug(tag, "malformed segment discarded");
            continue;
        }
        if (loop.submit(std::move(segment)) == SegmentQueue::PushResult::Full) {
            sink.sendError("segment queue full, audio dropped");
        }
    }
}
