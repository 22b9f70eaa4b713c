#include "net/socket.hpp"

#include <cstring>
#include <stdexcept>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <cerrno>
  #include <arpa/inet.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <netinet/tcp.h>
  #include <unistd.h>
#endif

#if !defined(_WIN32) && !defined(MSG_NOSIGNAL)
  #define MSG_NOSIGNAL 0
#endif

#ifdef _WIN32
void closesock(socket_t s) { ::closesocket(s); }
void shutdownsock(socket_t s) { ::shutdown(s, SD_BOTH); }
std::string lastSocketError() { return std::to_string(WSAGetLastError()); }
#else
void closesock(socket_t s) { ::close(s); }
void shutdownsock(socket_t s) { ::shutdown(s, SHUT_RDWR); }
std::string lastSocketError() { return std::strerror(errno); }
#endif

bool sendAll(socket_t s, const char* data, size_t n) {
    size_t sent = 0;
    while (sent < n) {
#ifdef _WIN32
        const int k = ::send(s, data + sent, (int)(n - sent), 0);
#else
        const ssize_t k = ::send(s, data + sent, n - sent, MSG_NOSIGNAL);
        if (k < 0 && errno == EINTR) continue;
#endif
        if (k <= 0) return false;
        sent += (size_t)k;
    }
    return true;
}

bool recvAll(socket_t s, char* data, size_t n) {
    size_t got = 0;
    while (got < n) {
#ifdef _WIN32
        const int k = ::recv(s, data + got, (int)(n - got), 0);
#else
        const ssize_t k = ::recv(s, data + got, n - got, 0);
        if (k < 0 && errno == EINTR) continue;
#endif
        if (k <= 0) return false;
        got += (size_t)k;
    }
    return true;
}

socket_t connectTcp(const std::string& ip, int port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("invalid server ip: " + ip);
    }

    socket_t s = ::socket(AF_INET, SOCK_STREAM, 0);
    if (s == kInvalidSocket) throw std::runtime_error("socket() failed: " + lastSocketError());

    if (::connect(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string err = lastSocketError();
        closesock(s);
        throw std::runtime_error("connect() to " + ip + ":" + std::to_string(port) + " failed: " + err);
    }

    int nodelay = 1;
#ifdef _WIN32
    ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, (const char*)&nodelay, sizeof(nodelay));
#else
    ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
#endif
    return s;
}
