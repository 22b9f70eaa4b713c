#ifndef SOCKET_HPP
#define SOCKET_HPP

#include <cstddef>
#include <string>

#ifdef _WIN32
  #include <winsock2.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
#endif

void closesock(socket_t s);
void shutdownsock(socket_t s);

// Loops until all bytes are written. False on error or peer close.
bool sendAll(socket_t s, const char* data, size_t n);

// Loops until exactly n bytes are read. False on error or EOF.
bool recvAll(socket_t s, char* data, size_t n);

std::string lastSocketError();

// Opens a TCP connection to ip:port. Throws std::runtime_error on failure.
socket_t connectTcp(const std::string& ip, int port);

#endif
