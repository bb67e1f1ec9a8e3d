#include "xfer/transport.hpp"
#include "xfer/util.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace xfer {

TcpTransport::TcpTransport() = default;
TcpTransport::TcpTransport(int connected_fd, std::string peer)
  : fd_(connected_fd), peer_(std::move(peer)) {}
TcpTransport::~TcpTransport() { close(); }

static std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

static std::string describe_addr(const sockaddr* sa, socklen_t len) {
  char host[NI_MAXHOST];
  char serv[NI_MAXSERV];
  if (::getnameinfo(sa, len, host, sizeof(host), serv, sizeof(serv),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
    return "?";
  }
  Endpoint ep{host, (std::uint16_t)std::stoi(serv)};
  return ep.to_string();
}

static int connect_tcp(const std::string& host, std::uint16_t port) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  ensure(rc == 0 && res, ErrorKind::Connection,
         "cannot resolve '" + host + "': " + ::gai_strerror(rc));

  int fd = -1;
  int last_err = 0;
  for (auto* p = res; p; p = p->ai_next) {
    fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd < 0) { last_err = errno; continue; }
    if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0) break;
    last_err = errno;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);
  ensure(fd >= 0, ErrorKind::Connection,
         "TCP connect to " + Endpoint{host, port}.to_string() + " failed: " + std::strerror(last_err));
  return fd;
}

static int listen_tcp(const std::string& bind_host, std::uint16_t port) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;
  hints.ai_flags = AI_PASSIVE;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(bind_host.empty() ? nullptr : bind_host.c_str(),
                         port_str.c_str(), &hints, &res);
  ensure(rc == 0 && res, ErrorKind::Connection,
         "cannot resolve bind address '" + bind_host + "': " + ::gai_strerror(rc));

  int lfd = -1;
  int last_err = 0;
  for (auto* p = res; p; p = p->ai_next) {
    lfd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (lfd < 0) { last_err = errno; continue; }

    int yes = 1;
    ::setsockopt(lfd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    if (::bind(lfd, p->ai_addr, p->ai_addrlen) != 0) { last_err = errno; ::close(lfd); lfd = -1; continue; }
    if (::listen(lfd, 16) != 0) { last_err = errno; ::close(lfd); lfd = -1; continue; }
    break;
  }
  ::freeaddrinfo(res);
  ensure(lfd >= 0, ErrorKind::Connection,
         "TCP listen on " + Endpoint{bind_host, port}.to_string() + " failed: " + std::strerror(last_err));
  return lfd;
}

void TcpTransport::connect(const std::string& host, std::uint16_t port) {
  close();
  fd_ = connect_tcp(host, port);
  peer_ = Endpoint{host, port}.to_string();
}

void TcpTransport::send_all(const std::uint8_t* data, std::size_t n) {
  ensure(fd_ >= 0, ErrorKind::Connection, "send on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t w = ::send(fd_, data + off, n - off, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR) continue;
    if (w <= 0) fail(ErrorKind::Connection, errno_text("send failed"));
    off += (std::size_t)w;
  }
}

void TcpTransport::recv_all(std::uint8_t* out, std::size_t n) {
  ensure(fd_ >= 0, ErrorKind::Connection, "recv on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t r = ::recv(fd_, out + off, n - off, MSG_WAITALL);
    if (r < 0 && errno == EINTR) continue;
    if (r < 0) fail(ErrorKind::Connection, errno_text("recv failed"));
    if (r == 0) {
      fail(ErrorKind::UnexpectedEof,
           "connection closed after " + std::to_string(off) + " of " + std::to_string(n) + " bytes");
    }
    off += (std::size_t)r;
  }
}

std::size_t TcpTransport::recv_some(std::uint8_t* out, std::size_t n) {
  ensure(fd_ >= 0, ErrorKind::Connection, "recv on closed socket");
  for (;;) {
    ssize_t r = ::recv(fd_, out, n, 0);
    if (r < 0 && errno == EINTR) continue;
    if (r < 0) fail(ErrorKind::Connection, errno_text("recv failed"));
    return (std::size_t)r;
  }
}

void TcpTransport::shutdown_write() {
  ensure(fd_ >= 0, ErrorKind::Connection, "shutdown on closed socket");
  if (::shutdown(fd_, SHUT_WR) != 0) fail(ErrorKind::Connection, errno_text("shutdown failed"));
}

void TcpTransport::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

// ------------------------------ Listener ------------------------------

TcpListener::~TcpListener() { close(); }

void TcpListener::listen(const std::string& bind_host, std::uint16_t port) {
  close();
  listen_fd_ = listen_tcp(bind_host, port);
}

std::unique_ptr<TcpTransport> TcpListener::accept() {
  ensure(listen_fd_ >= 0, ErrorKind::Connection, "accept on closed listener");
  for (;;) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    int cfd = ::accept(listen_fd_, (sockaddr*)&ss, &len);
    if (cfd < 0 && (errno == EINTR || errno == ECONNABORTED)) continue;
    if (cfd < 0) fail(ErrorKind::Connection, errno_text("accept failed"));
    return std::make_unique<TcpTransport>(cfd, describe_addr((sockaddr*)&ss, len));
  }
}

std::uint16_t TcpListener::port() const {
  ensure(listen_fd_ >= 0, ErrorKind::Connection, "listener is closed");
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getsockname(listen_fd_, (sockaddr*)&ss, &len) != 0) {
    fail(ErrorKind::Connection, errno_text("getsockname failed"));
  }
  if (ss.ss_family == AF_INET6) return ntohs(((sockaddr_in6*)&ss)->sin6_port);
  return ntohs(((sockaddr_in*)&ss)->sin_port);
}

void TcpListener::close() noexcept {
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

} // namespace xfer
