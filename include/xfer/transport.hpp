#pragma once
#include "xfer.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <cstddef>

namespace xfer {

struct Endpoint {
  std::string host;  // empty = any interface (listen side only)
  std::uint16_t port{0};

  std::string to_string() const;
};

// Parses "host:port" or "[v6addr]:port". Throws Error(Usage).
Endpoint parse_endpoint(const std::string& text);

class ITransport {
public:
  virtual ~ITransport() = default;

  // Blocking exact send/recv
  virtual void send_all(const std::uint8_t* data, std::size_t n) = 0;
  virtual void recv_all(std::uint8_t* out, std::size_t n) = 0;

  // Blocks until at least one byte is available; returns 0 on EOF
  virtual std::size_t recv_some(std::uint8_t* out, std::size_t n) = 0;

  // Half-close: the peer sees EOF after the bytes already sent
  virtual void shutdown_write() = 0;

  virtual void close() noexcept = 0;
};

// POSIX TCP transport (Linux/macOS)
class TcpTransport final : public ITransport {
public:
  TcpTransport();
  explicit TcpTransport(int connected_fd, std::string peer = {});
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  // Client-side connect
  void connect(const std::string& host, std::uint16_t port);

  void send_all(const std::uint8_t* data, std::size_t n) override;
  void recv_all(std::uint8_t* out, std::size_t n) override;
  std::size_t recv_some(std::uint8_t* out, std::size_t n) override;
  void shutdown_write() override;

  void close() noexcept override;

  const std::string& peer() const { return peer_; }

private:
  int fd_{-1};
  std::string peer_;
};

// Server side: bind/listen once, then accept one client at a time
class TcpListener {
public:
  TcpListener() = default;
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  void listen(const std::string& bind_host, std::uint16_t port);
  std::unique_ptr<TcpTransport> accept();

  // Actual bound port (useful when listening on port 0)
  std::uint16_t port() const;

  void close() noexcept;

private:
  int listen_fd_{-1};
};

} // namespace xfer
