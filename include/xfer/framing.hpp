#pragma once
#include "xfer.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace xfer {

// File header framing:
//   [u32_be name_len][name bytes, UTF-8][u64_be body_len]
// followed on the wire by exactly body_len raw bytes.
static constexpr std::uint32_t kMaxNameLen = 4096;
static constexpr std::size_t kHeaderFixedLen = 4 + 8;

class ITransport;

struct FileHeader {
  std::string name;
  std::uint64_t length{0};

  Bytes serialize() const;

  // Parses one complete header held in memory; trailing bytes are rejected
  static FileHeader parse(const Bytes& in);
};

Bytes encode_header(const std::string& name, std::uint64_t length);

// Sends one header frame
void send_header(ITransport& t, const FileHeader& h);

// Receives one header frame. Returns nullopt on clean EOF (no byte of a new
// header was read). Throws Error(UnexpectedEof) on a partial header and
// Error(MalformedHeader) when the name length is zero or above kMaxNameLen.
std::optional<FileHeader> recv_header(ITransport& t);

} // namespace xfer
