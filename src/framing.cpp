#include "xfer/framing.hpp"
#include "xfer/transport.hpp"
#include "xfer/util.hpp"
#include <cstring>

namespace xfer {

static void write_u32_be(std::uint8_t out[4], std::uint32_t v) {
  out[0] = (v >> 24) & 0xFF;
  out[1] = (v >> 16) & 0xFF;
  out[2] = (v >> 8) & 0xFF;
  out[3] = (v) & 0xFF;
}
static std::uint32_t read_u32_be(const std::uint8_t in[4]) {
  return ((std::uint32_t)in[0] << 24) |
         ((std::uint32_t)in[1] << 16) |
         ((std::uint32_t)in[2] << 8)  |
         ((std::uint32_t)in[3]);
}
static void write_u64_be(std::uint8_t out[8], std::uint64_t v) {
  for (int i = 0; i < 8; ++i) out[i] = (std::uint8_t)((v >> (56 - 8 * i)) & 0xFF);
}
static std::uint64_t read_u64_be(const std::uint8_t in[8]) {
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v = (v << 8) | in[i];
  return v;
}

static void check_name_len(std::uint64_t n) {
  ensure(n > 0, ErrorKind::MalformedHeader, "empty filename in header");
  if (n > kMaxNameLen) {
    fail(ErrorKind::MalformedHeader,
         "filename length " + std::to_string(n) + " exceeds limit of " + std::to_string(kMaxNameLen));
  }
}

Bytes encode_header(const std::string& name, std::uint64_t length) {
  check_name_len(name.size());
  Bytes out(kHeaderFixedLen + name.size());
  write_u32_be(out.data(), (std::uint32_t)name.size());
  std::memcpy(out.data() + 4, name.data(), name.size());
  write_u64_be(out.data() + 4 + name.size(), length);
  return out;
}

Bytes FileHeader::serialize() const {
  return encode_header(name, length);
}

FileHeader FileHeader::parse(const Bytes& in) {
  ensure(in.size() >= 4, ErrorKind::UnexpectedEof, "header truncated in name length");
  const std::uint32_t n = read_u32_be(in.data());
  check_name_len(n);
  ensure(in.size() >= kHeaderFixedLen + n, ErrorKind::UnexpectedEof, "header truncated");
  ensure(in.size() == kHeaderFixedLen + n, ErrorKind::MalformedHeader, "trailing bytes after header");

  FileHeader h;
  h.name.assign((const char*)in.data() + 4, n);
  h.length = read_u64_be(in.data() + 4 + n);
  return h;
}

void send_header(ITransport& t, const FileHeader& h) {
  const Bytes wire = h.serialize();
  t.send_all(wire.data(), wire.size());
}

std::optional<FileHeader> recv_header(ITransport& t) {
  std::uint8_t len_buf[4];

  // A zero-byte read here is the only clean end of a session
  std::size_t got = t.recv_some(len_buf, sizeof(len_buf));
  if (got == 0) return std::nullopt;
  if (got < sizeof(len_buf)) t.recv_all(len_buf + got, sizeof(len_buf) - got);

  const std::uint32_t n = read_u32_be(len_buf);
  check_name_len(n);

  FileHeader h;
  h.name.resize(n);
  t.recv_all((std::uint8_t*)&h.name[0], n);

  std::uint8_t size_buf[8];
  t.recv_all(size_buf, sizeof(size_buf));
  h.length = read_u64_be(size_buf);
  return h;
}

} // namespace xfer
