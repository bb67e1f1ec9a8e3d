#include "xfer/util.hpp"
#include <openssl/evp.h>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace xfer {

const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::Connection:       return "ConnectionError";
    case ErrorKind::MalformedHeader:  return "MalformedHeader";
    case ErrorKind::UnexpectedEof:    return "UnexpectedEof";
    case ErrorKind::TruncatedBody:    return "TruncatedBody";
    case ErrorKind::FileNotFound:     return "FileNotFound";
    case ErrorKind::PermissionDenied: return "PermissionDenied";
    case ErrorKind::FileIo:           return "FileIo";
    case ErrorKind::Usage:            return "Usage";
  }
  return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& msg)
  : std::runtime_error(msg), kind_(kind) {}

void ensure(bool ok, const char* msg) {
  if (!ok) throw std::runtime_error(msg);
}

void ensure(bool ok, ErrorKind kind, const std::string& msg) {
  if (!ok) throw Error(kind, msg);
}

void fail(ErrorKind kind, const std::string& msg) {
  throw Error(kind, msg);
}

void fail_errno(int err, const std::string& what) {
  const std::string msg = what + ": " + std::strerror(err);
  switch (err) {
    case ENOENT:
    case ENOTDIR:
      fail(ErrorKind::FileNotFound, msg);
    case EACCES:
    case EPERM:
      fail(ErrorKind::PermissionDenied, msg);
    default:
      fail(ErrorKind::FileIo, msg);
  }
}

// ------------------------------ Digest ------------------------------

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  ensure(ctx_ != nullptr, "EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("DigestInit failed");
  }
}

Sha256::~Sha256() { EVP_MD_CTX_free(ctx_); }

void Sha256::update(const std::uint8_t* data, std::size_t n) {
  ensure(!finished_, "digest already finalized");
  if (n == 0) return;
  ensure(EVP_DigestUpdate(ctx_, data, n) == 1, "DigestUpdate failed");
}

std::string Sha256::final_hex() {
  ensure(!finished_, "digest already finalized");
  std::uint8_t md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  ensure(EVP_DigestFinal_ex(ctx_, md, &len) == 1, "DigestFinal failed");
  ensure(len == 32, "sha256 length mismatch");
  finished_ = true;
  return to_hex(md, len);
}

std::string sha256_hex(const Bytes& data) {
  Sha256 h;
  h.update(data.data(), data.size());
  return h.final_hex();
}

std::string to_hex(const std::uint8_t* data, std::size_t n) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

// ------------------------------ Local files ------------------------------

FileHandle::~FileHandle() { close(); }

FileHandle::FileHandle(FileHandle&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }

FileHandle& FileHandle::operator=(FileHandle&& o) noexcept {
  if (this != &o) {
    close();
    fd_ = o.fd_;
    o.fd_ = -1;
  }
  return *this;
}

void FileHandle::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

FileHandle open_for_read(const std::string& path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) fail_errno(errno, "cannot open '" + path + "' for reading");

  FileHandle f(fd);
  struct stat st{};
  if (::fstat(fd, &st) != 0) fail_errno(errno, "cannot stat '" + path + "'");
  ensure(S_ISREG(st.st_mode), ErrorKind::FileIo, "'" + path + "' is not a regular file");
  return f;
}

FileHandle open_for_write(const std::string& path) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) fail_errno(errno, "cannot open '" + path + "' for writing");
  return FileHandle(fd);
}

std::uint64_t file_size(const FileHandle& f, const std::string& path) {
  struct stat st{};
  if (::fstat(f.get(), &st) != 0) fail_errno(errno, "cannot stat '" + path + "'");
  return (std::uint64_t)st.st_size;
}

std::size_t read_some(const FileHandle& f, std::uint8_t* out, std::size_t n, const std::string& path) {
  for (;;) {
    ssize_t r = ::read(f.get(), out, n);
    if (r >= 0) return (std::size_t)r;
    if (errno == EINTR) continue;
    fail_errno(errno, "read from '" + path + "' failed");
  }
}

void write_all(const FileHandle& f, const std::uint8_t* data, std::size_t n, const std::string& path) {
  std::size_t off = 0;
  while (off < n) {
    ssize_t w = ::write(f.get(), data + off, n - off);
    if (w < 0 && errno == EINTR) continue;
    if (w < 0) fail(ErrorKind::FileIo, "write to '" + path + "' failed: " + std::strerror(errno));
    off += (std::size_t)w;
  }
}

} // namespace xfer
