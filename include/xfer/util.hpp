#pragma once
#include "xfer.hpp"
#include <stdexcept>
#include <string>
#include <cstddef>
#include <cstdint>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace xfer {

enum class ErrorKind {
  Connection,
  MalformedHeader,
  UnexpectedEof,
  TruncatedBody,
  FileNotFound,
  PermissionDenied,
  FileIo,
  Usage
};

const char* to_string(ErrorKind k);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& msg);
  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

void ensure(bool ok, const char* msg);
void ensure(bool ok, ErrorKind kind, const std::string& msg);
[[noreturn]] void fail(ErrorKind kind, const std::string& msg);

// Maps an errno from open(2) to FileNotFound / PermissionDenied / FileIo
[[noreturn]] void fail_errno(int err, const std::string& what);

// Incremental SHA-256 over a streamed body
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const std::uint8_t* data, std::size_t n);
  // Lowercase hex; the object cannot be updated afterwards
  std::string final_hex();

private:
  EVP_MD_CTX* ctx_{nullptr};
  bool finished_{false};
};

std::string sha256_hex(const Bytes& data);

std::string to_hex(const std::uint8_t* data, std::size_t n);

// RAII owner of a POSIX file descriptor
class FileHandle {
public:
  FileHandle() = default;
  explicit FileHandle(int fd) : fd_(fd) {}
  ~FileHandle();
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;
  FileHandle(FileHandle&& o) noexcept;
  FileHandle& operator=(FileHandle&& o) noexcept;

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }
  void close() noexcept;

private:
  int fd_{-1};
};

FileHandle open_for_read(const std::string& path);
FileHandle open_for_write(const std::string& path);

// Size from fstat(2) on an open descriptor
std::uint64_t file_size(const FileHandle& f, const std::string& path);

// Returns bytes read, 0 at end of file
std::size_t read_some(const FileHandle& f, std::uint8_t* out, std::size_t n, const std::string& path);
void write_all(const FileHandle& f, const std::uint8_t* data, std::size_t n, const std::string& path);

} // namespace xfer
