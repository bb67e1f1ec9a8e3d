#pragma once
#include "stats.hpp"
#include "util.hpp"
#include <string>
#include <vector>

namespace xfer {

class ITransport;

struct SkippedFile {
  std::string path;
  ErrorKind kind{ErrorKind::FileIo};
  std::string message;
};

struct SendReport {
  std::vector<FileStats> sent;
  std::vector<SkippedFile> skipped;

  bool ok() const { return skipped.empty(); }
};

// Streams a fixed list of local files over one connection, in order.
//
// A file that cannot be opened is skipped and reported before any of its
// bytes reach the wire, so the stream stays valid. Any failure after a
// header has been written (socket error, source file shrinking) throws and
// ends the batch.
class Sender {
public:
  explicit Sender(ITransport& t, TransferObserver obs = {});

  // Sends one header + body. Throws Error on any failure.
  FileStats send_file(const std::string& path);

  // Sends every path, then half-closes the connection.
  SendReport send_files(const std::vector<std::string>& paths);

private:
  struct Source;
  Source open_source(const std::string& path);
  FileStats stream(Source& src);

  ITransport& t_;
  TransferObserver obs_;
  Bytes buf_;
};

// Convenience wrapper around Sender::send_files
SendReport send_files(ITransport& t, const std::vector<std::string>& paths,
                      TransferObserver obs = {});

} // namespace xfer
