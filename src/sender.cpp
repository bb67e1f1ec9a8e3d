#include "xfer/sender.hpp"
#include "xfer/framing.hpp"
#include "xfer/transport.hpp"
#include "xfer/util.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <optional>
#include <utility>

namespace fs = std::filesystem;

namespace xfer {

struct Sender::Source {
  std::string path;
  FileHandle file;
  FileHeader header;
};

Sender::Sender(ITransport& t, TransferObserver obs)
  : t_(t), obs_(std::move(obs)) {}

// Everything that can fail here happens before the header hits the wire
Sender::Source Sender::open_source(const std::string& path) {
  Source src;
  src.path = path;
  src.file = open_for_read(path);
  src.header.name = fs::path(path).filename().string();
  src.header.length = file_size(src.file, path);
  ensure(!src.header.name.empty() && src.header.name.size() <= kMaxNameLen,
         ErrorKind::FileIo, "'" + path + "' has no usable file name");
  return src;
}

FileStats Sender::stream(Source& src) {
  if (buf_.empty()) buf_.resize(kChunkSize);

  const auto start = std::chrono::steady_clock::now();
  if (obs_.on_file_start) obs_.on_file_start(src.header);

  send_header(t_, src.header);

  Sha256 digest;
  const std::uint64_t total = src.header.length;
  std::uint64_t done = 0;
  while (done < total) {
    const std::size_t want = (std::size_t)std::min<std::uint64_t>(buf_.size(), total - done);
    const std::size_t n = read_some(src.file, buf_.data(), want, src.path);
    if (n == 0) {
      fail(ErrorKind::FileIo,
           "'" + src.path + "' shrank during transfer (" + std::to_string(done) + " of " +
           std::to_string(total) + " bytes sent)");
    }
    t_.send_all(buf_.data(), n);
    digest.update(buf_.data(), n);
    done += n;
    if (obs_.on_progress) obs_.on_progress(src.header.name, done, total);
  }

  FileStats st;
  st.name = src.header.name;
  st.length = total;
  st.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  st.sha256 = digest.final_hex();
  if (obs_.on_file_done) obs_.on_file_done(st);
  return st;
}

FileStats Sender::send_file(const std::string& path) {
  Source src = open_source(path);
  return stream(src);
}

SendReport Sender::send_files(const std::vector<std::string>& paths) {
  SendReport report;
  for (const auto& path : paths) {
    std::optional<Source> src;
    try {
      src = open_source(path);
    } catch (const Error& e) {
      report.skipped.push_back(SkippedFile{path, e.kind(), e.what()});
      if (obs_.on_file_skipped) obs_.on_file_skipped(path, e);
      continue;
    }
    report.sent.push_back(stream(*src));
  }
  t_.shutdown_write();
  return report;
}

SendReport send_files(ITransport& t, const std::vector<std::string>& paths,
                      TransferObserver obs) {
  Sender s(t, std::move(obs));
  return s.send_files(paths);
}

} // namespace xfer
