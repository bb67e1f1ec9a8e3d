#include "xfer/receiver.hpp"
#include "xfer/framing.hpp"
#include "xfer/transport.hpp"
#include "xfer/util.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace fs = std::filesystem;

namespace xfer {

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::AwaitHeader:   return "AwaitHeader";
    case SessionState::ReceivingBody: return "ReceivingBody";
    case SessionState::Done:          return "Done";
    case SessionState::Aborted:       return "Aborted";
  }
  return "Unknown";
}

std::string sanitize_filename(const std::string& name) {
  ensure(name.find('\0') == std::string::npos, ErrorKind::MalformedHeader,
         "filename contains a NUL byte");
  const std::size_t slash = name.find_last_of("/\\");
  std::string base = (slash == std::string::npos) ? name : name.substr(slash + 1);
  if (base.empty() || base == "." || base == "..") {
    fail(ErrorKind::MalformedHeader, "filename '" + name + "' has no usable basename");
  }
  return base;
}

fs::path resolve_destination(const fs::path& dest_dir, const std::string& name) {
  const fs::path dest = dest_dir / sanitize_filename(name);
  const fs::path dir = (dest_dir / "").lexically_normal().parent_path();
  ensure(dest.lexically_normal().parent_path() == dir, ErrorKind::MalformedHeader,
         "filename '" + name + "' escapes the destination directory");
  return dest;
}

Receiver::Receiver(ITransport& t, fs::path dest_dir, TransferObserver obs)
  : t_(t), dest_dir_(std::move(dest_dir)), obs_(std::move(obs)) {}

FileStats Receiver::receive_body(const FileHeader& h, const fs::path& dest) {
  if (buf_.empty()) buf_.resize(kChunkSize);

  const auto start = std::chrono::steady_clock::now();
  const std::string dest_str = dest.string();
  FileHandle out = open_for_write(dest_str);

  Sha256 digest;
  std::uint64_t done = 0;
  while (done < h.length) {
    // Never ask for more than this body still owes; the next header follows it
    const std::size_t want = (std::size_t)std::min<std::uint64_t>(buf_.size(), h.length - done);
    const std::size_t n = t_.recv_some(buf_.data(), want);
    if (n == 0) {
      fail(ErrorKind::TruncatedBody,
           "connection closed after " + std::to_string(done) + " of " +
           std::to_string(h.length) + " body bytes");
    }
    write_all(out, buf_.data(), n, dest_str);
    digest.update(buf_.data(), n);
    done += n;
    if (obs_.on_progress) obs_.on_progress(h.name, done, h.length);
  }

  FileStats st;
  st.name = dest.filename().string();
  st.length = h.length;
  st.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  st.sha256 = digest.final_hex();
  return st;
}

bool Receiver::receive_one(SessionResult& result) {
  state_ = SessionState::AwaitHeader;
  current_.clear();

  std::optional<FileHeader> h = recv_header(t_);
  if (!h) return false;
  const fs::path dest = resolve_destination(dest_dir_, h->name);

  state_ = SessionState::ReceivingBody;
  current_ = dest.filename().string();
  if (obs_.on_file_start) obs_.on_file_start(*h);

  FileStats st = receive_body(*h, dest);
  if (obs_.on_file_done) obs_.on_file_done(st);
  result.files.push_back(std::move(st));
  return true;
}

SessionResult Receiver::run() {
  SessionResult result;
  try {
    while (receive_one(result)) {
    }
    state_ = SessionState::Done;
  } catch (const Error& e) {
    result.error = e.kind();
    result.message = e.what();
    result.stage = (state_ == SessionState::ReceivingBody) ? "body" : "header";
    result.in_flight = current_;
    state_ = SessionState::Aborted;
  }
  t_.close();
  result.state = state_;
  return result;
}

SessionResult receive_session(ITransport& t, const fs::path& dest_dir, TransferObserver obs) {
  Receiver r(t, dest_dir, std::move(obs));
  return r.run();
}

} // namespace xfer
