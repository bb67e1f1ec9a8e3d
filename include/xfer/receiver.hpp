#pragma once
#include "stats.hpp"
#include "util.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace xfer {

class ITransport;

enum class SessionState { AwaitHeader, ReceivingBody, Done, Aborted };

const char* to_string(SessionState s);

struct SessionResult {
  SessionState state{SessionState::AwaitHeader};
  std::vector<FileStats> files;  // completed files, in arrival order

  // Set only when state == Aborted
  std::optional<ErrorKind> error;
  std::string message;
  std::string stage;      // "header" or "body"
  std::string in_flight;  // file being written when the body failed

  bool ok() const { return state == SessionState::Done; }
};

// Strips every directory component ('/' and '\\'). Throws
// Error(MalformedHeader) if nothing usable remains.
std::string sanitize_filename(const std::string& name);

// dest_dir joined with the sanitized basename; never escapes dest_dir
std::filesystem::path resolve_destination(const std::filesystem::path& dest_dir,
                                          const std::string& name);

// Drives one accepted connection through AwaitHeader -> ReceivingBody ->
// ... -> Done | Aborted. dest_dir must already exist. A body cut short is
// left on disk truncated; existing files are overwritten.
class Receiver {
public:
  Receiver(ITransport& t, std::filesystem::path dest_dir, TransferObserver obs = {});

  // Runs the session to completion and closes the transport. Session-fatal
  // protocol and I/O errors are reported in the result, not thrown.
  SessionResult run();

  SessionState state() const { return state_; }

private:
  // false once the peer closed cleanly at a frame boundary
  bool receive_one(SessionResult& result);
  FileStats receive_body(const FileHeader& h, const std::filesystem::path& dest);

  ITransport& t_;
  std::filesystem::path dest_dir_;
  TransferObserver obs_;
  SessionState state_{SessionState::AwaitHeader};
  std::string current_;
  Bytes buf_;
};

SessionResult receive_session(ITransport& t, const std::filesystem::path& dest_dir,
                              TransferObserver obs = {});

} // namespace xfer
