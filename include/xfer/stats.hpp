#pragma once
#include "xfer.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace xfer {

class Error;
struct FileHeader;

// Outcome of one fully transferred file body
struct FileStats {
  std::string name;
  std::uint64_t length{0};
  double seconds{0.0};
  std::string sha256;  // lowercase hex over the body bytes

  double mb_per_sec() const;
};

// Optional callbacks; the pipelines never print by themselves
struct TransferObserver {
  std::function<void(const FileHeader&)> on_file_start;
  std::function<void(const std::string& name, std::uint64_t done, std::uint64_t total)> on_progress;
  std::function<void(const FileStats&)> on_file_done;
  std::function<void(const std::string& path, const Error&)> on_file_skipped;
};

} // namespace xfer
