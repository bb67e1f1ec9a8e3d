#pragma once
#include "transport.hpp"
#include <string>
#include <vector>

namespace xfer {

enum class Mode { Server, Client, Help };

struct Config {
  Mode mode{Mode::Help};
  Endpoint endpoint;
  std::string directory;            // server
  std::vector<std::string> files;   // client, in send order
  bool once{false};                 // server: serve one session then exit
};

// args excludes the program name. Throws Error(Usage) on a malformed
// invocation; performs no filesystem checks.
Config parse_args(const std::vector<std::string>& args);

// Client files must be existing, readable regular files; throws Error(Usage)
// naming the first offending path.
void check_client_files(const std::vector<std::string>& files);

std::string usage(const std::string& prog);

} // namespace xfer
