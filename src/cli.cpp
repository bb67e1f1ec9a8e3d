#include "xfer/cli.hpp"
#include "xfer/util.hpp"

#include <filesystem>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace xfer {

std::string usage(const std::string& prog) {
  return "Usage:\n"
         "  " + prog + " server <address:port> <directory> [--once]\n"
         "  " + prog + " client <address:port> <file> [file ...]\n\n"
         "server: receive files into <directory> (created if missing).\n"
         "        Serves one connection at a time; --once exits after the first.\n"
         "client: send the files, in order, over a single connection.\n\n"
         "Example:\n"
         "  " + prog + " server 0.0.0.0:8080 ./incoming\n"
         "  " + prog + " client 127.0.0.1:8080 a.txt b.bin\n";
}

Config parse_args(const std::vector<std::string>& args) {
  Config cfg;
  ensure(!args.empty(), ErrorKind::Usage, "missing mode");

  const std::string& mode = args[0];
  if (mode == "help" || mode == "-h" || mode == "--help") {
    cfg.mode = Mode::Help;
    return cfg;
  }

  if (mode == "server") {
    cfg.mode = Mode::Server;
    std::vector<std::string> pos;
    for (std::size_t i = 1; i < args.size(); ++i) {
      if (args[i] == "--once") { cfg.once = true; continue; }
      ensure(args[i].rfind("--", 0) != 0, ErrorKind::Usage, "unknown option '" + args[i] + "'");
      pos.push_back(args[i]);
    }
    ensure(pos.size() == 2, ErrorKind::Usage, "server mode takes <address:port> <directory>");
    cfg.endpoint = parse_endpoint(pos[0]);
    ensure(!pos[1].empty(), ErrorKind::Usage, "empty directory argument");
    cfg.directory = pos[1];
    return cfg;
  }

  if (mode == "client") {
    cfg.mode = Mode::Client;
    ensure(args.size() >= 3, ErrorKind::Usage, "client mode takes <address:port> <file> [file ...]");
    cfg.endpoint = parse_endpoint(args[1]);
    ensure(!cfg.endpoint.host.empty(), ErrorKind::Usage, "client address needs a host");
    cfg.files.assign(args.begin() + 2, args.end());
    return cfg;
  }

  fail(ErrorKind::Usage, "invalid mode '" + mode + "' (use 'server' or 'client')");
}

void check_client_files(const std::vector<std::string>& files) {
  for (const auto& f : files) {
    std::error_code ec;
    const fs::file_status st = fs::status(f, ec);
    ensure(!ec && fs::exists(st), ErrorKind::Usage, "no such file '" + f + "'");
    ensure(fs::is_regular_file(st), ErrorKind::Usage, "'" + f + "' is not a regular file");
    ensure(::access(f.c_str(), R_OK) == 0, ErrorKind::Usage, "'" + f + "' is not readable");
  }
}

} // namespace xfer
