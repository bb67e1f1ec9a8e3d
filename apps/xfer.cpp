#include "xfer/cli.hpp"
#include "xfer/framing.hpp"
#include "xfer/receiver.hpp"
#include "xfer/sender.hpp"
#include "xfer/transport.hpp"
#include "xfer/util.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

using namespace xfer;
namespace fs = std::filesystem;

static constexpr int kExitFailure = 1;
static constexpr int kExitUsage = 2;

static void print_progress(const std::string& name, std::uint64_t done, std::uint64_t total) {
  const double pct = (total > 0) ? (100.0 * (double)done / (double)total) : 100.0;
  std::cerr << "\r  " << name << ": " << done << "/" << total << " bytes ("
            << std::fixed << std::setprecision(1) << pct << "%)" << std::flush;
}

static void print_done(const char* tag, const char* verb, const FileStats& st) {
  std::cerr << "\r" << tag << " " << verb << " '" << st.name << "' (" << st.length << " bytes, "
            << std::fixed << std::setprecision(2) << st.seconds << "s, "
            << st.mb_per_sec() << " MB/s) sha256=" << st.sha256 << "\n";
}

static TransferObserver make_observer(const char* tag, const char* verb, std::string& current) {
  TransferObserver obs;
  obs.on_file_start = [&current](const FileHeader& h) { current = h.name; };
  obs.on_progress = print_progress;
  obs.on_file_done = [tag, verb, &current](const FileStats& st) {
    print_done(tag, verb, st);
    current.clear();
  };
  obs.on_file_skipped = [tag](const std::string& path, const Error& e) {
    std::cerr << tag << " skipped '" << path << "' (" << to_string(e.kind()) << "): "
              << e.what() << "\n";
  };
  return obs;
}

static int run_server(const Config& cfg) {
  std::error_code ec;
  fs::create_directories(cfg.directory, ec);
  if (ec) {
    std::cerr << "[server] error: cannot create directory '" << cfg.directory << "': "
              << ec.message() << "\n";
    return kExitFailure;
  }
  const fs::path dest = fs::absolute(cfg.directory);

  TcpListener listener;
  listener.listen(cfg.endpoint.host, cfg.endpoint.port);
  std::cerr << "[server] listening on "
            << Endpoint{cfg.endpoint.host, listener.port()}.to_string()
            << ", saving to " << dest.string() << "\n";

  for (;;) {
    std::unique_ptr<TcpTransport> t = listener.accept();
    std::cerr << "[server] accepted connection from " << t->peer() << "\n";

    std::string current;
    SessionResult res = receive_session(*t, dest, make_observer("[server]", "received", current));

    if (res.ok()) {
      std::cerr << "[server] session Done: " << res.files.size() << " file(s) received\n";
    } else {
      std::cerr << "\n[server] session Aborted during " << res.stage;
      if (!res.in_flight.empty()) std::cerr << " of '" << res.in_flight << "'";
      std::cerr << " (" << to_string(*res.error) << "): " << res.message << "\n";
    }

    if (cfg.once) return res.ok() ? 0 : kExitFailure;
  }
}

static int run_client(const Config& cfg) {
  check_client_files(cfg.files);

  TcpTransport t;
  t.connect(cfg.endpoint.host, cfg.endpoint.port);
  std::cerr << "[client] connected to " << t.peer() << "\n";

  std::string current;
  SendReport report;
  try {
    report = send_files(t, cfg.files, make_observer("[client]", "sent", current));
  } catch (const Error& e) {
    std::cerr << "\n[client] batch aborted";
    if (!current.empty()) std::cerr << " while sending '" << current << "'";
    std::cerr << " (" << to_string(e.kind()) << "): " << e.what() << "\n";
    return kExitFailure;
  }
  t.close();

  std::cerr << "[client] " << report.sent.size() << " file(s) sent";
  if (!report.skipped.empty()) std::cerr << ", " << report.skipped.size() << " skipped";
  std::cerr << "\n";
  return report.ok() ? 0 : kExitFailure;
}

int main(int argc, char** argv) {
  const std::string prog = (argc > 0) ? fs::path(argv[0]).filename().string() : "xfer";
  const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  Config cfg;
  try {
    cfg = parse_args(args);
  } catch (const Error& e) {
    std::cerr << "Error: " << e.what() << "\n\n" << usage(prog);
    return kExitUsage;
  }

  const char* tag = (cfg.mode == Mode::Server) ? "[server]" : "[client]";
  try {
    switch (cfg.mode) {
      case Mode::Help:
        std::cout << usage(prog);
        return 0;
      case Mode::Server:
        return run_server(cfg);
      case Mode::Client:
        return run_client(cfg);
    }
  } catch (const Error& e) {
    if (e.kind() == ErrorKind::Usage) {
      std::cerr << "Error: " << e.what() << "\n\n" << usage(prog);
      return kExitUsage;
    }
    std::cerr << tag << " error (" << to_string(e.kind()) << "): " << e.what() << "\n";
    return kExitFailure;
  } catch (const std::exception& e) {
    std::cerr << tag << " error: " << e.what() << "\n";
    return kExitFailure;
  }
  return kExitFailure;
}
