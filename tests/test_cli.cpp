#include "xfer/cli.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace xfer;

namespace {

ErrorKind kind_of(const std::vector<std::string>& args) {
  try {
    parse_args(args);
  } catch (const Error& e) {
    return e.kind();
  }
  ADD_FAILURE() << "parse_args accepted a malformed invocation";
  return ErrorKind::FileIo;
}

} // namespace

TEST(Endpoint, ParsesHostAndPort) {
  Endpoint ep = parse_endpoint("127.0.0.1:8080");
  EXPECT_EQ(ep.host, "127.0.0.1");
  EXPECT_EQ(ep.port, 8080);
  EXPECT_EQ(ep.to_string(), "127.0.0.1:8080");
}

TEST(Endpoint, ParsesBracketedIpv6) {
  Endpoint ep = parse_endpoint("[::1]:9000");
  EXPECT_EQ(ep.host, "::1");
  EXPECT_EQ(ep.port, 9000);
  EXPECT_EQ(ep.to_string(), "[::1]:9000");
}

TEST(Endpoint, EmptyHostMeansAnyInterface) {
  Endpoint ep = parse_endpoint(":8080");
  EXPECT_TRUE(ep.host.empty());
  EXPECT_EQ(ep.port, 8080);
}

TEST(Endpoint, RejectsBadInput) {
  for (const std::string bad : std::vector<std::string>{
           "localhost", "host:", "host:0", "host:65536", "host:8o", "::1:80", "[::1]80", "[::1"}) {
    try {
      parse_endpoint(bad);
      ADD_FAILURE() << "accepted '" << bad << "'";
    } catch (const Error& e) {
      EXPECT_EQ(e.kind(), ErrorKind::Usage) << bad;
    }
  }
}

TEST(Cli, ServerMode) {
  Config cfg = parse_args({"server", "0.0.0.0:8080", "/tmp/out"});
  EXPECT_EQ(cfg.mode, Mode::Server);
  EXPECT_EQ(cfg.endpoint.port, 8080);
  EXPECT_EQ(cfg.directory, "/tmp/out");
  EXPECT_FALSE(cfg.once);

  Config once = parse_args({"server", "--once", ":9000", "dir"});
  EXPECT_TRUE(once.once);
  EXPECT_EQ(once.directory, "dir");
}

TEST(Cli, ClientModeKeepsFileOrder) {
  Config cfg = parse_args({"client", "example.org:8080", "b.txt", "a.txt", "c.txt"});
  EXPECT_EQ(cfg.mode, Mode::Client);
  EXPECT_EQ(cfg.endpoint.host, "example.org");
  EXPECT_EQ(cfg.files, (std::vector<std::string>{"b.txt", "a.txt", "c.txt"}));
}

TEST(Cli, Help) {
  EXPECT_EQ(parse_args({"--help"}).mode, Mode::Help);
  EXPECT_EQ(parse_args({"help"}).mode, Mode::Help);
  EXPECT_NE(usage("xfer").find("xfer client"), std::string::npos);
}

TEST(Cli, MalformedInvocationsAreUsageErrors) {
  EXPECT_EQ(kind_of({}), ErrorKind::Usage);
  EXPECT_EQ(kind_of({"upload", "h:1", "x"}), ErrorKind::Usage);
  EXPECT_EQ(kind_of({"server", "h:1"}), ErrorKind::Usage);
  EXPECT_EQ(kind_of({"server", "h:1", "d", "extra"}), ErrorKind::Usage);
  EXPECT_EQ(kind_of({"server", "h:1", "d", "--bogus"}), ErrorKind::Usage);
  EXPECT_EQ(kind_of({"client", "h:1"}), ErrorKind::Usage);
  EXPECT_EQ(kind_of({"client", ":1", "f"}), ErrorKind::Usage);
  EXPECT_EQ(kind_of({"client", "nohostport", "f"}), ErrorKind::Usage);
}

TEST(Cli, ClientFilesMustExist) {
  xfer::test::TempDir dir;
  xfer::test::write_file(dir / "real.txt", xfer::test::to_bytes("x"));

  EXPECT_NO_THROW(check_client_files({(dir / "real.txt").string()}));
  EXPECT_THROW(check_client_files({(dir / "real.txt").string(), (dir / "ghost").string()}), Error);
  EXPECT_THROW(check_client_files({dir.path().string()}), Error);
}
