#include "xfer/framing.hpp"
#include "xfer/sender.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

using namespace xfer;
using namespace xfer::test;
namespace fs = std::filesystem;

class SenderTest : public ::testing::Test {
protected:
  std::string make(const std::string& name, const Bytes& content) {
    const fs::path p = dir / name;
    fs::create_directories(p.parent_path());
    write_file(p, content);
    return p.string();
  }

  TempDir dir;
};

TEST_F(SenderTest, WritesHeaderThenBodyPerFileAndHalfCloses) {
  const std::string a = make("a.txt", to_bytes("ABC"));
  const std::string b = make("b.bin", Bytes{});
  MemoryTransport t;

  SendReport report = send_files(t, {a, b});

  Bytes expected = encode_header("a.txt", 3);
  append(expected, to_bytes("ABC"));
  append(expected, encode_header("b.bin", 0));
  EXPECT_EQ(t.out, expected);
  EXPECT_TRUE(t.write_shut);
  EXPECT_TRUE(report.ok());
  ASSERT_EQ(report.sent.size(), 2u);
  EXPECT_EQ(report.sent[0].name, "a.txt");
  EXPECT_EQ(report.sent[0].sha256, sha256_hex(to_bytes("ABC")));
  EXPECT_EQ(report.sent[1].length, 0u);
}

TEST_F(SenderTest, HeaderCarriesBasenameOnly) {
  const std::string p = make("nested/deeper/data.csv", to_bytes("1,2"));
  MemoryTransport t;
  Sender s(t);
  s.send_file(p);

  MemoryTransport in(t.out);
  auto h = recv_header(in);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->name, "data.csv");
  EXPECT_EQ(h->length, 3u);
}

TEST_F(SenderTest, MultiChunkBodyIsSentVerbatim) {
  const Bytes content = pattern(2 * kChunkSize + 5, 3);
  const std::string p = make("big.bin", content);
  MemoryTransport t;

  send_files(t, {p});

  Bytes expected = encode_header("big.bin", content.size());
  append(expected, content);
  EXPECT_EQ(t.out, expected);
}

TEST_F(SenderTest, MissingFileIsSkippedAndBatchContinues) {
  const std::string a = make("a.txt", to_bytes("A"));
  const std::string missing = (dir / "nope.txt").string();
  const std::string c = make("c.txt", to_bytes("C"));
  MemoryTransport t;

  std::vector<std::string> skipped;
  TransferObserver obs;
  obs.on_file_skipped = [&](const std::string& path, const Error& e) {
    skipped.push_back(path);
    EXPECT_EQ(e.kind(), ErrorKind::FileNotFound);
  };
  SendReport report = send_files(t, {a, missing, c}, obs);

  EXPECT_FALSE(report.ok());
  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.skipped[0].path, missing);
  EXPECT_EQ(report.skipped[0].kind, ErrorKind::FileNotFound);
  EXPECT_EQ(skipped, std::vector<std::string>{missing});
  ASSERT_EQ(report.sent.size(), 2u);

  Bytes expected = encode_header("a.txt", 1);
  append(expected, to_bytes("A"));
  append(expected, encode_header("c.txt", 1));
  append(expected, to_bytes("C"));
  EXPECT_EQ(t.out, expected);
}

TEST_F(SenderTest, UnreadableFileIsPermissionDenied) {
  if (::geteuid() == 0) GTEST_SKIP() << "root bypasses file permissions";
  const std::string p = make("secret.txt", to_bytes("s"));
  ASSERT_EQ(::chmod(p.c_str(), 0), 0);
  MemoryTransport t;

  SendReport report = send_files(t, {p});

  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.skipped[0].kind, ErrorKind::PermissionDenied);
  EXPECT_TRUE(t.out.empty());
}

TEST_F(SenderTest, SendFileThrowsForMissingPath) {
  MemoryTransport t;
  Sender s(t);
  try {
    s.send_file((dir / "missing").string());
    FAIL() << "expected FileNotFound";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::FileNotFound);
  }
  EXPECT_TRUE(t.out.empty());
}

TEST_F(SenderTest, SocketFailureAbortsRemainingFiles) {
  const std::string a = make("a.bin", pattern(100));
  const std::string b = make("b.bin", pattern(100));
  MemoryTransport t;
  t.send_limit = 50;

  int started = 0;
  TransferObserver obs;
  obs.on_file_start = [&](const FileHeader&) { ++started; };
  try {
    send_files(t, {a, b}, obs);
    FAIL() << "expected ConnectionError";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Connection);
  }
  EXPECT_EQ(started, 1);
  EXPECT_EQ(t.out.size(), 50u);
  EXPECT_FALSE(t.write_shut);
}

TEST_F(SenderTest, DirectoryArgumentIsSkipped) {
  fs::create_directory(dir / "folder");
  MemoryTransport t;

  SendReport report = send_files(t, {(dir / "folder").string()});

  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.skipped[0].kind, ErrorKind::FileIo);
  EXPECT_TRUE(t.out.empty());
  EXPECT_TRUE(t.write_shut);
}
