#include "io/rune_readers/lowercase_rune_reader.hpp"
#include "io/rune_readers/utf8_rune_reader.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <istream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace {

std::vector<Utils::DecodedRune> read_all(IRuneReader &reader) {
  std::vector<Utils::DecodedRune> runes;
  while (auto decoded = reader.read_rune())
    runes.push_back(*decoded);
  return runes;
}

// "a", "é", "€", "😀"
const std::string MIXED_WIDTHS = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";

// Serves `text`, then throws from underflow, which the stream turns into
// badbit
class FailingStreambuf : public std::streambuf {
public:
  explicit FailingStreambuf(std::string text) : text_(std::move(text)) {
    setg(&text_[0], &text_[0], &text_[0] + text_.size());
  }

protected:
  int_type underflow() override { throw std::runtime_error("device lost"); }

private:
  std::string text_;
};

} // namespace

TEST(RuneReaderTest, StreamReaderDecodesEveryWidth) {
  std::istringstream in(MIXED_WIDTHS);
  StreamRuneReader reader(in);
  auto runes = read_all(reader);

  ASSERT_EQ(runes.size(), 4u);
  EXPECT_EQ(runes[0].rune, U'a');
  EXPECT_EQ(runes[0].width, 1u);
  EXPECT_EQ(runes[1].rune, U'é');
  EXPECT_EQ(runes[1].width, 2u);
  EXPECT_EQ(runes[2].rune, U'€');
  EXPECT_EQ(runes[2].width, 3u);
  EXPECT_EQ(runes[3].rune, U'\U0001F600');
  EXPECT_EQ(runes[3].width, 4u);

  EXPECT_EQ(reader.bytes_read(), MIXED_WIDTHS.size());
  EXPECT_FALSE(reader.has_error());
  EXPECT_FALSE(reader.read_rune().has_value());
}

TEST(RuneReaderTest, StreamReaderReplacesInvalidBytes) {
  // Stray continuation byte, truncated euro sign, then ASCII
  std::istringstream in("\x80x\xE2\x82" "a");
  StreamRuneReader reader(in);
  auto runes = read_all(reader);

  ASSERT_EQ(runes.size(), 5u);
  EXPECT_EQ(runes[0].rune, Utils::RUNE_ERROR);
  EXPECT_EQ(runes[1].rune, U'x');
  EXPECT_EQ(runes[2].rune, Utils::RUNE_ERROR);
  EXPECT_EQ(runes[3].rune, Utils::RUNE_ERROR);
  EXPECT_EQ(runes[4].rune, U'a');
  for (const auto &decoded : runes)
    EXPECT_EQ(decoded.width, 1u);
}

TEST(RuneReaderTest, StringReaderMatchesStreamReader) {
  std::istringstream in(MIXED_WIDTHS);
  StreamRuneReader stream_reader(in);
  StringRuneReader string_reader(MIXED_WIDTHS);

  auto from_stream = read_all(stream_reader);
  auto from_string = read_all(string_reader);
  ASSERT_EQ(from_stream.size(), from_string.size());
  for (size_t i = 0; i < from_stream.size(); ++i) {
    EXPECT_EQ(from_stream[i].rune, from_string[i].rune);
    EXPECT_EQ(from_stream[i].width, from_string[i].width);
  }
}

TEST(RuneReaderTest, EmptyInputEndsImmediately) {
  std::istringstream in("");
  StreamRuneReader reader(in);
  EXPECT_FALSE(reader.read_rune().has_value());

  StringRuneReader empty("");
  EXPECT_FALSE(empty.read_rune().has_value());
}

TEST(RuneReaderTest, FileReaderThrowsForMissingFile) {
  EXPECT_THROW(FileRuneReader("/nonexistent/path/to/search.txt"),
               std::runtime_error);
}

TEST(RuneReaderTest, LowercaseReaderFoldsAsciiAndKeepsWidths) {
  LowercaseRuneReader reader(
      std::make_unique<StringRuneReader>("AbC\xC3\xA9"));
  auto runes = read_all(reader);

  ASSERT_EQ(runes.size(), 4u);
  EXPECT_EQ(runes[0].rune, U'a');
  EXPECT_EQ(runes[1].rune, U'b');
  EXPECT_EQ(runes[2].rune, U'c');
  EXPECT_EQ(runes[3].rune, U'é');
  EXPECT_EQ(runes[3].width, 2u);
}

TEST(RuneReaderTest, LowercaseReaderRejectsNull) {
  EXPECT_THROW(LowercaseRuneReader(nullptr), std::invalid_argument);
}

TEST(RuneReaderTest, StreamReaderReportsReadFailure) {
  FailingStreambuf source("ok");
  std::istream in(&source);
  StreamRuneReader reader(in);

  auto runes = read_all(reader);
  ASSERT_EQ(runes.size(), 2u);
  EXPECT_EQ(runes[0].rune, U'o');
  EXPECT_EQ(runes[1].rune, U'k');
  EXPECT_TRUE(reader.has_error());
  EXPECT_FALSE(reader.read_rune().has_value());
}

TEST(RuneReaderTest, StreamReaderStopsAfterInterrupt) {
  std::istringstream in("abc");
  LowercaseRuneReader reader(std::make_unique<StreamRuneReader>(in));
  ASSERT_TRUE(reader.read_rune().has_value());

  reader.interrupt();
  EXPECT_FALSE(reader.read_rune().has_value());
  EXPECT_FALSE(reader.has_error());
}

TEST(RuneReaderTest, FdReaderJoinsSequencesSplitAcrossWrites) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  FdRuneReader reader(fds[0]);

  // The euro sign arrives in two pieces
  std::thread writer([&fds] {
    EXPECT_EQ(::write(fds[1], "a\xE2", 2), 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(::write(fds[1], "\x82\xACz", 3), 3);
    ::close(fds[1]);
  });
  auto runes = read_all(reader);
  writer.join();
  ::close(fds[0]);

  ASSERT_EQ(runes.size(), 3u);
  EXPECT_EQ(runes[0].rune, U'a');
  EXPECT_EQ(runes[1].rune, U'€');
  EXPECT_EQ(runes[1].width, 3u);
  EXPECT_EQ(runes[2].rune, U'z');
  EXPECT_FALSE(reader.has_error());
}

TEST(RuneReaderTest, FdReaderInterruptReleasesBlockedRead) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  FdRuneReader reader(fds[0]);

  auto pending = std::async(std::launch::async,
                            [&reader] { return reader.read_rune(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  reader.interrupt();

  bool released = pending.wait_for(std::chrono::seconds(5)) ==
                  std::future_status::ready;
  // Closing the write end ends the read either way
  ::close(fds[1]);
  EXPECT_TRUE(released);
  EXPECT_FALSE(pending.get().has_value());
  EXPECT_FALSE(reader.has_error());
  ::close(fds[0]);
}

TEST(RuneReaderTest, FdReaderReportsReadFailure) {
  // read() on a directory fails with EISDIR
  int fd = ::open("/", O_RDONLY | O_DIRECTORY);
  ASSERT_GE(fd, 0);
  FdRuneReader reader(fd);

  EXPECT_FALSE(reader.read_rune().has_value());
  EXPECT_TRUE(reader.has_error());
  ::close(fd);
}
