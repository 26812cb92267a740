#ifndef UTF8_RUNE_READER_HPP
#define UTF8_RUNE_READER_HPP

#include "base_rune_reader.hpp"

#include <atomic>
#include <cstdint>
#include <fstream>
#include <istream>
#include <string>

// Decodes UTF-8 from any input stream, one code point at a time. Reads no
// further ahead than the current sequence, so interactive input is not
// held back. An interrupt takes effect at the next call; a read already
// blocked inside the stream is not woken.
class StreamRuneReader : public IRuneReader {
public:
  explicit StreamRuneReader(std::istream &in);

  std::optional<Utils::DecodedRune> read_rune() override;
  bool has_error() const override;
  void interrupt() override { interrupted_ = true; }

  uint64_t bytes_read() const { return bytes_read_; }

private:
  std::istream &in_;
  std::string pending_;
  bool at_end_ = false;
  uint64_t bytes_read_ = 0;
  std::atomic<bool> interrupted_{false};
};

// Reads a POSIX file descriptor it does not own, such as standard input or
// a pipe. Waits for data with poll() alongside an internal wake-up pipe, so
// interrupt() releases a read blocked on an idle source.
class FdRuneReader : public IRuneReader {
public:
  explicit FdRuneReader(int fd);
  ~FdRuneReader() override;

  FdRuneReader(const FdRuneReader &) = delete;
  FdRuneReader &operator=(const FdRuneReader &) = delete;

  std::optional<Utils::DecodedRune> read_rune() override;
  bool has_error() const override { return error_; }
  void interrupt() override;

private:
  bool fill();
  bool sequence_may_continue() const;

  int fd_;
  int wake_pipe_[2] = {-1, -1};
  std::string buffer_;
  size_t position_ = 0;
  bool at_end_ = false;
  bool error_ = false;
  std::atomic<bool> interrupted_{false};
};

// An implementation of IRuneReader that owns the file it reads
class FileRuneReader : public IRuneReader {
public:
  explicit FileRuneReader(const std::string &filepath);
  ~FileRuneReader() override;

  std::optional<Utils::DecodedRune> read_rune() override;
  bool has_error() const override;
  void interrupt() override { reader_.interrupt(); }
  bool is_open() const;

private:
  std::string filepath_;
  std::ifstream file_stream_;
  StreamRuneReader reader_;
};

// Reads from an in-memory copy of the text
class StringRuneReader : public IRuneReader {
public:
  explicit StringRuneReader(std::string text);

  std::optional<Utils::DecodedRune> read_rune() override;

private:
  std::string text_;
  size_t position_ = 0;
};

#endif // UTF8_RUNE_READER_HPP
