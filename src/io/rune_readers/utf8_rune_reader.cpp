#include "utf8_rune_reader.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace {

// Length announced by a lead byte; 1 for bytes that cannot start a sequence
size_t sequence_width(unsigned char lead) {
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 1;
}

} // namespace

StreamRuneReader::StreamRuneReader(std::istream &in) : in_(in) {}

std::optional<Utils::DecodedRune> StreamRuneReader::read_rune() {
  if (interrupted_)
    return std::nullopt;
  if (pending_.empty()) {
    char lead;
    if (at_end_ || !in_.get(lead)) {
      at_end_ = true;
      return std::nullopt;
    }
    pending_ += lead;
  }

  const size_t needed = sequence_width(static_cast<unsigned char>(pending_[0]));
  while (pending_.size() < needed && !at_end_) {
    int next = in_.peek();
    if (next == std::char_traits<char>::eof()) {
      at_end_ = true;
      break;
    }
    if ((next & 0xC0) != 0x80)
      break;
    pending_ += static_cast<char>(in_.get());
  }

  // Bytes left over from an invalid sequence are decoded on later calls
  Utils::DecodedRune decoded = Utils::decode_utf8(pending_);
  pending_.erase(0, decoded.width);
  bytes_read_ += decoded.width;
  return decoded;
}

bool StreamRuneReader::has_error() const { return in_.bad(); }

FdRuneReader::FdRuneReader(int fd) : fd_(fd) {
  if (::pipe(wake_pipe_) != 0)
    throw std::runtime_error(std::string("Failed to create wake-up pipe: ") +
                             std::strerror(errno));
  // A second interrupt must not block on a full pipe
  int flags = ::fcntl(wake_pipe_[1], F_GETFL);
  if (flags < 0 || ::fcntl(wake_pipe_[1], F_SETFL, flags | O_NONBLOCK) < 0)
    LOG(LogLevel::WARN, LogComponent::IO_READER,
        "Could not make wake-up pipe non-blocking: " << std::strerror(errno));
}

FdRuneReader::~FdRuneReader() {
  for (int end : wake_pipe_)
    if (end >= 0)
      ::close(end);
}

void FdRuneReader::interrupt() {
  interrupted_ = true;
  const char wake = 1;
  if (::write(wake_pipe_[1], &wake, 1) < 0 && errno != EAGAIN)
    LOG(LogLevel::WARN, LogComponent::IO_READER,
        "Wake-up write failed: " << std::strerror(errno));
}

// Appends whatever the descriptor has ready. False at end of input, after an
// error or once interrupted
bool FdRuneReader::fill() {
  if (at_end_ || interrupted_)
    return false;

  pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_pipe_[0], POLLIN, 0}};
  while (::poll(fds, 2, -1) < 0) {
    if (errno == EINTR)
      continue;
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "poll on descriptor " << fd_ << " failed: " << std::strerror(errno));
    error_ = at_end_ = true;
    return false;
  }
  if (interrupted_ || (fds[1].revents & POLLIN))
    return false;

  char chunk[4096];
  ssize_t n;
  do {
    n = ::read(fd_, chunk, sizeof(chunk));
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "read on descriptor " << fd_ << " failed: " << std::strerror(errno));
    error_ = at_end_ = true;
    return false;
  }
  if (n == 0) {
    at_end_ = true;
    return false;
  }

  buffer_.erase(0, position_);
  position_ = 0;
  buffer_.append(chunk, static_cast<size_t>(n));
  return true;
}

// True while the buffered tail is a sequence that more bytes could complete
bool FdRuneReader::sequence_may_continue() const {
  const size_t available = buffer_.size() - position_;
  if (available >=
      sequence_width(static_cast<unsigned char>(buffer_[position_])))
    return false;
  for (size_t i = position_ + 1; i < buffer_.size(); ++i)
    if ((static_cast<unsigned char>(buffer_[i]) & 0xC0) != 0x80)
      return false;
  return true;
}

std::optional<Utils::DecodedRune> FdRuneReader::read_rune() {
  if (interrupted_)
    return std::nullopt;
  if (position_ >= buffer_.size() && !fill())
    return std::nullopt;
  while (sequence_may_continue() && fill()) {
  }
  if (interrupted_)
    return std::nullopt;

  Utils::DecodedRune decoded =
      Utils::decode_utf8(std::string_view(buffer_).substr(position_));
  position_ += decoded.width;
  return decoded;
}

FileRuneReader::FileRuneReader(const std::string &filepath)
    : filepath_(filepath), file_stream_(filepath, std::ios::binary),
      reader_(file_stream_) {
  if (!is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open search file: " << filepath);
    throw std::runtime_error("Failed to open search file: " + filepath);
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Successfully opened search file: " << filepath);
}

FileRuneReader::~FileRuneReader() {
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "FileRuneReader closed " << filepath_ << ". Total bytes read: "
                               << reader_.bytes_read());
}

std::optional<Utils::DecodedRune> FileRuneReader::read_rune() {
  return reader_.read_rune();
}

bool FileRuneReader::has_error() const { return reader_.has_error(); }

bool FileRuneReader::is_open() const { return file_stream_.is_open(); }

StringRuneReader::StringRuneReader(std::string text) : text_(std::move(text)) {}

std::optional<Utils::DecodedRune> StringRuneReader::read_rune() {
  if (position_ >= text_.size())
    return std::nullopt;
  Utils::DecodedRune decoded =
      Utils::decode_utf8(std::string_view(text_).substr(position_));
  position_ += decoded.width;
  return decoded;
}
