#include "match_stream.hpp"

#include <utility>

namespace search {

MatchStream::iterator::iterator(MatchStream *stream) : stream_(stream) {
  ++*this;
}

MatchStream::iterator &MatchStream::iterator::operator++() {
  current_ = stream_->next();
  if (!current_)
    stream_ = nullptr;
  return *this;
}

MatchStream::MatchStream(std::shared_ptr<Queue> queue, std::thread producer,
                         std::shared_ptr<IRuneReader> reader)
    : queue_(std::move(queue)), producer_(std::move(producer)),
      reader_(std::move(reader)) {}

MatchStream::~MatchStream() { cancel(); }

std::optional<Match> MatchStream::next() {
  if (!queue_ || cancelled_)
    return std::nullopt;
  return queue_->wait_and_pop();
}

void MatchStream::cancel() {
  cancelled_ = true;
  if (queue_)
    queue_->shutdown();
  if (reader_ && producer_.joinable())
    reader_->interrupt();
  if (producer_.joinable())
    producer_.join();
}

size_t MatchStream::buffer_capacity() const {
  return queue_ ? queue_->capacity() : 0;
}

} // namespace search
