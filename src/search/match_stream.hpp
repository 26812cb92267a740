#ifndef MATCH_STREAM_HPP
#define MATCH_STREAM_HPP

#include "io/rune_readers/base_rune_reader.hpp"
#include "match.hpp"
#include "utils/thread_safe_queue.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <thread>

namespace search {

// The consumer end of a running search. Matches are produced on a separate
// thread into a bounded queue; the producer blocks while the queue is full.
// The sequence can be consumed once. Destroying the stream abandons the search:
// the reader is interrupted and the producer joined.
class MatchStream {
public:
  using Queue = ThreadSafeQueue<Match>;

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Match;
    using difference_type = std::ptrdiff_t;
    using pointer = const Match *;
    using reference = const Match &;

    iterator() = default;
    explicit iterator(MatchStream *stream);

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }

    iterator &operator++();
    void operator++(int) { ++*this; }

    friend bool operator==(const iterator &a, const iterator &b) {
      return a.stream_ == b.stream_;
    }
    friend bool operator!=(const iterator &a, const iterator &b) {
      return !(a == b);
    }

  private:
    MatchStream *stream_ = nullptr;
    std::optional<Match> current_;
  };

  MatchStream(std::shared_ptr<Queue> queue, std::thread producer,
              std::shared_ptr<IRuneReader> reader = nullptr);
  MatchStream(MatchStream &&other) noexcept = default;
  MatchStream &operator=(MatchStream &&) = delete;
  MatchStream(const MatchStream &) = delete;
  MatchStream &operator=(const MatchStream &) = delete;
  ~MatchStream();

  // Blocks until the next match is available. nullopt once the search is
  // exhausted or cancelled
  std::optional<Match> next();

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

  // Stops the producer, waking it if it is blocked on input, and waits for
  // it. Matches not yet consumed are lost
  void cancel();

  size_t buffer_capacity() const;

private:
  std::shared_ptr<Queue> queue_;
  std::thread producer_;
  std::shared_ptr<IRuneReader> reader_;
  bool cancelled_ = false;
};

} // namespace search

#endif // MATCH_STREAM_HPP
