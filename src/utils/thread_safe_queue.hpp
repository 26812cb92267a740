#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

// A FIFO shared between producer and consumer threads. With a non-zero
// capacity, push() blocks while the queue is full, which throttles the
// producer to the pace of the consumer.
template <typename T> class ThreadSafeQueue {
public:
  static constexpr size_t UNBOUNDED = 0;

  explicit ThreadSafeQueue(size_t capacity = UNBOUNDED)
      : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue &) = delete;
  ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

  // Blocks while full. Returns false, dropping the value, once shutdown has
  // been requested
  bool push(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
      return shutdown_requested_ || capacity_ == UNBOUNDED ||
             queue_.size() < capacity_;
    });
    if (shutdown_requested_)
      return false;

    queue_.push(std::move(value));
    not_empty_.notify_one();
    return true;
  }

  // A blocking wait_and_pop that returns nullopt on shutdown once drained
  std::optional<T> wait_and_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock,
                    [this] { return !queue_.empty() || shutdown_requested_; });
    if (queue_.empty())
      return std::nullopt;

    T value = std::move(queue_.front());
    queue_.pop();
    not_full_.notify_one();
    return value;
  }

  // Wakes every waiting thread. Values already queued can still be popped,
  // further pushes are refused
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_requested_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::queue<T> queue_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  bool shutdown_requested_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
