#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace lw {

/**
 * ThreadSafeQueue - A thread-safe wrapper around std::queue
 *
 * Provides synchronized access to queue operations for multi-threaded
 * scenarios. Consumers may either poll or block until an element arrives.
 * All public methods are thread-safe.
 *
 * @tparam T The type of elements stored in the queue
 */
template <typename T> class ThreadSafeQueue {
public:
  ThreadSafeQueue() = default;
  ~ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue &) = delete;
  ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  void push(const T &value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(value);
    }
    cv_.notify_one();
  }

  void push(T &&value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(std::move(value));
    }
    cv_.notify_one();
  }

  /**
   * Poll an element from the front of the queue
   * @param t Reference to store the popped element
   * @return true if an element was popped, false if queue was empty
   */
  bool poll(T &t) {
    std::lock_guard<std::mutex> lock(mutex_);
    return popFront(t);
  }

  /**
   * Block until an element is available or the deadline passes
   * @param t Reference to store the popped element
   * @param deadline Absolute time after which to give up
   * @return true if an element was popped, false on timeout
   */
  template <typename Clock, typename Duration>
  bool waitPollUntil(T &t,
                     const std::chrono::time_point<Clock, Duration> &deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return !queue_.empty(); });
    return popFront(t);
  }

  /**
   * Block until an element is available
   * @param t Reference to store the popped element
   */
  void waitPoll(T &t) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty(); });
    popFront(t);
  }

private:
  bool popFront(T &t) {
    if (queue_.empty()) {
      return false;
    }
    t = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> queue_;
};

} // namespace lw
