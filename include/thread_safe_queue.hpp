#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace chanscan {

// Unbounded queue between the scan loop and the channel log writer.
// pop() blocks until an item arrives or stop() was called and the queue
// drained.
template <typename T>
class ThreadSafeQueue {
public:
  void push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
  }

  bool pop(T &value) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return !queue_.empty() || stopped_; });
    if (queue_.empty()) {
      return false;
    }
    value = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  // Takes everything queued without blocking.
  std::deque<T> drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::deque<T> out;
    out.swap(queue_);
    return out;
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool stopped_{false};
};

} // namespace chanscan

