#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace relay_core {

/**
 * @class Channel
 * @brief Unbounded multi-producer blocking queue.
 *
 * Producers never block. Consumers wait until an item arrives or the
 * deadline passes.
 */
template <typename T>
class Channel {
 public:
  Channel() = default;
  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
  }

  std::optional<T> pop_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_until(lock, deadline, [this] { return !items_.empty(); });
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

 private:
  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<T> items_;
};

}  // namespace relay_core
