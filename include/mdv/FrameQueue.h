#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace mdv {

// Fixed-capacity FIFO shared between one producer thread and the UI thread.
// The producer blocks when full; the consumer never blocks.
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Blocking push. Returns false if the queue is closed while waiting.
  bool push(T item) {
    std::unique_lock<std::mutex> lock(m_);
    not_full_.wait(lock,
                   [&] { return closed_ || items_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(item));
    return true;
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(m_);
    if (items_.empty()) {
      return std::nullopt;
    }
    T out = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return out;
  }

  // Wakes a blocked producer; later pushes are rejected.
  void close() {
    std::lock_guard<std::mutex> lock(m_);
    closed_ = true;
    not_full_.notify_all();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(m_);
    items_.clear();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(m_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_);
    return items_.size();
  }

  bool empty() const { return size() == 0; }
  std::size_t capacity() const { return capacity_; }

 private:
  mutable std::mutex m_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  std::size_t capacity_;
  bool closed_ = false;
};

}  // namespace mdv
