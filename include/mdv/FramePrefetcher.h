#pragma once

#include <QStringList>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include "mdv/FrameQueue.h"
#include "mdv/GridFrame.h"

namespace mdv {

struct PrefetchedFrame {
  int index = -1;
  GridFramePtr frame;
};

// Shared state of one playback session. A new instance is created every
// time playback starts, so claimed indices never leak between sessions.
class PlaybackState {
 public:
  static constexpr std::size_t kQueueCapacity = 2;

  PlaybackState() : queue_(kQueueCapacity) {}

  BoundedQueue<PrefetchedFrame>& queue() { return queue_; }
  const BoundedQueue<PrefetchedFrame>& queue() const { return queue_; }

  // Returns false if `index` was already claimed in this session.
  bool claim_index(int index);
  bool is_claimed(int index) const;
  std::size_t claimed_count() const;

  void request_stop();
  bool stop_requested() const { return stop_.load(); }

  void mark_producer_finished() { producer_finished_.store(true); }
  bool producer_finished() const { return producer_finished_.load(); }

 private:
  BoundedQueue<PrefetchedFrame> queue_;
  mutable std::mutex claimed_mutex_;
  std::set<int> claimed_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> producer_finished_{false};
};

using FrameLoader = std::function<GridFramePtr(const QString&)>;

// Background reader that fills PlaybackState::queue() with the frames after
// a start index. Only file I/O happens on the worker thread.
class FramePrefetcher {
 public:
  FramePrefetcher(std::shared_ptr<PlaybackState> state, QStringList files,
                  FrameLoader loader = LoadGridFrame);
  ~FramePrefetcher();

  FramePrefetcher(const FramePrefetcher&) = delete;
  FramePrefetcher& operator=(const FramePrefetcher&) = delete;

  void start(int first_index);
  // Does not wait for the worker; the destructor joins it.
  void stop();
  bool running() const { return worker_.joinable(); }

  const std::shared_ptr<PlaybackState>& state() const { return state_; }

 private:
  void run(int first_index);

  std::shared_ptr<PlaybackState> state_;
  QStringList files_;
  FrameLoader loader_;
  std::thread worker_;
};

}  // namespace mdv
