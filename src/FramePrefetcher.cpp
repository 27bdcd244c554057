#include "mdv/FramePrefetcher.h"

#include <QFileInfo>

#include <algorithm>
#include <exception>
#include <utility>

#include "mdv/Errors.h"
#include "mdv/Log.h"

namespace mdv {

bool PlaybackState::claim_index(int index) {
  std::lock_guard<std::mutex> lock(claimed_mutex_);
  return claimed_.insert(index).second;
}

bool PlaybackState::is_claimed(int index) const {
  std::lock_guard<std::mutex> lock(claimed_mutex_);
  return claimed_.count(index) > 0;
}

std::size_t PlaybackState::claimed_count() const {
  std::lock_guard<std::mutex> lock(claimed_mutex_);
  return claimed_.size();
}

void PlaybackState::request_stop() {
  stop_.store(true);
  queue_.close();
}

FramePrefetcher::FramePrefetcher(std::shared_ptr<PlaybackState> state,
                                 QStringList files, FrameLoader loader)
    : state_(std::move(state)),
      files_(std::move(files)),
      loader_(std::move(loader)) {}

FramePrefetcher::~FramePrefetcher() {
  stop();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void FramePrefetcher::start(int first_index) {
  if (worker_.joinable() || !state_) {
    return;
  }
  worker_ = std::thread([this, first_index]() { run(first_index); });
}

void FramePrefetcher::stop() {
  if (state_) {
    state_->request_stop();
  }
}

void FramePrefetcher::run(int first_index) {
  qCDebug(lcPrefetch) << "worker started at" << first_index << "of"
                      << files_.size();
  for (int i = std::max(0, first_index); i < files_.size(); ++i) {
    if (state_->stop_requested()) {
      break;
    }
    if (!state_->claim_index(i)) {
      continue;
    }
    GridFramePtr frame;
    try {
      frame = loader_(files_[i]);
    } catch (const LoadError& e) {
      qCWarning(lcPrefetch) << "skipping frame" << i << e.what();
      continue;
    } catch (const std::exception& e) {
      qCWarning(lcPrefetch) << "skipping frame" << i
                            << QFileInfo(files_[i]).fileName() << e.what();
      continue;
    }
    if (!frame) {
      continue;
    }
    if (!state_->queue().push(PrefetchedFrame{i, std::move(frame)})) {
      break;
    }
  }
  state_->mark_producer_finished();
  qCDebug(lcPrefetch) << "worker finished";
}

}  // namespace mdv
