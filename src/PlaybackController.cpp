#include "mdv/PlaybackController.h"

#include <QFileInfo>
#include <QTimer>

#include <algorithm>
#include <exception>
#include <utility>

#include "mdv/Errors.h"
#include "mdv/Log.h"

namespace mdv {

PlaybackController::PlaybackController(QObject* parent, FrameLoader loader)
    : QObject(parent), loader_(std::move(loader)) {
  if (!loader_) {
    loader_ = LoadGridFrame;
  }
  tick_timer_ = new QTimer(this);
  tick_timer_->setSingleShot(true);
  connect(tick_timer_, &QTimer::timeout, this, &PlaybackController::on_tick);

  auto_update_timer_ = new QTimer(this);
  connect(auto_update_timer_, &QTimer::timeout, this,
          &PlaybackController::on_auto_update_tick);
}

PlaybackController::~PlaybackController() {
  tick_timer_->stop();
  auto_update_timer_->stop();
  release_prefetcher();
}

void PlaybackController::set_series(const SeriesDescriptor& series) {
  stop_playback();
  set_auto_update(false);
  release_prefetcher();
  playback_.reset();
  series_ = series;
  current_index_ = -1;
  current_frame_.reset();
  emit series_changed();
  if (!series_.empty()) {
    show_frame(0);
  }
}

void PlaybackController::set_frame_delay(int ms) {
  frame_delay_ms_ = std::max(1, ms);
}

void PlaybackController::set_auto_update_interval(int ms) {
  auto_update_ms_ = std::max(1, ms);
  if (auto_update_timer_->isActive()) {
    auto_update_timer_->start(auto_update_ms_);
  }
}

bool PlaybackController::start_playback() {
  if (state_ == State::kPlaying) {
    return true;
  }
  if (series_.empty()) {
    emit status("No file series loaded.");
    return false;
  }
  if (auto_update_) {
    emit status("Stop auto update before starting playback.");
    return false;
  }

  int start = current_index_;
  if (start < 0 || start >= series_.size() - 1) {
    start = 0;
  }

  release_prefetcher();
  playback_ = std::make_shared<PlaybackState>();
  playback_->claim_index(start);

  GridFramePtr first;
  try {
    first = loader_(series_.files[start]);
  } catch (const std::exception& e) {
    qCWarning(lcPlayback) << "cannot start playback:" << e.what();
    playback_.reset();
    emit status(QString("Failed to load %1: %2")
                    .arg(QFileInfo(series_.files[start]).fileName(),
                         QString::fromUtf8(e.what())));
    return false;
  }

  state_ = State::kPlaying;
  set_current(start, std::move(first));
  emit playback_started();
  qCInfo(lcPlayback) << "playback started at" << start << "of"
                     << series_.size();

  prefetcher_ =
      std::make_unique<FramePrefetcher>(playback_, series_.files, loader_);
  prefetcher_->start(start + 1);
  schedule_tick();
  return true;
}

void PlaybackController::stop_playback() {
  if (state_ != State::kPlaying) {
    return;
  }
  tick_timer_->stop();
  if (prefetcher_) {
    prefetcher_->stop();
  }
  if (playback_) {
    playback_->request_stop();
    playback_->queue().clear();
  }
  state_ = State::kStopped;
  qCInfo(lcPlayback) << "playback stopped at" << current_index_;
  emit playback_stopped();
  emit status(QString("Playback stopped at frame %1/%2")
                  .arg(current_index_ + 1)
                  .arg(series_.size()));
}

bool PlaybackController::show_frame(int index) {
  if (state_ == State::kPlaying) {
    return false;
  }
  if (index < 0 || index >= series_.size()) {
    return false;
  }
  const QString& path = series_.files[index];
  try {
    set_current(index, loader_(path));
  } catch (const std::exception& e) {
    qCWarning(lcPlayback) << e.what();
    current_index_ = index;
    current_frame_.reset();
    emit current_frame_changed(index, QFileInfo(path).fileName());
    emit status(QString("Failed to load %1").arg(QFileInfo(path).fileName()));
    return false;
  }
  return true;
}

bool PlaybackController::set_auto_update(bool enabled) {
  if (enabled == auto_update_) {
    return true;
  }
  if (enabled) {
    if (state_ == State::kPlaying) {
      emit status("Stop playback before enabling auto update.");
      return false;
    }
    if (series_.folder.isEmpty()) {
      emit status("No file series loaded.");
      return false;
    }
    auto_update_ = true;
    auto_update_timer_->start(auto_update_ms_);
  } else {
    auto_update_timer_->stop();
    auto_update_ = false;
  }
  qCInfo(lcPlayback) << "auto update" << (auto_update_ ? "on" : "off");
  emit auto_update_changed(auto_update_);
  return true;
}

int PlaybackController::refresh_series() {
  if (series_.folder.isEmpty() || state_ == State::kPlaying) {
    return current_index_;
  }
  const QStringList before = series_.files;
  const int idx = RefreshSeries(series_, current_index_);
  if (idx < 0) {
    current_index_ = -1;
    current_frame_.reset();
    emit series_changed();
    emit status("The file series is empty.");
    return -1;
  }
  if (series_.files != before) {
    emit series_changed();
  }
  if (idx != current_index_) {
    current_index_ = idx;
    emit current_frame_changed(idx,
                               QFileInfo(series_.files[idx]).fileName());
  }
  return idx;
}

void PlaybackController::on_tick() {
  if (state_ != State::kPlaying || !playback_) {
    return;
  }
  // Read before popping: the worker may push its last frame and finish
  // between an empty pop and the flag check.
  const bool finished = playback_->producer_finished();
  if (auto item = playback_->queue().try_pop()) {
    set_current(item->index, std::move(item->frame));
    if (current_index_ >= series_.size() - 1) {
      stop_playback();
      emit status("Playback finished.");
      return;
    }
  } else if (finished) {
    stop_playback();
    return;
  }
  schedule_tick();
}

void PlaybackController::on_auto_update_tick() {
  if (!auto_update_ || state_ == State::kPlaying) {
    return;
  }
  if (refresh_series() < 0) {
    return;
  }
  const int latest = series_.size() - 1;
  const bool changed =
      !current_frame_ || current_frame_->path() != series_.files[latest];
  if (changed) {
    qCDebug(lcPlayback) << "auto update shows"
                        << QFileInfo(series_.files[latest]).fileName();
    show_frame(latest);
  }
}

void PlaybackController::set_current(int index, GridFramePtr frame) {
  current_index_ = index;
  current_frame_ = std::move(frame);
  emit current_frame_changed(index,
                             QFileInfo(series_.files[index]).fileName());
  if (current_frame_) {
    emit frame_changed();
  }
}

void PlaybackController::schedule_tick() {
  if (state_ == State::kPlaying && current_index_ < series_.size()) {
    tick_timer_->start(frame_delay_ms_);
  }
}

void PlaybackController::release_prefetcher() {
  if (prefetcher_) {
    prefetcher_->stop();
    prefetcher_.reset();
  }
}

}  // namespace mdv
