#pragma once

#include <QObject>
#include <QString>

#include <memory>

#include "mdv/FramePrefetcher.h"
#include "mdv/GridFrame.h"
#include "mdv/SeriesResolver.h"

class QTimer;

namespace mdv {

// Owns the active series and the displayed frame. Drives sequential
// playback from the prefetch queue and polling of a growing output folder.
// Lives on the UI thread.
class PlaybackController : public QObject {
  Q_OBJECT
 public:
  enum class State { kStopped, kPlaying };

  static constexpr int kDefaultFrameDelayMs = 20;
  static constexpr int kDefaultAutoUpdateMs = 500;

  explicit PlaybackController(QObject* parent = nullptr,
                              FrameLoader loader = LoadGridFrame);
  ~PlaybackController() override;

  void set_series(const SeriesDescriptor& series);
  const SeriesDescriptor& series() const { return series_; }
  bool has_series() const { return !series_.empty(); }

  int current_index() const { return current_index_; }
  GridFramePtr current_frame() const { return current_frame_; }

  State state() const { return state_; }
  bool is_playing() const { return state_ == State::kPlaying; }
  bool auto_update_active() const { return auto_update_; }

  void set_frame_delay(int ms);
  int frame_delay() const { return frame_delay_ms_; }
  void set_auto_update_interval(int ms);
  int auto_update_interval() const { return auto_update_ms_; }

  std::shared_ptr<const PlaybackState> playback_state() const {
    return playback_;
  }

 public slots:
  bool start_playback();
  void stop_playback();
  bool show_frame(int index);
  bool set_auto_update(bool enabled);
  int refresh_series();

 signals:
  void series_changed();
  void current_frame_changed(int index, const QString& file_name);
  // A new frame is current and should be rendered.
  void frame_changed();
  void playback_started();
  void playback_stopped();
  void auto_update_changed(bool active);
  void status(const QString& message);

 private slots:
  void on_tick();
  void on_auto_update_tick();

 private:
  void set_current(int index, GridFramePtr frame);
  void schedule_tick();
  void release_prefetcher();

  FrameLoader loader_;
  SeriesDescriptor series_;
  int current_index_ = -1;
  GridFramePtr current_frame_;

  State state_ = State::kStopped;
  std::shared_ptr<PlaybackState> playback_;
  std::unique_ptr<FramePrefetcher> prefetcher_;
  QTimer* tick_timer_ = nullptr;
  int frame_delay_ms_ = kDefaultFrameDelayMs;

  QTimer* auto_update_timer_ = nullptr;
  int auto_update_ms_ = kDefaultAutoUpdateMs;
  bool auto_update_ = false;
};

}  // namespace mdv
