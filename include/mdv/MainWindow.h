#pragma once

#include <QMainWindow>
#include <QString>
#include <QStringList>

class QAction;
class QLabel;
class QMenu;

namespace mdv {

class VtsViewer;

class MainWindow : public QMainWindow {
  Q_OBJECT
 public:
  static constexpr int kMaxRecentFolders = 8;

  explicit MainWindow(QWidget* parent = nullptr);

  VtsViewer* viewer() const { return viewer_; }

  bool open_folder(const QString& folder, const QString& prefix = QString());
  bool load_session(const QString& path);
  bool save_session(const QString& path);

 private:
  void build_menu();
  void build_toolbar();
  void add_recent_folder(const QString& folder);
  void update_recent_menu();
  void update_window_title();

  VtsViewer* viewer_ = nullptr;
  QLabel* frame_status_label_ = nullptr;
  QString session_path_;

  QMenu* recent_menu_ = nullptr;
  QAction* action_open_ = nullptr;
  QAction* action_refresh_ = nullptr;
  QAction* action_open_session_ = nullptr;
  QAction* action_save_session_ = nullptr;
  QAction* action_save_session_as_ = nullptr;
  QAction* action_screenshot_ = nullptr;
  QAction* action_export_probe_ = nullptr;
  QAction* action_play_ = nullptr;
  QAction* action_quit_ = nullptr;
};

}  // namespace mdv
