#include "mdv/MainWindow.h"

#include <QAction>
#include <QApplication>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QIcon>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPainter>
#include <QPixmap>
#include <QPolygon>
#include <QSettings>
#include <QStatusBar>
#include <QToolBar>

#include "mdv/Log.h"
#include "mdv/PlaybackController.h"
#include "mdv/Screenshot.h"
#include "mdv/SessionFile.h"
#include "mdv/VtsViewer.h"

namespace mdv {

namespace {

constexpr char kSessionFilter[] = "MDV Session (*.mdv.yaml *.yaml)";
constexpr char kRecentKey[] = "recent_folders";

enum class IconGlyph { OpenFolder, SaveDisk, Sync, Run, Output };

QIcon MakeIcon(IconGlyph glyph, int size = 18) {
  QPixmap pix(size, size);
  pix.fill(Qt::transparent);
  QPainter p(&pix);
  p.setRenderHint(QPainter::Antialiasing, true);
  QPen pen(QColor("#2b2b2b"));
  pen.setWidthF(1.6);
  p.setPen(pen);

  const int s = size;
  const int m = 3;
  const QRect r(m, m, s - 2 * m, s - 2 * m);

  switch (glyph) {
    case IconGlyph::OpenFolder: {
      QRect folder(m, m + 4, s - 2 * m, s - m - 6);
      p.drawRect(folder);
      p.drawLine(m + 2, m + 4, s / 2, m + 4);
      p.drawLine(m + 2, m + 4, m + 6, m + 1);
      break;
    }
    case IconGlyph::SaveDisk: {
      p.drawRect(r);
      p.drawLine(m + 3, m + 5, s - m - 3, m + 5);
      p.drawRect(QRect(m + 4, m + 8, s - 2 * m - 8, 5));
      break;
    }
    case IconGlyph::Sync: {
      p.drawArc(r, 40 * 16, 220 * 16);
      p.drawArc(r, 260 * 16, 220 * 16);
      p.drawLine(s - m - 2, s / 2, s - m - 6, s / 2 - 3);
      p.drawLine(s - m - 2, s / 2, s - m - 6, s / 2 + 3);
      break;
    }
    case IconGlyph::Run: {
      QPolygon poly;
      poly << QPoint(m + 2, m + 1) << QPoint(s - m - 2, s / 2)
           << QPoint(m + 2, s - m - 1);
      p.setBrush(QColor("#2b2b2b"));
      p.drawPolygon(poly);
      break;
    }
    case IconGlyph::Output: {
      p.drawRect(r);
      p.drawLine(s / 2, m + 2, s / 2, s - m - 6);
      p.drawLine(s / 2, s - m - 6, s / 2 - 3, s - m - 9);
      p.drawLine(s / 2, s - m - 6, s / 2 + 3, s - m - 9);
      break;
    }
  }

  return QIcon(pix);
}

constexpr char kSettingsOrg[] = "mindes";
constexpr char kSettingsApp[] = "mdv_viewer";

}  // namespace

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
  resize(1400, 900);

  viewer_ = new VtsViewer(this);
  setCentralWidget(viewer_);

  frame_status_label_ = new QLabel("No series");
  statusBar()->addPermanentWidget(frame_status_label_);

  connect(viewer_, &VtsViewer::status_message, this,
          [this](const QString& message) {
            statusBar()->showMessage(message, 2000);
          });
  connect(viewer_, &VtsViewer::current_frame_changed, this,
          [this](int index, const QString& file_name) {
            frame_status_label_->setText(
                QString("%1  (%2/%3)")
                    .arg(file_name)
                    .arg(index + 1)
                    .arg(viewer_->controller()->series().size()));
          });
  connect(viewer_, &VtsViewer::series_loaded, this,
          [this](const QString& folder, const QString&) {
            add_recent_folder(folder);
            update_window_title();
          });
  connect(viewer_, &VtsViewer::probe_result_ready, this,
          [this](const LineProbeResult& result) {
            action_export_probe_->setEnabled(!result.empty());
          });

  build_menu();
  build_toolbar();
  update_recent_menu();
  update_window_title();
  statusBar()->showMessage("Ready");
}

void MainWindow::build_menu() {
  auto* file_menu = menuBar()->addMenu("&File");
  action_open_ = file_menu->addAction("Open Folder...");
  recent_menu_ = file_menu->addMenu("Recent Folders");
  action_refresh_ = file_menu->addAction("Refresh Series");
  file_menu->addSeparator();
  action_open_session_ = file_menu->addAction("Open Session...");
  action_save_session_ = file_menu->addAction("Save Session");
  action_save_session_as_ = file_menu->addAction("Save Session As...");
  file_menu->addSeparator();
  action_screenshot_ = file_menu->addAction("Save Screenshot...");
  action_export_probe_ = file_menu->addAction("Export Probe Table...");
  action_export_probe_->setEnabled(false);
  file_menu->addSeparator();
  action_quit_ = file_menu->addAction("Quit");

  auto* view_menu = menuBar()->addMenu("&Playback");
  action_play_ = view_menu->addAction("Play / Stop");

  connect(action_open_, &QAction::triggered, this, [this]() {
    const QString dir = QFileDialog::getExistingDirectory(
        this, "Open Output Folder",
        viewer_->folder().isEmpty() ? QDir::homePath() : viewer_->folder());
    if (dir.isEmpty()) {
      return;
    }
    open_folder(dir);
  });
  connect(action_refresh_, &QAction::triggered, this, [this]() {
    viewer_->controller()->refresh_series();
  });
  connect(action_open_session_, &QAction::triggered, this, [this]() {
    const QString path = QFileDialog::getOpenFileName(
        this, "Open Session", session_path_, kSessionFilter);
    if (path.isEmpty()) {
      return;
    }
    if (load_session(path)) {
      statusBar()->showMessage("Session loaded.", 2000);
    }
  });
  connect(action_save_session_, &QAction::triggered, this, [this]() {
    if (session_path_.isEmpty()) {
      const QString path = QFileDialog::getSaveFileName(
          this, "Save Session", viewer_->folder(), kSessionFilter);
      if (path.isEmpty()) {
        return;
      }
      session_path_ = path;
    }
    if (save_session(session_path_)) {
      statusBar()->showMessage("Session saved.", 2000);
    }
  });
  connect(action_save_session_as_, &QAction::triggered, this, [this]() {
    const QString path = QFileDialog::getSaveFileName(
        this, "Save Session As", session_path_, kSessionFilter);
    if (path.isEmpty()) {
      return;
    }
    session_path_ = path;
    if (save_session(session_path_)) {
      statusBar()->showMessage("Session saved.", 2000);
    }
  });
  connect(action_screenshot_, &QAction::triggered, this, [this]() {
    const QString path = QFileDialog::getSaveFileName(
        this, "Save Screenshot",
        viewer_->folder().isEmpty() ? QDir::homePath() : viewer_->folder(),
        ScreenshotFileFilter());
    if (path.isEmpty()) {
      return;
    }
    if (viewer_->save_screenshot(path)) {
      statusBar()->showMessage("Screenshot saved.", 2000);
    } else {
      statusBar()->showMessage("Failed to save screenshot.", 2000);
    }
  });
  connect(action_export_probe_, &QAction::triggered, this, [this]() {
    const QString path = QFileDialog::getSaveFileName(
        this, "Export Probe Table", viewer_->folder(), "Excel Workbook (*.xlsx)");
    if (path.isEmpty()) {
      return;
    }
    viewer_->export_probe_table(path);
  });
  connect(action_play_, &QAction::triggered, this, [this]() {
    auto* controller = viewer_->controller();
    if (controller->is_playing()) {
      controller->stop_playback();
    } else {
      controller->start_playback();
    }
  });
  connect(action_quit_, &QAction::triggered, this, &QWidget::close);
}

void MainWindow::build_toolbar() {
  auto* toolbar = addToolBar("Main");
  toolbar->setMovable(false);
  toolbar->setIconSize(QSize(18, 18));

  action_open_->setIcon(MakeIcon(IconGlyph::OpenFolder));
  toolbar->addAction(action_open_);
  action_refresh_->setIcon(MakeIcon(IconGlyph::Sync));
  toolbar->addAction(action_refresh_);
  action_save_session_->setIcon(MakeIcon(IconGlyph::SaveDisk));
  toolbar->addAction(action_save_session_);
  action_screenshot_->setIcon(MakeIcon(IconGlyph::Output));
  toolbar->addAction(action_screenshot_);
  toolbar->addSeparator();
  action_play_->setIcon(MakeIcon(IconGlyph::Run));
  toolbar->addAction(action_play_);
}

bool MainWindow::open_folder(const QString& folder, const QString& prefix) {
  return prefix.isEmpty() ? viewer_->load(folder)
                          : viewer_->load(folder, prefix);
}

bool MainWindow::load_session(const QString& path) {
  QString error;
  const auto viewer = LoadSession(path, &error);
  if (!viewer) {
    QMessageBox::warning(this, "Session Load",
                         QString("Failed to load session:\n%1").arg(error));
    return false;
  }
  session_path_ = path;
  viewer_->apply_viewer_settings(*viewer);
  update_window_title();
  qCInfo(lcSession) << "session loaded" << path;
  return true;
}

bool MainWindow::save_session(const QString& path) {
  QString error;
  if (!SaveSession(path, viewer_->viewer_settings(), &error)) {
    QMessageBox::warning(this, "Session Save",
                         QString("Failed to save session:\n%1").arg(error));
    return false;
  }
  update_window_title();
  return true;
}

void MainWindow::add_recent_folder(const QString& folder) {
  const QString clean = QDir::cleanPath(folder);
  QSettings settings(kSettingsOrg, kSettingsApp);
  QStringList recent = settings.value(kRecentKey).toStringList();
  recent.removeAll(clean);
  recent.prepend(clean);
  while (recent.size() > kMaxRecentFolders) {
    recent.removeLast();
  }
  settings.setValue(kRecentKey, recent);
  update_recent_menu();
}

void MainWindow::update_recent_menu() {
  recent_menu_->clear();
  QSettings settings(kSettingsOrg, kSettingsApp);
  const QStringList recent = settings.value(kRecentKey).toStringList();
  for (const auto& folder : recent) {
    auto* action = recent_menu_->addAction(folder);
    connect(action, &QAction::triggered, this, [this, folder]() {
      if (!QFileInfo(folder).isDir()) {
        statusBar()->showMessage("Folder no longer exists: " + folder, 2000);
        return;
      }
      open_folder(folder);
    });
  }
  if (recent.isEmpty()) {
    recent_menu_->addAction("(empty)")->setEnabled(false);
    return;
  }
  recent_menu_->addSeparator();
  auto* clear_action = recent_menu_->addAction("Clear List");
  connect(clear_action, &QAction::triggered, this, [this]() {
    QSettings(kSettingsOrg, kSettingsApp).remove(kRecentKey);
    update_recent_menu();
  });
}

void MainWindow::update_window_title() {
  QString title = "MInDes VTS Viewer";
  if (!viewer_->folder().isEmpty()) {
    title += QString(" - %1 [%2*]").arg(viewer_->folder(), viewer_->prefix());
  }
  if (!session_path_.isEmpty()) {
    title += QString(" (%1)").arg(QFileInfo(session_path_).fileName());
  }
  setWindowTitle(title);
}

}  // namespace mdv
