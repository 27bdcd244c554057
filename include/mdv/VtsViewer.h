#pragma once

#include <QString>
#include <QVariantMap>
#include <QWidget>

#include <memory>

#include <vtkSmartPointer.h>

#include "mdv/LineProbe.h"
#include "mdv/VisualizationConfig.h"

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QSlider;
class QSpinBox;
class QTableWidget;
class QVTKOpenGLNativeWidget;
class vtkCallbackCommand;
class vtkGenericOpenGLRenderWindow;
class vtkLineWidget;
class vtkRenderer;

namespace mdv {

class PlaybackController;
class ProbePlotView;
class RenderPipeline;

// Viewer for a series of .vts files: frame selection and playback, field
// and color controls, the VTK view and the line probe.
class VtsViewer : public QWidget {
  Q_OBJECT
 public:
  explicit VtsViewer(QWidget* parent = nullptr);
  ~VtsViewer() override;

  PlaybackController* controller() const { return controller_; }
  const VisualizationConfig& config() const { return config_; }
  QString folder() const;
  QString prefix() const;
  const LineProbeResult& probe_result() const { return probe_result_; }

 public slots:
  // Asks for a prefix when the folder holds several series.
  bool load(const QString& folder);
  bool load(const QString& folder, const QString& prefix);
  bool save_screenshot(const QString& path);
  bool export_probe_table(const QString& path);
  QVariantMap viewer_settings() const;
  void apply_viewer_settings(const QVariantMap& settings);

 signals:
  void current_frame_changed(int index, const QString& file_name);
  void status_message(const QString& message);
  void probe_result_ready(const mdv::LineProbeResult& result);
  void series_loaded(const QString& folder, const QString& prefix);

 private slots:
  void on_open_folder();
  void on_series_changed();
  void on_frame_index_changed(int index, const QString& file_name);
  void on_frame_changed();
  void on_field_changed(int index);
  void on_mode_changed(int index);
  void on_clip_axis_changed(int index);
  void on_apply_range();
  void on_colormap_changed(int index);
  void on_background_changed(int index);
  void on_play_toggled();
  void on_auto_update_toggled(bool enabled);
  void on_probe_toggled(bool enabled);
  void on_probe_points_edited();

 private:
  void init_vtk();
  void reset_display_state();
  void populate_fields();
  void update_mode_controls();
  void update_clip_range(bool center);
  void update_colormap_preview();
  void show_range(const ScalarRange& range);
  void sync_config();
  void render_current();
  void set_controls_enabled(bool enabled);
  void place_probe_line();
  void update_probe();
  void fill_probe_table();

  PlaybackController* controller_ = nullptr;
  VisualizationConfig config_;
  LineProbeResult probe_result_;
  ScalarRange range_exact_;
  Point3 probe_p1_{{0, 0, 0}};
  Point3 probe_p2_{{0, 0, 0}};
  bool probe_points_set_ = false;

  QLabel* folder_label_ = nullptr;
  QPushButton* open_btn_ = nullptr;
  QPushButton* refresh_btn_ = nullptr;
  QComboBox* file_combo_ = nullptr;
  QLabel* frame_label_ = nullptr;
  QPushButton* play_btn_ = nullptr;
  QSpinBox* frame_delay_ = nullptr;
  QCheckBox* auto_update_ = nullptr;
  QComboBox* auto_update_interval_ = nullptr;

  QComboBox* field_combo_ = nullptr;
  QComboBox* colormap_combo_ = nullptr;
  QLabel* colormap_preview_ = nullptr;
  QCheckBox* auto_range_ = nullptr;
  QDoubleSpinBox* range_min_ = nullptr;
  QDoubleSpinBox* range_max_ = nullptr;
  QCheckBox* include_boundary_ = nullptr;

  QComboBox* mode_combo_ = nullptr;
  QComboBox* clip_axis_ = nullptr;
  QDoubleSpinBox* clip_position_ = nullptr;
  QLineEdit* contour_levels_ = nullptr;
  QComboBox* glyph_color_mode_ = nullptr;
  QComboBox* glyph_size_mode_ = nullptr;
  QLineEdit* glyph_scale_ = nullptr;
  QPushButton* glyph_color_btn_ = nullptr;
  QSlider* opacity_ = nullptr;
  QLabel* opacity_label_ = nullptr;
  QWidget* clip_row_ = nullptr;
  QWidget* contour_row_ = nullptr;
  QWidget* glyph_row_ = nullptr;

  QComboBox* background_combo_ = nullptr;
  QCheckBox* show_axes_ = nullptr;
  QCheckBox* show_bounds_ = nullptr;
  QCheckBox* show_color_bar_ = nullptr;
  QComboBox* view_combo_ = nullptr;
  QPushButton* view_apply_ = nullptr;
  QPushButton* screenshot_btn_ = nullptr;

  QCheckBox* probe_enable_ = nullptr;
  QLineEdit* probe_p1_edit_ = nullptr;
  QLineEdit* probe_p2_edit_ = nullptr;
  QPushButton* probe_apply_ = nullptr;
  QPushButton* probe_export_ = nullptr;
  QTableWidget* probe_table_ = nullptr;
  ProbePlotView* probe_plot_ = nullptr;

  QVTKOpenGLNativeWidget* vtk_widget_ = nullptr;
  vtkSmartPointer<vtkGenericOpenGLRenderWindow> render_window_;
  vtkSmartPointer<vtkRenderer> renderer_;
  vtkSmartPointer<vtkLineWidget> line_widget_;
  vtkSmartPointer<vtkCallbackCommand> line_callback_;
  std::unique_ptr<RenderPipeline> pipeline_;
};

}  // namespace mdv
