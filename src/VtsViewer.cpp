#include "mdv/VtsViewer.h"

#include <QCheckBox>
#include <QColor>
#include <QColorDialog>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QImage>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPixmap>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSlider>
#include <QSpinBox>
#include <QSplitter>
#include <QTabWidget>
#include <QTableWidget>
#include <QTableWidgetItem>
#include <QTimer>
#include <QVBoxLayout>
#include <QVariantList>

#include <algorithm>
#include <initializer_list>

#include <QVTKOpenGLNativeWidget.h>
#include <vtkCallbackCommand.h>
#include <vtkCommand.h>
#include <vtkGenericOpenGLRenderWindow.h>
#include <vtkLineWidget.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>

#include "mdv/Errors.h"
#include "mdv/Log.h"
#include "mdv/PlaybackController.h"
#include "mdv/ProbePlotView.h"
#include "mdv/RenderPipeline.h"
#include "mdv/Screenshot.h"
#include "mdv/SeriesResolver.h"

namespace mdv {

namespace {

struct IntervalChoice {
  const char* label;
  int ms;
};

constexpr IntervalChoice kAutoUpdateIntervals[] = {
    {"0.02s", 20}, {"0.05s", 50}, {"0.1s", 100}, {"0.2s", 200}, {"0.5s", 500}};

constexpr int kFieldKindRole = Qt::UserRole + 1;

QPixmap ColorMapPixmap(ColorMap map, int width, int height) {
  QImage image(width, height, QImage::Format_RGB32);
  for (int x = 0; x < width; ++x) {
    const double t = width > 1 ? static_cast<double>(x) / (width - 1) : 0.0;
    const Rgb c = ColorAt(map, t);
    const QRgb px = qRgb(static_cast<int>(c[0] * 255.0 + 0.5),
                         static_cast<int>(c[1] * 255.0 + 0.5),
                         static_cast<int>(c[2] * 255.0 + 0.5));
    for (int y = 0; y < height; ++y) {
      image.setPixel(x, y, px);
    }
  }
  return QPixmap::fromImage(image);
}

QString ColorButtonStyle(const Rgb& c) {
  return QString("background-color: %1;")
      .arg(QColor::fromRgbF(c[0], c[1], c[2]).name());
}

}  // namespace

VtsViewer::VtsViewer(QWidget* parent) : QWidget(parent) {
  controller_ = new PlaybackController(this);
  connect(controller_, &PlaybackController::series_changed, this,
          &VtsViewer::on_series_changed);
  connect(controller_, &PlaybackController::current_frame_changed, this,
          &VtsViewer::on_frame_index_changed);
  connect(controller_, &PlaybackController::frame_changed, this,
          &VtsViewer::on_frame_changed);
  connect(controller_, &PlaybackController::status, this,
          &VtsViewer::status_message);
  connect(controller_, &PlaybackController::playback_started, this, [this]() {
    play_btn_->setText("Stop");
    set_controls_enabled(false);
  });
  connect(controller_, &PlaybackController::playback_stopped, this, [this]() {
    play_btn_->setText("Play");
    set_controls_enabled(true);
  });
  connect(controller_, &PlaybackController::auto_update_changed, this,
          [this](bool active) {
            const QSignalBlocker block(auto_update_);
            auto_update_->setChecked(active);
            set_controls_enabled(!active);
            play_btn_->setEnabled(!active);
          });

  auto* layout = new QVBoxLayout(this);

  auto* header = new QHBoxLayout();
  folder_label_ = new QLabel("No folder loaded");
  open_btn_ = new QPushButton("Open Folder");
  refresh_btn_ = new QPushButton("Refresh");
  connect(open_btn_, &QPushButton::clicked, this, &VtsViewer::on_open_folder);
  connect(refresh_btn_, &QPushButton::clicked, this,
          [this]() { controller_->refresh_series(); });
  header->addWidget(folder_label_, 1);
  header->addWidget(open_btn_);
  header->addWidget(refresh_btn_);
  layout->addLayout(header);

  auto* frame_row = new QHBoxLayout();
  file_combo_ = new QComboBox();
  file_combo_->setMinimumWidth(240);
  connect(file_combo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
          this, [this](int index) {
            if (index >= 0 && index != controller_->current_index()) {
              controller_->show_frame(index);
            }
          });
  frame_label_ = new QLabel("0/0");
  play_btn_ = new QPushButton("Play");
  connect(play_btn_, &QPushButton::clicked, this, &VtsViewer::on_play_toggled);
  frame_delay_ = new QSpinBox();
  frame_delay_->setRange(1, 5000);
  frame_delay_->setSuffix(" ms");
  frame_delay_->setValue(PlaybackController::kDefaultFrameDelayMs);
  connect(frame_delay_, QOverload<int>::of(&QSpinBox::valueChanged), this,
          [this](int ms) { controller_->set_frame_delay(ms); });
  auto_update_ = new QCheckBox("Auto Update");
  connect(auto_update_, &QCheckBox::toggled, this,
          &VtsViewer::on_auto_update_toggled);
  auto_update_interval_ = new QComboBox();
  for (const auto& choice : kAutoUpdateIntervals) {
    auto_update_interval_->addItem(choice.label, choice.ms);
  }
  auto_update_interval_->setCurrentText("0.5s");
  connect(auto_update_interval_,
          QOverload<int>::of(&QComboBox::currentIndexChanged), this,
          [this](int) {
            controller_->set_auto_update_interval(
                auto_update_interval_->currentData().toInt());
          });
  frame_row->addWidget(new QLabel("File"));
  frame_row->addWidget(file_combo_, 1);
  frame_row->addWidget(frame_label_);
  frame_row->addWidget(play_btn_);
  frame_row->addWidget(new QLabel("Delay"));
  frame_row->addWidget(frame_delay_);
  frame_row->addWidget(auto_update_);
  frame_row->addWidget(auto_update_interval_);
  layout->addLayout(frame_row);

  auto* main_split = new QSplitter(Qt::Horizontal, this);
  main_split->setChildrenCollapsible(false);
  layout->addWidget(main_split, 1);

  auto* control_tabs = new QTabWidget(main_split);
  control_tabs->setMinimumWidth(320);
  auto make_tab = [control_tabs](const QString& name) {
    auto* tab = new QWidget(control_tabs);
    auto* tab_layout = new QVBoxLayout(tab);
    tab_layout->setContentsMargins(6, 6, 6, 6);
    tab_layout->setSpacing(6);
    control_tabs->addTab(tab, name);
    return tab_layout;
  };

  auto* data_layout = make_tab("Data");
  auto* field_row = new QHBoxLayout();
  field_combo_ = new QComboBox();
  field_combo_->setMinimumWidth(180);
  connect(field_combo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
          this, &VtsViewer::on_field_changed);
  field_row->addWidget(new QLabel("Field"));
  field_row->addWidget(field_combo_, 1);
  data_layout->addLayout(field_row);

  auto* cmap_row = new QHBoxLayout();
  colormap_combo_ = new QComboBox();
  colormap_combo_->addItems(ColorMapNames());
  connect(colormap_combo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
          this, &VtsViewer::on_colormap_changed);
  colormap_preview_ = new QLabel();
  colormap_preview_->setFixedSize(120, 14);
  cmap_row->addWidget(new QLabel("Colormap"));
  cmap_row->addWidget(colormap_combo_, 1);
  cmap_row->addWidget(colormap_preview_);
  data_layout->addLayout(cmap_row);

  auto* range_row = new QHBoxLayout();
  auto_range_ = new QCheckBox("Auto Range");
  auto_range_->setChecked(true);
  connect(auto_range_, &QCheckBox::toggled, this, &VtsViewer::on_apply_range);
  range_min_ = new QDoubleSpinBox();
  range_max_ = new QDoubleSpinBox();
  for (auto* spin : {range_min_, range_max_}) {
    spin->setDecimals(RangeDecimals(range_exact_));
    spin->setRange(-1e12, 1e12);
    spin->setEnabled(false);
  }
  connect(range_min_, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
          this, [this](double value) {
            range_exact_.min = value;
            on_apply_range();
          });
  connect(range_max_, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
          this, [this](double value) {
            range_exact_.max = value;
            on_apply_range();
          });
  range_row->addWidget(auto_range_);
  range_row->addWidget(range_min_);
  range_row->addWidget(range_max_);
  data_layout->addLayout(range_row);

  include_boundary_ = new QCheckBox("With Boundary");
  include_boundary_->setChecked(true);
  connect(include_boundary_, &QCheckBox::toggled, this,
          [this](bool) { render_current(); });
  data_layout->addWidget(include_boundary_);
  data_layout->addStretch(1);

  auto* mode_layout = make_tab("Mode");
  auto* mode_row = new QHBoxLayout();
  mode_combo_ = new QComboBox();
  mode_combo_->addItems(VisModeNames());
  connect(mode_combo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
          this, &VtsViewer::on_mode_changed);
  mode_row->addWidget(new QLabel("Mode"));
  mode_row->addWidget(mode_combo_, 1);
  mode_layout->addLayout(mode_row);

  clip_row_ = new QWidget();
  auto* clip_layout = new QHBoxLayout(clip_row_);
  clip_layout->setContentsMargins(0, 0, 0, 0);
  clip_axis_ = new QComboBox();
  clip_axis_->addItems({"X", "Y", "Z"});
  connect(clip_axis_, QOverload<int>::of(&QComboBox::currentIndexChanged),
          this, &VtsViewer::on_clip_axis_changed);
  clip_position_ = new QDoubleSpinBox();
  clip_position_->setDecimals(4);
  clip_position_->setRange(-1e6, 1e6);
  connect(clip_position_, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
          this, [this](double) { render_current(); });
  clip_layout->addWidget(new QLabel("Axis"));
  clip_layout->addWidget(clip_axis_);
  clip_layout->addWidget(new QLabel("Position"));
  clip_layout->addWidget(clip_position_, 1);
  mode_layout->addWidget(clip_row_);

  contour_row_ = new QWidget();
  auto* contour_layout = new QHBoxLayout(contour_row_);
  contour_layout->setContentsMargins(0, 0, 0, 0);
  contour_levels_ = new QLineEdit();
  contour_levels_->setPlaceholderText("e.g. 0.1, 0.5, 0.9");
  connect(contour_levels_, &QLineEdit::editingFinished, this,
          [this]() { render_current(); });
  contour_layout->addWidget(new QLabel("Levels"));
  contour_layout->addWidget(contour_levels_, 1);
  mode_layout->addWidget(contour_row_);

  glyph_row_ = new QWidget();
  auto* glyph_layout = new QVBoxLayout(glyph_row_);
  glyph_layout->setContentsMargins(0, 0, 0, 0);
  auto* glyph_top = new QHBoxLayout();
  glyph_color_mode_ = new QComboBox();
  glyph_color_mode_->addItems({"Single Color", "Colormap"});
  glyph_size_mode_ = new QComboBox();
  glyph_size_mode_->addItems({"Magnitude", "Uniform"});
  for (auto* combo : {glyph_color_mode_, glyph_size_mode_}) {
    connect(combo, QOverload<int>::of(&QComboBox::currentIndexChanged), this,
            [this](int) {
              glyph_color_btn_->setEnabled(
                  glyph_color_mode_->currentText() == "Single Color");
              render_current();
            });
  }
  glyph_top->addWidget(new QLabel("Color"));
  glyph_top->addWidget(glyph_color_mode_);
  glyph_top->addWidget(new QLabel("Size"));
  glyph_top->addWidget(glyph_size_mode_);
  glyph_layout->addLayout(glyph_top);
  auto* glyph_bottom = new QHBoxLayout();
  glyph_scale_ = new QLineEdit("1.0");
  connect(glyph_scale_, &QLineEdit::editingFinished, this, [this]() {
    const double scale = ParseGlyphScale(glyph_scale_->text(),
                                         config_.glyph_scale);
    glyph_scale_->setText(QString::number(scale));
    render_current();
  });
  glyph_color_btn_ = new QPushButton("Arrow Color");
  glyph_color_btn_->setStyleSheet(ColorButtonStyle(config_.glyph_color));
  connect(glyph_color_btn_, &QPushButton::clicked, this, [this]() {
    const Rgb& c = config_.glyph_color;
    const QColor picked = QColorDialog::getColor(
        QColor::fromRgbF(c[0], c[1], c[2]), this, "Arrow Color");
    if (!picked.isValid()) {
      return;
    }
    config_.glyph_color = {picked.redF(), picked.greenF(), picked.blueF()};
    glyph_color_btn_->setStyleSheet(ColorButtonStyle(config_.glyph_color));
    render_current();
  });
  glyph_bottom->addWidget(new QLabel("Scale"));
  glyph_bottom->addWidget(glyph_scale_, 1);
  glyph_bottom->addWidget(glyph_color_btn_);
  glyph_layout->addLayout(glyph_bottom);
  mode_layout->addWidget(glyph_row_);

  auto* opacity_row = new QHBoxLayout();
  opacity_ = new QSlider(Qt::Horizontal);
  opacity_->setRange(0, 100);
  opacity_->setValue(100);
  opacity_label_ = new QLabel("1.00");
  connect(opacity_, &QSlider::valueChanged, this, [this](int value) {
    opacity_label_->setText(QString::number(OpacityFromSlider(value), 'f', 2));
    render_current();
  });
  opacity_row->addWidget(new QLabel("Opacity"));
  opacity_row->addWidget(opacity_, 1);
  opacity_row->addWidget(opacity_label_);
  mode_layout->addLayout(opacity_row);
  mode_layout->addStretch(1);

  auto* view_layout = make_tab("View");
  auto* bg_row = new QHBoxLayout();
  background_combo_ = new QComboBox();
  background_combo_->addItems(BackgroundNames());
  background_combo_->setCurrentText("Light Gray");
  connect(background_combo_,
          QOverload<int>::of(&QComboBox::currentIndexChanged), this,
          &VtsViewer::on_background_changed);
  bg_row->addWidget(new QLabel("Background"));
  bg_row->addWidget(background_combo_, 1);
  view_layout->addLayout(bg_row);

  show_axes_ = new QCheckBox("Show XYZ Axes");
  show_bounds_ = new QCheckBox("Show Domain Bounds");
  show_color_bar_ = new QCheckBox("Show Color Bar");
  show_color_bar_->setChecked(true);
  for (auto* box : {show_axes_, show_bounds_, show_color_bar_}) {
    connect(box, &QCheckBox::toggled, this, [this](bool) { render_current(); });
    view_layout->addWidget(box);
  }

  auto* view_row = new QHBoxLayout();
  view_combo_ = new QComboBox();
  view_combo_->addItem("Reset", static_cast<int>(ViewPreset::kReset));
  view_combo_->addItem("+X", static_cast<int>(ViewPreset::kPlusX));
  view_combo_->addItem("+Y", static_cast<int>(ViewPreset::kPlusY));
  view_combo_->addItem("+Z", static_cast<int>(ViewPreset::kPlusZ));
  view_apply_ = new QPushButton("Apply View");
  connect(view_apply_, &QPushButton::clicked, this, [this]() {
    if (!pipeline_) {
      return;
    }
    const auto preset =
        static_cast<ViewPreset>(view_combo_->currentData().toInt());
    if (pipeline_->apply_view_preset(preset)) {
      render_window_->Render();
    }
  });
  screenshot_btn_ = new QPushButton("Screenshot...");
  connect(screenshot_btn_, &QPushButton::clicked, this, [this]() {
    const QString path = QFileDialog::getSaveFileName(
        this, "Save Screenshot", folder(), ScreenshotFileFilter());
    if (!path.isEmpty()) {
      save_screenshot(path);
    }
  });
  view_row->addWidget(view_combo_);
  view_row->addWidget(view_apply_);
  view_row->addStretch(1);
  view_row->addWidget(screenshot_btn_);
  view_layout->addLayout(view_row);
  view_layout->addStretch(1);

  auto* probe_layout = make_tab("Probe");
  probe_enable_ = new QCheckBox("Plot Over Line");
  connect(probe_enable_, &QCheckBox::toggled, this,
          &VtsViewer::on_probe_toggled);
  probe_layout->addWidget(probe_enable_);
  auto* p1_row = new QHBoxLayout();
  probe_p1_edit_ = new QLineEdit();
  probe_p1_edit_->setPlaceholderText("x, y, z");
  p1_row->addWidget(new QLabel("Point 1"));
  p1_row->addWidget(probe_p1_edit_, 1);
  probe_layout->addLayout(p1_row);
  auto* p2_row = new QHBoxLayout();
  probe_p2_edit_ = new QLineEdit();
  probe_p2_edit_->setPlaceholderText("x, y, z");
  p2_row->addWidget(new QLabel("Point 2"));
  p2_row->addWidget(probe_p2_edit_, 1);
  probe_layout->addLayout(p2_row);
  auto* probe_btn_row = new QHBoxLayout();
  probe_apply_ = new QPushButton("Apply");
  connect(probe_apply_, &QPushButton::clicked, this,
          &VtsViewer::on_probe_points_edited);
  probe_export_ = new QPushButton("Export...");
  connect(probe_export_, &QPushButton::clicked, this, [this]() {
    const QString path = QFileDialog::getSaveFileName(
        this, "Export Probe Table", folder(), "Excel Workbook (*.xlsx)");
    if (!path.isEmpty()) {
      export_probe_table(path);
    }
  });
  probe_btn_row->addWidget(probe_apply_);
  probe_btn_row->addStretch(1);
  probe_btn_row->addWidget(probe_export_);
  probe_layout->addLayout(probe_btn_row);
  auto* probe_views = new QTabWidget();
  probe_plot_ = new ProbePlotView();
  probe_views->addTab(probe_plot_, "Plot");
  probe_table_ = new QTableWidget();
  probe_table_->setEditTriggers(QAbstractItemView::NoEditTriggers);
  probe_table_->setAlternatingRowColors(true);
  probe_table_->horizontalHeader()->setSectionResizeMode(
      QHeaderView::ResizeToContents);
  probe_table_->setMinimumHeight(160);
  probe_views->addTab(probe_table_, "Table");
  probe_layout->addWidget(probe_views, 1);
  connect(this, &VtsViewer::probe_result_ready, probe_plot_,
          &ProbePlotView::set_result);
  for (auto* w : std::initializer_list<QWidget*>{
           probe_p1_edit_, probe_p2_edit_, probe_apply_, probe_export_}) {
    w->setEnabled(false);
  }

  vtk_widget_ = new QVTKOpenGLNativeWidget(main_split);
  vtk_widget_->setMinimumSize(640, 480);
  main_split->setStretchFactor(1, 1);
  QTimer::singleShot(0, this, [this]() { init_vtk(); });

  update_mode_controls();
  update_colormap_preview();
  set_controls_enabled(true);
}

VtsViewer::~VtsViewer() {
  if (line_widget_) {
    line_widget_->Off();
  }
}

QString VtsViewer::folder() const {
  return controller_->series().folder;
}

QString VtsViewer::prefix() const {
  return controller_->series().prefix;
}

void VtsViewer::init_vtk() {
  if (!vtk_widget_) {
    return;
  }
  render_window_ = vtkSmartPointer<vtkGenericOpenGLRenderWindow>::New();
  renderer_ = vtkSmartPointer<vtkRenderer>::New();
  render_window_->AddRenderer(renderer_);
  vtk_widget_->setRenderWindow(render_window_);

  pipeline_ = std::make_unique<RenderPipeline>(renderer_);
  pipeline_->apply_background(background_combo_->currentText());

  auto* interactor = render_window_->GetInteractor();
  if (!interactor) {
    auto new_interactor = vtkSmartPointer<vtkRenderWindowInteractor>::New();
    render_window_->SetInteractor(new_interactor);
    interactor = new_interactor;
  }
  pipeline_->set_interactor(interactor);

  line_widget_ = vtkSmartPointer<vtkLineWidget>::New();
  line_widget_->SetInteractor(interactor);
  line_widget_->SetResolution(kDefaultProbeResolution);
  line_callback_ = vtkSmartPointer<vtkCallbackCommand>::New();
  line_callback_->SetClientData(this);
  line_callback_->SetCallback([](vtkObject* caller, unsigned long, void* data,
                                 void*) {
    auto* self = static_cast<VtsViewer*>(data);
    auto* widget = vtkLineWidget::SafeDownCast(caller);
    if (!self || !widget) {
      return;
    }
    widget->GetPoint1(self->probe_p1_.data());
    widget->GetPoint2(self->probe_p2_.data());
    self->probe_points_set_ = true;
    self->probe_p1_edit_->setText(FormatPoint(self->probe_p1_));
    self->probe_p2_edit_->setText(FormatPoint(self->probe_p2_));
    self->update_probe();
  });
  line_widget_->AddObserver(vtkCommand::EndInteractionEvent, line_callback_);

  if (controller_->current_frame()) {
    render_current();
  }
}

bool VtsViewer::load(const QString& folder) {
  QStringList prefixes;
  try {
    prefixes = DiscoverSeriesPrefixes(folder);
  } catch (const Error& e) {
    QMessageBox::warning(this, "Open Folder", QString::fromUtf8(e.what()));
    return false;
  }
  QString prefix = prefixes.front();
  if (prefixes.size() > 1) {
    bool ok = false;
    prefix = QInputDialog::getItem(this, "Select Series",
                                   "Multiple file series found:", prefixes, 0,
                                   false, &ok);
    if (!ok || prefix.isEmpty()) {
      return false;
    }
  }
  return load(folder, prefix);
}

bool VtsViewer::load(const QString& folder, const QString& prefix) {
  SeriesDescriptor series;
  try {
    series = ResolveSeries(folder, prefix);
  } catch (const NoFilesFound& e) {
    QMessageBox::warning(this, "Open Folder", QString::fromUtf8(e.what()));
    return false;
  }
  reset_display_state();
  if (pipeline_) {
    pipeline_->reset_camera_on_next_render();
  }
  folder_label_->setText(QString("%1  [%2*]").arg(series.folder, prefix));
  controller_->set_series(series);
  emit status_message(QString("Loaded %1 files with prefix '%2'")
                          .arg(series.size())
                          .arg(prefix));
  emit series_loaded(series.folder, prefix);
  return true;
}

void VtsViewer::reset_display_state() {
  const QSignalBlocker b1(colormap_combo_);
  const QSignalBlocker b2(auto_range_);
  const QSignalBlocker b3(background_combo_);
  const QSignalBlocker b4(probe_enable_);
  colormap_combo_->setCurrentText(ColorMapName(ColorMap::kCoolWarm));
  auto_range_->setChecked(true);
  range_min_->setEnabled(false);
  range_max_->setEnabled(false);
  background_combo_->setCurrentText("Light Gray");
  if (pipeline_) {
    pipeline_->apply_background("Light Gray");
  }
  probe_points_set_ = false;
  probe_result_ = LineProbeResult();
  probe_table_->clear();
  probe_table_->setRowCount(0);
  probe_table_->setColumnCount(0);
  probe_plot_->clear();
  update_colormap_preview();
}

void VtsViewer::on_open_folder() {
  const QString dir = QFileDialog::getExistingDirectory(
      this, "Open Output Folder", folder());
  if (!dir.isEmpty()) {
    load(dir);
  }
}

void VtsViewer::on_series_changed() {
  const auto& series = controller_->series();
  const QSignalBlocker block(file_combo_);
  file_combo_->clear();
  for (const auto& path : series.files) {
    file_combo_->addItem(QFileInfo(path).fileName(), path);
  }
  const int idx = controller_->current_index();
  if (idx >= 0 && idx < file_combo_->count()) {
    file_combo_->setCurrentIndex(idx);
  }
  frame_label_->setText(
      QString("%1/%2").arg(idx + 1).arg(series.size()));
  if (series.empty() && pipeline_) {
    pipeline_->clear();
    if (render_window_) {
      render_window_->Render();
    }
  }
}

void VtsViewer::on_frame_index_changed(int index, const QString& file_name) {
  {
    const QSignalBlocker block(file_combo_);
    if (index >= 0 && index < file_combo_->count()) {
      file_combo_->setCurrentIndex(index);
    }
  }
  frame_label_->setText(
      QString("%1/%2").arg(index + 1).arg(controller_->series().size()));
  emit current_frame_changed(index, file_name);
}

void VtsViewer::on_frame_changed() {
  const bool first_frame = field_combo_->count() == 0;
  populate_fields();
  if (first_frame || (pipeline_ && pipeline_->camera_reset_pending())) {
    update_clip_range(true);
  }
  render_current();
  if (probe_enable_->isChecked()) {
    update_probe();
  }
}

void VtsViewer::populate_fields() {
  const GridFramePtr frame = controller_->current_frame();
  if (!frame) {
    return;
  }
  const QString current = field_combo_->currentData().toString();
  QStringList names;
  for (const auto& f : frame->fields()) {
    names << f.name;
  }
  QStringList existing;
  for (int i = 0; i < field_combo_->count(); ++i) {
    existing << field_combo_->itemData(i).toString();
  }
  if (names == existing) {
    return;
  }

  const QSignalBlocker block(field_combo_);
  field_combo_->clear();
  for (const auto& f : frame->fields()) {
    field_combo_->addItem(f.display_name(), f.name);
    field_combo_->setItemData(field_combo_->count() - 1,
                              static_cast<int>(f.kind), kFieldKindRole);
  }
  int idx = field_combo_->findData(current);
  if (idx < 0 && field_combo_->count() > 0) {
    idx = 0;
  }
  field_combo_->setCurrentIndex(idx);
  update_mode_controls();
}

void VtsViewer::on_field_changed(int index) {
  if (index < 0) {
    return;
  }
  update_mode_controls();
  render_current();
}

void VtsViewer::on_mode_changed(int index) {
  Q_UNUSED(index);
  update_mode_controls();
  render_current();
}

void VtsViewer::update_mode_controls() {
  const VisMode mode = VisModeFromName(mode_combo_->currentText());
  clip_row_->setVisible(mode == VisMode::kClip);
  contour_row_->setVisible(mode == VisMode::kContour);
  glyph_row_->setVisible(mode == VisMode::kVectorArrows);
  glyph_color_btn_->setEnabled(glyph_color_mode_->currentText() ==
                               "Single Color");
}

void VtsViewer::on_clip_axis_changed(int index) {
  Q_UNUSED(index);
  update_clip_range(true);
  render_current();
}

void VtsViewer::update_clip_range(bool center) {
  const GridFramePtr frame = controller_->current_frame();
  if (!frame) {
    return;
  }
  const int axis = clip_axis_->currentIndex();
  const double lo = frame->bounds()[axis * 2];
  const double hi = frame->bounds()[axis * 2 + 1];
  const QSignalBlocker block(clip_position_);
  clip_position_->setRange(lo, hi);
  if (center) {
    clip_position_->setValue((lo + hi) * 0.5);
  }
}

void VtsViewer::on_apply_range() {
  const bool auto_range = auto_range_->isChecked();
  range_min_->setEnabled(!auto_range && !controller_->is_playing());
  range_max_->setEnabled(!auto_range && !controller_->is_playing());
  render_current();
}

void VtsViewer::on_colormap_changed(int index) {
  Q_UNUSED(index);
  update_colormap_preview();
  render_current();
}

void VtsViewer::update_colormap_preview() {
  const ColorMap map = ColorMapFromName(colormap_combo_->currentText());
  colormap_preview_->setPixmap(ColorMapPixmap(
      map, colormap_preview_->width(), colormap_preview_->height()));
}

void VtsViewer::on_background_changed(int index) {
  Q_UNUSED(index);
  config_.background = background_combo_->currentText();
  if (!pipeline_) {
    return;
  }
  pipeline_->apply_background(config_.background);
  render_window_->Render();
}

void VtsViewer::sync_config() {
  config_.field_name = field_combo_->currentData().toString();
  config_.field_kind =
      field_combo_->currentData(kFieldKindRole).toInt() ==
              static_cast<int>(FieldKind::kVector)
          ? FieldKind::kVector
          : FieldKind::kScalar;
  config_.mode = VisModeFromName(mode_combo_->currentText());
  config_.color_map = ColorMapFromName(colormap_combo_->currentText());
  config_.clip_axis = static_cast<Axis>(clip_axis_->currentIndex());
  config_.clip_position = clip_position_->value();
  config_.contour_levels = contour_levels_->text();
  config_.glyph_color_mode = glyph_color_mode_->currentText() == "Colormap"
                                 ? GlyphColorMode::kColormap
                                 : GlyphColorMode::kSingleColor;
  config_.glyph_size_mode = glyph_size_mode_->currentText() == "Uniform"
                                ? GlyphSizeMode::kUniform
                                : GlyphSizeMode::kMagnitude;
  config_.glyph_scale =
      ParseGlyphScale(glyph_scale_->text(), config_.glyph_scale);
  config_.opacity = OpacityFromSlider(opacity_->value());
  config_.include_boundary = include_boundary_->isChecked();
  config_.auto_range = auto_range_->isChecked();
  config_.range_min = range_exact_.min;
  config_.range_max = range_exact_.max;
  config_.show_axes = show_axes_->isChecked();
  config_.show_bounds = show_bounds_->isChecked();
  config_.show_color_bar = show_color_bar_->isChecked();
  config_.background = background_combo_->currentText();
}

void VtsViewer::render_current() {
  if (!pipeline_ || !render_window_) {
    return;
  }
  const GridFramePtr frame = controller_->current_frame();
  if (!frame) {
    return;
  }
  sync_config();
  const RenderReport report = pipeline_->render(frame, config_);
  if (report.rendered && config_.auto_range) {
    show_range(report.data_range);
  }
  if (!report.message.isEmpty()) {
    emit status_message(report.message);
  }
  render_window_->Render();
}

// The spin boxes show a rounded copy; the exact range stays in range_exact_
// until the user edits a box.
void VtsViewer::show_range(const ScalarRange& range) {
  const QSignalBlocker b1(range_min_);
  const QSignalBlocker b2(range_max_);
  range_exact_ = range;
  const int decimals = RangeDecimals(range);
  range_min_->setDecimals(decimals);
  range_max_->setDecimals(decimals);
  range_min_->setValue(range.min);
  range_max_->setValue(range.max);
}

void VtsViewer::on_play_toggled() {
  if (controller_->is_playing()) {
    controller_->stop_playback();
  } else {
    controller_->start_playback();
  }
}

void VtsViewer::on_auto_update_toggled(bool enabled) {
  controller_->set_auto_update_interval(
      auto_update_interval_->currentData().toInt());
  if (!controller_->set_auto_update(enabled)) {
    const QSignalBlocker block(auto_update_);
    auto_update_->setChecked(controller_->auto_update_active());
  }
}

void VtsViewer::set_controls_enabled(bool enabled) {
  const bool has_series = controller_->has_series();
  const QList<QWidget*> controls = {
      open_btn_,         refresh_btn_,      file_combo_,
      frame_delay_,      field_combo_,      colormap_combo_,
      auto_range_,       include_boundary_, mode_combo_,
      clip_axis_,        clip_position_,    contour_levels_,
      glyph_color_mode_, glyph_size_mode_,  glyph_scale_,
      opacity_,          background_combo_, show_axes_,
      show_bounds_,      show_color_bar_,   view_combo_,
      view_apply_,       probe_enable_,     auto_update_interval_};
  for (auto* w : controls) {
    w->setEnabled(enabled);
  }
  glyph_color_btn_->setEnabled(
      enabled && glyph_color_mode_->currentText() == "Single Color");
  range_min_->setEnabled(enabled && !auto_range_->isChecked());
  range_max_->setEnabled(enabled && !auto_range_->isChecked());
  const bool probing = enabled && probe_enable_->isChecked();
  probe_p1_edit_->setEnabled(probing);
  probe_p2_edit_->setEnabled(probing);
  probe_apply_->setEnabled(probing);
  probe_export_->setEnabled(probing && !probe_result_.empty());
  play_btn_->setEnabled(has_series || controller_->is_playing());
  // Auto update stays reachable so it can be switched off again.
  auto_update_->setEnabled(!controller_->is_playing());
}

void VtsViewer::on_probe_toggled(bool enabled) {
  set_controls_enabled(true);
  if (!line_widget_) {
    return;
  }
  if (!enabled) {
    line_widget_->Off();
    probe_result_ = LineProbeResult();
    fill_probe_table();
    emit probe_result_ready(probe_result_);
    render_window_->Render();
    return;
  }
  place_probe_line();
  update_probe();
}

void VtsViewer::place_probe_line() {
  const GridFramePtr frame = controller_->current_frame();
  if (!frame || !line_widget_) {
    return;
  }
  if (!probe_points_set_) {
    const auto line = DefaultProbeLine(*frame);
    probe_p1_ = line.first;
    probe_p2_ = line.second;
    probe_points_set_ = true;
  }
  double bounds[6];
  std::copy(frame->bounds().begin(), frame->bounds().end(), bounds);
  line_widget_->PlaceWidget(bounds);
  line_widget_->SetPoint1(probe_p1_.data());
  line_widget_->SetPoint2(probe_p2_.data());
  line_widget_->On();
  probe_p1_edit_->setText(FormatPoint(probe_p1_));
  probe_p2_edit_->setText(FormatPoint(probe_p2_));
  render_window_->Render();
}

void VtsViewer::on_probe_points_edited() {
  const auto p1 = ParsePoint(probe_p1_edit_->text());
  const auto p2 = ParsePoint(probe_p2_edit_->text());
  if (!p1 || !p2) {
    emit status_message("Probe points must be three comma-separated numbers.");
    return;
  }
  probe_p1_ = *p1;
  probe_p2_ = *p2;
  probe_points_set_ = true;
  place_probe_line();
  update_probe();
}

void VtsViewer::update_probe() {
  if (!probe_enable_->isChecked()) {
    return;
  }
  const GridFramePtr frame = controller_->current_frame();
  if (frame && !probe_points_set_) {
    place_probe_line();
  }
  probe_result_ = SampleLine(frame, probe_p1_, probe_p2_);
  fill_probe_table();
  probe_export_->setEnabled(!probe_result_.empty() &&
                            !controller_->is_playing());
  if (probe_result_.empty()) {
    emit status_message("Probe line is empty.");
  }
  emit probe_result_ready(probe_result_);
}

void VtsViewer::fill_probe_table() {
  probe_table_->clear();
  probe_table_->setColumnCount(probe_result_.column_count());
  probe_table_->setRowCount(probe_result_.rows());
  probe_table_->setHorizontalHeaderLabels(probe_result_.column_names());
  for (int c = 0; c < probe_result_.column_count(); ++c) {
    const auto& values = probe_result_.columns[c].values;
    for (int r = 0; r < static_cast<int>(values.size()); ++r) {
      probe_table_->setItem(
          r, c, new QTableWidgetItem(QString::number(values[r], 'g', 6)));
    }
  }
}

bool VtsViewer::save_screenshot(const QString& path) {
  QString error;
  if (!WriteScreenshot(render_window_, path, &error)) {
    emit status_message("Failed to save screenshot: " + error);
    return false;
  }
  emit status_message("Screenshot saved: " + path);
  return true;
}

bool VtsViewer::export_probe_table(const QString& requested_path) {
  const QString path = ProbeTablePath(requested_path);
  QString error;
  if (!WriteProbeTable(probe_result_, path, &error)) {
    emit status_message("Failed to export probe table: " + error);
    return false;
  }
  emit status_message("Probe table exported: " + path);
  return true;
}

QVariantMap VtsViewer::viewer_settings() const {
  QVariantMap map = ConfigToVariantMap(config_);
  map.insert("field", field_combo_->currentData().toString());
  map.insert("folder", folder());
  map.insert("prefix", prefix());
  map.insert("frame_index", controller_->current_index());
  map.insert("frame_delay_ms", frame_delay_->value());
  map.insert("auto_update_interval", auto_update_interval_->currentText());
  map.insert("probe_enable", probe_enable_->isChecked());
  if (probe_points_set_) {
    map.insert("probe_p1",
               QVariantList{probe_p1_[0], probe_p1_[1], probe_p1_[2]});
    map.insert("probe_p2",
               QVariantList{probe_p2_[0], probe_p2_[1], probe_p2_[2]});
  }
  return map;
}

void VtsViewer::apply_viewer_settings(const QVariantMap& settings) {
  controller_->stop_playback();
  const QString dir = settings.value("folder").toString();
  const QString pfx = settings.value("prefix").toString();
  if (!dir.isEmpty()) {
    const bool loaded = pfx.isEmpty() ? load(dir) : load(dir, pfx);
    if (!loaded) {
      return;
    }
  }

  const VisualizationConfig c = ConfigFromVariantMap(settings);
  {
    const QSignalBlocker b1(mode_combo_);
    const QSignalBlocker b2(colormap_combo_);
    const QSignalBlocker b3(clip_axis_);
    const QSignalBlocker b4(clip_position_);
    const QSignalBlocker b5(glyph_color_mode_);
    const QSignalBlocker b6(glyph_size_mode_);
    const QSignalBlocker b7(opacity_);
    const QSignalBlocker b8(include_boundary_);
    const QSignalBlocker b9(auto_range_);
    const QSignalBlocker b10(range_min_);
    const QSignalBlocker b11(range_max_);
    const QSignalBlocker b12(show_axes_);
    const QSignalBlocker b13(show_bounds_);
    const QSignalBlocker b14(show_color_bar_);
    const QSignalBlocker b15(background_combo_);
    const QSignalBlocker b16(frame_delay_);
    const QSignalBlocker b17(auto_update_interval_);
    mode_combo_->setCurrentText(VisModeName(c.mode));
    colormap_combo_->setCurrentText(ColorMapName(c.color_map));
    clip_axis_->setCurrentIndex(static_cast<int>(c.clip_axis));
    update_clip_range(false);
    clip_position_->setValue(c.clip_position);
    contour_levels_->setText(c.contour_levels);
    glyph_color_mode_->setCurrentText(
        c.glyph_color_mode == GlyphColorMode::kColormap ? "Colormap"
                                                        : "Single Color");
    glyph_size_mode_->setCurrentText(
        c.glyph_size_mode == GlyphSizeMode::kUniform ? "Uniform"
                                                     : "Magnitude");
    glyph_scale_->setText(QString::number(c.glyph_scale));
    config_.glyph_color = c.glyph_color;
    glyph_color_btn_->setStyleSheet(ColorButtonStyle(c.glyph_color));
    opacity_->setValue(SliderFromOpacity(c.opacity));
    opacity_label_->setText(QString::number(c.opacity, 'f', 2));
    include_boundary_->setChecked(c.include_boundary);
    auto_range_->setChecked(c.auto_range);
    show_range({c.range_min, c.range_max});
    show_axes_->setChecked(c.show_axes);
    show_bounds_->setChecked(c.show_bounds);
    show_color_bar_->setChecked(c.show_color_bar);
    background_combo_->setCurrentText(c.background);
    frame_delay_->setValue(
        settings.value("frame_delay_ms", frame_delay_->value()).toInt());
    controller_->set_frame_delay(frame_delay_->value());
    const QString interval =
        settings.value("auto_update_interval", "0.5s").toString();
    if (auto_update_interval_->findText(interval) >= 0) {
      auto_update_interval_->setCurrentText(interval);
    }
    controller_->set_auto_update_interval(
        auto_update_interval_->currentData().toInt());
  }
  if (pipeline_) {
    pipeline_->apply_background(c.background);
  }
  update_mode_controls();
  update_colormap_preview();
  set_controls_enabled(true);

  {
    const QSignalBlocker block(field_combo_);
    const int idx = field_combo_->findData(c.field_name);
    if (idx >= 0) {
      field_combo_->setCurrentIndex(idx);
    }
  }

  const QVariantList p1 = settings.value("probe_p1").toList();
  const QVariantList p2 = settings.value("probe_p2").toList();
  if (p1.size() == 3 && p2.size() == 3) {
    for (int i = 0; i < 3; ++i) {
      probe_p1_[i] = p1[i].toDouble();
      probe_p2_[i] = p2[i].toDouble();
    }
    probe_points_set_ = true;
  }

  const int frame_index = settings.value("frame_index", -1).toInt();
  if (frame_index > 0 && frame_index != controller_->current_index()) {
    controller_->show_frame(frame_index);
  } else {
    render_current();
  }
  probe_enable_->setChecked(settings.value("probe_enable", false).toBool());
}

}  // namespace mdv
