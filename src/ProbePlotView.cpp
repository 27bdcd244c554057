#include "mdv/ProbePlotView.h"

#include <QCheckBox>
#include <QColorDialog>
#include <QComboBox>
#include <QHBoxLayout>
#include <QLayoutItem>
#include <QPushButton>
#include <QScrollArea>
#include <QSplitter>
#include <QVBoxLayout>

#include <QVTKOpenGLNativeWidget.h>
#include <vtkChartXY.h>
#include <vtkContextScene.h>
#include <vtkContextView.h>
#include <vtkGenericOpenGLRenderWindow.h>
#include <vtkRenderer.h>

#include "mdv/Log.h"

namespace mdv {

namespace {

QString SwatchStyle(const QColor& c) {
  return QString("background-color: %1;").arg(c.name());
}

}  // namespace

ProbePlotView::ProbePlotView(QWidget* parent) : QWidget(parent) {
  auto* layout = new QVBoxLayout(this);
  layout->setContentsMargins(0, 0, 0, 0);
  auto* split = new QSplitter(Qt::Vertical, this);
  layout->addWidget(split);

  auto* scroll = new QScrollArea(split);
  scroll->setWidgetResizable(true);
  style_panel_ = new QWidget();
  style_layout_ = new QVBoxLayout(style_panel_);
  style_layout_->setContentsMargins(4, 4, 4, 4);
  style_layout_->addStretch(1);
  scroll->setWidget(style_panel_);
  scroll->setMinimumHeight(80);

  vtk_widget_ = new QVTKOpenGLNativeWidget(split);
  vtk_widget_->setMinimumHeight(220);
  split->setStretchFactor(1, 1);

  render_window_ = vtkSmartPointer<vtkGenericOpenGLRenderWindow>::New();
  vtk_widget_->setRenderWindow(render_window_);
  view_ = vtkSmartPointer<vtkContextView>::New();
  view_->SetRenderWindow(render_window_);
  view_->GetRenderer()->SetBackground(1.0, 1.0, 1.0);
  chart_ = vtkSmartPointer<vtkChartXY>::New();
  view_->GetScene()->AddItem(chart_);
  if (render_window_->GetInteractor()) {
    view_->SetInteractor(render_window_->GetInteractor());
  }
}

ProbePlotView::~ProbePlotView() = default;

void ProbePlotView::set_result(const LineProbeResult& result) {
  result_ = result;
  styles_.sync(PlottableColumns(result_));
  if (styles_.columns() != control_columns_) {
    rebuild_style_controls();
  }
  redraw();
}

void ProbePlotView::clear() {
  set_result(LineProbeResult());
}

void ProbePlotView::rebuild_style_controls() {
  while (style_layout_->count() > 0) {
    QLayoutItem* item = style_layout_->takeAt(0);
    if (item->widget()) {
      item->widget()->deleteLater();
    }
    delete item;
  }
  control_columns_ = styles_.columns();
  for (const auto& column : control_columns_) {
    const PlotSeriesStyle style = styles_.style(column);
    auto* row = new QWidget(style_panel_);
    auto* hbox = new QHBoxLayout(row);
    hbox->setContentsMargins(0, 0, 0, 0);

    auto* visible = new QCheckBox(column, row);
    visible->setChecked(style.visible);
    connect(visible, &QCheckBox::toggled, this, [this, column](bool on) {
      styles_.set_visible(column, on);
      redraw();
    });

    auto* color = new QPushButton("Color", row);
    color->setFixedWidth(60);
    color->setStyleSheet(SwatchStyle(style.color));
    connect(color, &QPushButton::clicked, this, [this, column, color]() {
      const QColor picked = QColorDialog::getColor(
          styles_.style(column).color, this, "Color for " + column);
      if (!picked.isValid()) {
        return;
      }
      styles_.set_color(column, picked);
      color->setStyleSheet(SwatchStyle(picked));
      redraw();
    });

    auto* line_style = new QComboBox(row);
    line_style->addItems(PlotLineStyleNames());
    line_style->setCurrentText(PlotLineStyleName(style.line_style));
    line_style->setFixedWidth(60);
    connect(line_style, &QComboBox::currentTextChanged, this,
            [this, column](const QString& text) {
              styles_.set_line_style(column, PlotLineStyleFromName(text));
              redraw();
            });

    hbox->addWidget(visible, 1);
    hbox->addWidget(color);
    hbox->addWidget(line_style);
    style_layout_->addWidget(row);
  }
  style_layout_->addStretch(1);
}

void ProbePlotView::redraw() {
  PopulateChart(chart_, result_, styles_);
  if (vtk_widget_->isVisible()) {
    render_window_->Render();
  } else {
    vtk_widget_->update();
  }
}

}  // namespace mdv
