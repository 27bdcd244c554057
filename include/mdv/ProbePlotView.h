#pragma once

#include <QString>
#include <QWidget>

#include <vtkSmartPointer.h>

#include "mdv/LineProbe.h"
#include "mdv/ProbePlot.h"

class QVBoxLayout;
class QVTKOpenGLNativeWidget;
class vtkChartXY;
class vtkContextView;
class vtkGenericOpenGLRenderWindow;

namespace mdv {

// Line chart of a probe result against arc length, with a visibility
// checkbox, a color button and a line style choice per column.
class ProbePlotView : public QWidget {
  Q_OBJECT
 public:
  explicit ProbePlotView(QWidget* parent = nullptr);
  ~ProbePlotView() override;

  const ProbePlotStyles& styles() const { return styles_; }
  vtkChartXY* chart() const { return chart_; }

 public slots:
  void set_result(const mdv::LineProbeResult& result);
  void clear();

 private:
  void rebuild_style_controls();
  void redraw();

  LineProbeResult result_;
  ProbePlotStyles styles_;
  QStringList control_columns_;

  QWidget* style_panel_ = nullptr;
  QVBoxLayout* style_layout_ = nullptr;
  QVTKOpenGLNativeWidget* vtk_widget_ = nullptr;
  vtkSmartPointer<vtkGenericOpenGLRenderWindow> render_window_;
  vtkSmartPointer<vtkContextView> view_;
  vtkSmartPointer<vtkChartXY> chart_;
};

}  // namespace mdv
