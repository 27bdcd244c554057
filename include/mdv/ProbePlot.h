#pragma once

#include <QColor>
#include <QHash>
#include <QString>
#include <QStringList>

#include <vtkSmartPointer.h>

#include "mdv/LineProbe.h"

class vtkChartXY;
class vtkTable;

namespace mdv {

enum class PlotLineStyle { kSolid, kDashed, kDashDot, kDotted };

// "-", "--", "-.", ":" in PlotLineStyle order.
const QStringList& PlotLineStyleNames();
QString PlotLineStyleName(PlotLineStyle style);
PlotLineStyle PlotLineStyleFromName(const QString& name);

// Ten-color cycle used for new plot series.
QColor PlotPaletteColor(int index);

struct PlotSeriesStyle {
  bool visible = true;
  QColor color;
  PlotLineStyle line_style = PlotLineStyle::kSolid;
};

// Every probe column except arc_length and VTK's validity mask.
QStringList PlottableColumns(const LineProbeResult& result);

// Per-column styles that survive re-sampling of the same fields.
class ProbePlotStyles {
 public:
  // Forgets columns that are gone; a new column gets the palette color of
  // its position.
  void sync(const QStringList& columns);

  const QStringList& columns() const { return columns_; }
  bool contains(const QString& column) const {
    return styles_.contains(column);
  }
  PlotSeriesStyle style(const QString& column) const;
  int visible_count() const;

  void set_visible(const QString& column, bool visible);
  void set_color(const QString& column, const QColor& color);
  void set_line_style(const QString& column, PlotLineStyle style);

 private:
  QStringList columns_;
  QHash<QString, PlotSeriesStyle> styles_;
};

// arc_length followed by the visible columns.
vtkSmartPointer<vtkTable> BuildPlotTable(const LineProbeResult& result,
                                         const ProbePlotStyles& styles);

// Replaces the chart's plots with one line per visible column against arc
// length. Returns the number of lines added.
int PopulateChart(vtkChartXY* chart, const LineProbeResult& result,
                  const ProbePlotStyles& styles);

}  // namespace mdv
