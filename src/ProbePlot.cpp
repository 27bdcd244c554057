#include "mdv/ProbePlot.h"

#include <array>

#include <vtkAxis.h>
#include <vtkChart.h>
#include <vtkChartXY.h>
#include <vtkDoubleArray.h>
#include <vtkPen.h>
#include <vtkPlot.h>
#include <vtkTable.h>

#include "mdv/Log.h"

namespace mdv {

namespace {

constexpr const char* kArcLength = "arc_length";
constexpr const char* kValidMask = "vtkValidPointMask";

constexpr std::array<QRgb, 10> kPalette = {
    0x1f77b4, 0xff7f0e, 0x2ca02c, 0xd62728, 0x9467bd,
    0x8c564b, 0xe377c2, 0x7f7f7f, 0xbcbd22, 0x17becf};

int PenType(PlotLineStyle style) {
  switch (style) {
    case PlotLineStyle::kDashed:
      return vtkPen::DASH_LINE;
    case PlotLineStyle::kDashDot:
      return vtkPen::DASH_DOT_LINE;
    case PlotLineStyle::kDotted:
      return vtkPen::DOT_LINE;
    case PlotLineStyle::kSolid:
      break;
  }
  return vtkPen::SOLID_LINE;
}

vtkSmartPointer<vtkDoubleArray> ToArray(const ProbeColumn& column) {
  auto arr = vtkSmartPointer<vtkDoubleArray>::New();
  arr->SetName(column.name.toUtf8().constData());
  arr->SetNumberOfValues(static_cast<vtkIdType>(column.values.size()));
  for (size_t i = 0; i < column.values.size(); ++i) {
    arr->SetValue(static_cast<vtkIdType>(i), column.values[i]);
  }
  return arr;
}

}  // namespace

const QStringList& PlotLineStyleNames() {
  static const QStringList kNames = {"-", "--", "-.", ":"};
  return kNames;
}

QString PlotLineStyleName(PlotLineStyle style) {
  return PlotLineStyleNames().at(static_cast<int>(style));
}

PlotLineStyle PlotLineStyleFromName(const QString& name) {
  const int idx = PlotLineStyleNames().indexOf(name.trimmed());
  return idx < 0 ? PlotLineStyle::kSolid : static_cast<PlotLineStyle>(idx);
}

QColor PlotPaletteColor(int index) {
  const int n = static_cast<int>(kPalette.size());
  return QColor(kPalette[((index % n) + n) % n]);
}

QStringList PlottableColumns(const LineProbeResult& result) {
  QStringList out;
  for (const auto& c : result.columns) {
    if (c.name != kArcLength && c.name != kValidMask) {
      out << c.name;
    }
  }
  return out;
}

void ProbePlotStyles::sync(const QStringList& columns) {
  for (auto it = styles_.begin(); it != styles_.end();) {
    if (columns.contains(it.key())) {
      ++it;
    } else {
      it = styles_.erase(it);
    }
  }
  for (int i = 0; i < columns.size(); ++i) {
    if (!styles_.contains(columns[i])) {
      PlotSeriesStyle s;
      s.color = PlotPaletteColor(i);
      styles_.insert(columns[i], s);
    }
  }
  columns_ = columns;
}

PlotSeriesStyle ProbePlotStyles::style(const QString& column) const {
  return styles_.value(column);
}

int ProbePlotStyles::visible_count() const {
  int n = 0;
  for (const auto& name : columns_) {
    if (styles_.value(name).visible) {
      ++n;
    }
  }
  return n;
}

void ProbePlotStyles::set_visible(const QString& column, bool visible) {
  auto it = styles_.find(column);
  if (it != styles_.end()) {
    it->visible = visible;
  }
}

void ProbePlotStyles::set_color(const QString& column, const QColor& color) {
  auto it = styles_.find(column);
  if (it != styles_.end() && color.isValid()) {
    it->color = color;
  }
}

void ProbePlotStyles::set_line_style(const QString& column,
                                     PlotLineStyle style) {
  auto it = styles_.find(column);
  if (it != styles_.end()) {
    it->line_style = style;
  }
}

vtkSmartPointer<vtkTable> BuildPlotTable(const LineProbeResult& result,
                                         const ProbePlotStyles& styles) {
  auto table = vtkSmartPointer<vtkTable>::New();
  const ProbeColumn* arc = result.column(kArcLength);
  if (!arc || result.empty()) {
    return table;
  }
  table->AddColumn(ToArray(*arc));
  for (const auto& name : styles.columns()) {
    const ProbeColumn* col = result.column(name);
    if (col && styles.style(name).visible &&
        col->values.size() == arc->values.size()) {
      table->AddColumn(ToArray(*col));
    }
  }
  return table;
}

int PopulateChart(vtkChartXY* chart, const LineProbeResult& result,
                  const ProbePlotStyles& styles) {
  if (!chart) {
    return 0;
  }
  chart->ClearPlots();
  chart->GetAxis(vtkAxis::BOTTOM)->SetTitle("Arc Length");
  chart->GetAxis(vtkAxis::LEFT)->SetTitle("Value");
  chart->GetAxis(vtkAxis::BOTTOM)->SetGridVisible(true);
  chart->GetAxis(vtkAxis::LEFT)->SetGridVisible(true);

  vtkSmartPointer<vtkTable> table = BuildPlotTable(result, styles);
  const vtkIdType n_cols = table->GetNumberOfColumns();
  for (vtkIdType c = 1; c < n_cols; ++c) {
    const QString name = QString::fromUtf8(table->GetColumnName(c));
    const PlotSeriesStyle style = styles.style(name);
    vtkPlot* plot = chart->AddPlot(vtkChart::LINE);
    plot->SetInputData(table, 0, c);
    plot->SetLabel(name.toStdString());
    plot->SetColor(static_cast<unsigned char>(style.color.red()),
                   static_cast<unsigned char>(style.color.green()),
                   static_cast<unsigned char>(style.color.blue()), 255);
    plot->SetWidth(1.5f);
    plot->GetPen()->SetLineType(PenType(style.line_style));
  }
  chart->SetShowLegend(n_cols > 1);
  qCDebug(lcProbe) << "plotted" << (n_cols > 1 ? n_cols - 1 : 0)
                   << "series over" << table->GetNumberOfRows() << "rows";
  return n_cols > 1 ? static_cast<int>(n_cols - 1) : 0;
}

}  // namespace mdv
