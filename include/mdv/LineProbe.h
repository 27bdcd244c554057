#pragma once

#include <QMetaType>
#include <QString>
#include <QStringList>

#include <array>
#include <optional>
#include <utility>
#include <vector>

#include "mdv/GridFrame.h"

namespace mdv {

constexpr int kDefaultProbeResolution = 100;

using Point3 = std::array<double, 3>;

struct ProbeColumn {
  QString name;
  std::vector<double> values;
};

// Samples of every field along a line, indexed by arc length. The first
// column is always "arc_length".
struct LineProbeResult {
  Point3 p1{{0, 0, 0}};
  Point3 p2{{0, 0, 0}};
  QString source;
  std::vector<ProbeColumn> columns;

  int rows() const {
    return columns.empty() ? 0
                           : static_cast<int>(columns.front().values.size());
  }
  int column_count() const { return static_cast<int>(columns.size()); }
  bool empty() const { return rows() == 0; }
  QStringList column_names() const;
  const ProbeColumn* column(const QString& name) const;
};

// The diagonal of the frame bounds, used as the initial probe line.
std::pair<Point3, Point3> DefaultProbeLine(const GridFrame& frame);

// Interpolates the frame's point data at resolution + 1 points between p1
// and p2. Returns an empty result for a null or empty frame and for a
// zero-length line.
LineProbeResult SampleLine(const GridFramePtr& frame, const Point3& p1,
                           const Point3& p2,
                           int resolution = kDefaultProbeResolution);

// Strips control characters that spreadsheet applications reject.
QString CleanSpreadsheetText(const QString& text);

// Appends ".xlsx" unless the path already ends with it.
QString ProbeTablePath(const QString& path);

// Writes the table as an .xlsx workbook: a header row of column names, one
// row per sample. Returns false and fills `error` on failure.
bool WriteProbeTable(const LineProbeResult& table, const QString& path,
                     QString* error = nullptr);
std::optional<LineProbeResult> ReadProbeTable(const QString& path,
                                              QString* error = nullptr);

}  // namespace mdv

Q_DECLARE_METATYPE(mdv::LineProbeResult)
