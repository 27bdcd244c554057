#include "mdv/LineProbe.h"

#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>
#include <QVariant>

#include <algorithm>
#include <cmath>
#include <utility>

#include <vtkDataArray.h>
#include <vtkDataSet.h>
#include <vtkLineSource.h>
#include <vtkPointData.h>
#include <vtkProbeFilter.h>
#include <vtkStructuredGrid.h>

#include <xlsxcellrange.h>
#include <xlsxdocument.h>

#include "mdv/Log.h"

namespace mdv {

namespace {

double Distance(const double* a, const double* b) {
  const double dx = b[0] - a[0];
  const double dy = b[1] - a[1];
  const double dz = b[2] - a[2];
  return std::sqrt(dx * dx + dy * dy + dz * dz);
}

void SetError(QString* error, const QString& message) {
  if (error) {
    *error = message;
  }
}

}  // namespace

QStringList LineProbeResult::column_names() const {
  QStringList names;
  for (const auto& c : columns) {
    names << c.name;
  }
  return names;
}

const ProbeColumn* LineProbeResult::column(const QString& name) const {
  for (const auto& c : columns) {
    if (c.name == name) {
      return &c;
    }
  }
  return nullptr;
}

std::pair<Point3, Point3> DefaultProbeLine(const GridFrame& frame) {
  const auto& b = frame.bounds();
  return {Point3{{b[0], b[2], b[4]}}, Point3{{b[1], b[3], b[5]}}};
}

LineProbeResult SampleLine(const GridFramePtr& frame, const Point3& p1,
                           const Point3& p2, int resolution) {
  LineProbeResult result;
  result.p1 = p1;
  result.p2 = p2;
  if (!frame || !frame->grid() || frame->point_count() == 0) {
    return result;
  }
  if (Distance(p1.data(), p2.data()) <= 0.0) {
    qCDebug(lcProbe) << "zero-length probe line ignored";
    return result;
  }
  result.source = frame->file_name();

  // The probe builds locators on its source; keep them off the shared frame.
  auto source = vtkSmartPointer<vtkStructuredGrid>::New();
  source->ShallowCopy(frame->grid());

  auto line = vtkSmartPointer<vtkLineSource>::New();
  line->SetPoint1(p1[0], p1[1], p1[2]);
  line->SetPoint2(p2[0], p2[1], p2[2]);
  line->SetResolution(std::max(1, resolution));

  auto probe = vtkSmartPointer<vtkProbeFilter>::New();
  probe->SetInputConnection(line->GetOutputPort());
  probe->SetSourceData(source);
  probe->Update();

  vtkDataSet* out = probe->GetOutput();
  if (!out || out->GetNumberOfPoints() == 0) {
    return result;
  }
  const vtkIdType n = out->GetNumberOfPoints();

  ProbeColumn arc{"arc_length", {}};
  arc.values.reserve(n);
  double prev[3] = {0, 0, 0};
  double total = 0.0;
  for (vtkIdType i = 0; i < n; ++i) {
    double pt[3] = {0, 0, 0};
    out->GetPoint(i, pt);
    if (i > 0) {
      total += Distance(prev, pt);
    }
    arc.values.push_back(total);
    std::copy(pt, pt + 3, prev);
  }
  result.columns.push_back(std::move(arc));

  auto* pd = out->GetPointData();
  for (const auto& field : frame->fields()) {
    vtkDataArray* arr = pd->GetArray(field.name.toUtf8().constData());
    if (!arr) {
      continue;
    }
    if (field.kind == FieldKind::kScalar) {
      ProbeColumn col{field.name, {}};
      col.values.reserve(n);
      for (vtkIdType i = 0; i < n; ++i) {
        col.values.push_back(arr->GetComponent(i, 0));
      }
      result.columns.push_back(std::move(col));
      continue;
    }
    ProbeColumn cx{field.name + "_X", {}};
    ProbeColumn cy{field.name + "_Y", {}};
    ProbeColumn cz{field.name + "_Z", {}};
    ProbeColumn cm{field.name + "_Magnitude", {}};
    for (vtkIdType i = 0; i < n; ++i) {
      const double x = arr->GetComponent(i, 0);
      const double y = arr->GetComponent(i, 1);
      const double z = arr->GetComponent(i, 2);
      cx.values.push_back(x);
      cy.values.push_back(y);
      cz.values.push_back(z);
      cm.values.push_back(std::sqrt(x * x + y * y + z * z));
    }
    result.columns.push_back(std::move(cx));
    result.columns.push_back(std::move(cy));
    result.columns.push_back(std::move(cz));
    result.columns.push_back(std::move(cm));
  }
  qCDebug(lcProbe) << "sampled" << result.rows() << "points,"
                   << result.column_count() << "columns from" << result.source;
  return result;
}

QString CleanSpreadsheetText(const QString& text) {
  static const QRegularExpression kIllegal(
      "[\\x00-\\x08\\x0B\\x0C\\x0E-\\x1F\\x7F]");
  QString out = text;
  out.remove(kIllegal);
  return out;
}

QString ProbeTablePath(const QString& path) {
  if (path.endsWith(".xlsx", Qt::CaseInsensitive)) {
    return path;
  }
  return path + ".xlsx";
}

bool WriteProbeTable(const LineProbeResult& table, const QString& path,
                     QString* error) {
  if (table.empty()) {
    SetError(error, "Probe table is empty.");
    return false;
  }
  QXlsx::Document xlsx;
  for (int c = 0; c < table.column_count(); ++c) {
    xlsx.write(1, c + 1, CleanSpreadsheetText(table.columns[c].name));
  }
  const int rows = table.rows();
  for (int c = 0; c < table.column_count(); ++c) {
    const auto& values = table.columns[c].values;
    for (int r = 0; r < rows && r < static_cast<int>(values.size()); ++r) {
      // Missing samples stay blank cells.
      if (std::isfinite(values[r])) {
        xlsx.write(r + 2, c + 1, values[r]);
      }
    }
  }
  QSaveFile file(path);
  if (!file.open(QIODevice::WriteOnly)) {
    SetError(error, file.errorString());
    return false;
  }
  if (!xlsx.saveAs(&file)) {
    file.cancelWriting();
    SetError(error, QString("Could not write workbook %1").arg(path));
    return false;
  }
  if (!file.commit()) {
    SetError(error, file.errorString());
    return false;
  }
  qCInfo(lcProbe) << "exported" << rows << "rows to" << path;
  return true;
}

std::optional<LineProbeResult> ReadProbeTable(const QString& path,
                                              QString* error) {
  if (!QFileInfo::exists(path)) {
    SetError(error, QString("No such file: %1").arg(path));
    return std::nullopt;
  }
  QXlsx::Document xlsx(path);
  if (!xlsx.isLoadPackage()) {
    SetError(error, QString("Not a workbook: %1").arg(path));
    return std::nullopt;
  }
  const QXlsx::CellRange range = xlsx.dimension();
  if (!range.isValid() || range.lastColumn() < 1) {
    SetError(error, "Missing header row.");
    return std::nullopt;
  }
  LineProbeResult table;
  table.source = QFileInfo(path).fileName();
  for (int c = 1; c <= range.lastColumn(); ++c) {
    const QString name = xlsx.read(1, c).toString();
    if (name.isEmpty()) {
      SetError(error, QString("Column %1 has no header").arg(c));
      return std::nullopt;
    }
    table.columns.push_back({name, {}});
  }
  for (int r = 2; r <= range.lastRow(); ++r) {
    for (int c = 1; c <= range.lastColumn(); ++c) {
      const QVariant cell = xlsx.read(r, c);
      double v = std::nan("");
      if (cell.isValid() && !cell.toString().isEmpty()) {
        bool ok = false;
        v = cell.toDouble(&ok);
        if (!ok) {
          SetError(error, QString("Row %1: '%2' is not a number")
                              .arg(r)
                              .arg(cell.toString()));
          return std::nullopt;
        }
      }
      table.columns[c - 1].values.push_back(v);
    }
  }
  return table;
}

}  // namespace mdv
