#pragma once

#include <QString>
#include <QStringList>

#include <array>
#include <memory>
#include <vector>

#include <vtkSmartPointer.h>

class vtkStructuredGrid;

namespace mdv {

enum class FieldKind { kScalar, kVector };

struct FieldInfo {
  QString name;
  int components = 1;
  FieldKind kind = FieldKind::kScalar;

  // "[S] name" or "[V] name", as shown in the field selector.
  QString display_name() const;
};

// One structured-grid file loaded into memory. Never modified after
// LoadGridFrame returns; shared read-only between the display, the prefetch
// queue and the line probe.
class GridFrame {
 public:
  GridFrame(QString path, vtkSmartPointer<vtkStructuredGrid> grid);

  const QString& path() const { return path_; }
  QString file_name() const;
  vtkStructuredGrid* grid() const { return grid_; }

  long long point_count() const { return point_count_; }
  const std::array<int, 3>& dimensions() const { return dims_; }
  const std::array<double, 6>& bounds() const { return bounds_; }

  // Scalars first, then vectors, each sorted by name.
  const std::vector<FieldInfo>& fields() const { return fields_; }
  const FieldInfo* find_field(const QString& name) const;
  bool has_field(const QString& name) const {
    return find_field(name) != nullptr;
  }

 private:
  QString path_;
  vtkSmartPointer<vtkStructuredGrid> grid_;
  long long point_count_ = 0;
  std::array<int, 3> dims_{{0, 0, 0}};
  std::array<double, 6> bounds_{{0, 0, 0, 0, 0, 0}};
  std::vector<FieldInfo> fields_;
};

using GridFramePtr = std::shared_ptr<const GridFrame>;

// Reads a VTK XML structured grid. Throws LoadError when the file is
// missing, malformed or has no points.
GridFramePtr LoadGridFrame(const QString& path);

}  // namespace mdv
