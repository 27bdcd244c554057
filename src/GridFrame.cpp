#include "mdv/GridFrame.h"

#include <QFileInfo>

#include <algorithm>
#include <utility>

#include <vtkCallbackCommand.h>
#include <vtkCommand.h>
#include <vtkDataArray.h>
#include <vtkPointData.h>
#include <vtkStructuredGrid.h>
#include <vtkXMLStructuredGridReader.h>

#include "mdv/Errors.h"
#include "mdv/Log.h"

namespace mdv {

namespace {

std::vector<FieldInfo> CollectFields(vtkStructuredGrid* grid) {
  std::vector<FieldInfo> fields;
  auto* pd = grid ? grid->GetPointData() : nullptr;
  if (!pd) {
    return fields;
  }
  for (int i = 0; i < pd->GetNumberOfArrays(); ++i) {
    vtkDataArray* arr = pd->GetArray(i);
    const char* name = pd->GetArrayName(i);
    if (!arr || !name) {
      continue;
    }
    // Ghost and validity masks written by some solvers are not fields.
    const QString qname = QString::fromUtf8(name);
    if (qname == "vtkValidPointMask" || qname == "vtkGhostType") {
      continue;
    }
    const int comps = arr->GetNumberOfComponents();
    FieldInfo info;
    info.name = qname;
    info.components = comps;
    if (comps == 1) {
      info.kind = FieldKind::kScalar;
    } else if (comps == 3) {
      info.kind = FieldKind::kVector;
    } else {
      continue;
    }
    fields.push_back(info);
  }
  std::stable_sort(fields.begin(), fields.end(),
                   [](const FieldInfo& a, const FieldInfo& b) {
                     if (a.kind != b.kind) {
                       return a.kind == FieldKind::kScalar;
                     }
                     return a.name < b.name;
                   });
  return fields;
}

}  // namespace

QString FieldInfo::display_name() const {
  return QString("%1 %2")
      .arg(kind == FieldKind::kVector ? "[V]" : "[S]", name);
}

GridFrame::GridFrame(QString path, vtkSmartPointer<vtkStructuredGrid> grid)
    : path_(std::move(path)), grid_(std::move(grid)) {
  if (!grid_) {
    return;
  }
  point_count_ = static_cast<long long>(grid_->GetNumberOfPoints());
  int dims[3] = {0, 0, 0};
  grid_->GetDimensions(dims);
  dims_ = {{dims[0], dims[1], dims[2]}};
  double b[6] = {0, 0, 0, 0, 0, 0};
  grid_->GetBounds(b);
  std::copy(b, b + 6, bounds_.begin());
  fields_ = CollectFields(grid_);
}

QString GridFrame::file_name() const {
  return QFileInfo(path_).fileName();
}

const FieldInfo* GridFrame::find_field(const QString& name) const {
  for (const auto& f : fields_) {
    if (f.name == name) {
      return &f;
    }
  }
  return nullptr;
}

GridFramePtr LoadGridFrame(const QString& path) {
  QFileInfo fi(path);
  if (!fi.exists() || !fi.isFile()) {
    throw LoadError(path, "file does not exist");
  }

  QString reader_error;
  auto error_cb = vtkSmartPointer<vtkCallbackCommand>::New();
  error_cb->SetClientData(&reader_error);
  error_cb->SetCallback([](vtkObject*, unsigned long, void* client_data,
                           void* call_data) {
    auto* out = static_cast<QString*>(client_data);
    const char* text = static_cast<const char*>(call_data);
    if (out && out->isEmpty()) {
      *out = text ? QString::fromUtf8(text).trimmed() : "reader error";
    }
  });

  auto reader = vtkSmartPointer<vtkXMLStructuredGridReader>::New();
  reader->AddObserver(vtkCommand::ErrorEvent, error_cb);
  reader->SetFileName(path.toUtf8().constData());
  reader->Update();

  vtkStructuredGrid* output = reader->GetOutput();
  if (!reader_error.isEmpty()) {
    throw LoadError(path, reader_error);
  }
  if (!output || output->GetNumberOfPoints() == 0) {
    throw LoadError(path, "grid has no points");
  }

  auto grid = vtkSmartPointer<vtkStructuredGrid>::New();
  grid->ShallowCopy(output);
  auto frame = std::make_shared<GridFrame>(path, grid);
  qCDebug(lcLoader) << "loaded" << fi.fileName() << "points"
                    << frame->point_count() << "fields"
                    << static_cast<int>(frame->fields().size());
  return frame;
}

}  // namespace mdv
