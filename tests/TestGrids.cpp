#include "TestGrids.h"

#include <QDir>
#include <QFile>

#include <vtkDoubleArray.h>
#include <vtkPointData.h>
#include <vtkPoints.h>
#include <vtkStructuredGrid.h>
#include <vtkXMLStructuredGridWriter.h>

namespace mdv {
namespace testing {

vtkSmartPointer<vtkStructuredGrid> MakeBoxGrid(int nx, int ny, int nz,
                                               double offset) {
  auto grid = vtkSmartPointer<vtkStructuredGrid>::New();
  grid->SetDimensions(nx, ny, nz);

  auto points = vtkSmartPointer<vtkPoints>::New();
  auto phi = vtkSmartPointer<vtkDoubleArray>::New();
  phi->SetName("phi");
  auto conc = vtkSmartPointer<vtkDoubleArray>::New();
  conc->SetName("conc");
  auto velocity = vtkSmartPointer<vtkDoubleArray>::New();
  velocity->SetName("velocity");
  velocity->SetNumberOfComponents(3);

  const double scale = 1.0 + offset;
  for (int k = 0; k < nz; ++k) {
    for (int j = 0; j < ny; ++j) {
      for (int i = 0; i < nx; ++i) {
        points->InsertNextPoint(i, j, k);
        phi->InsertNextValue(i + offset);
        conc->InsertNextValue(j);
        velocity->InsertNextTuple3(1.0 * scale, 2.0 * scale, 2.0 * scale);
      }
    }
  }
  grid->SetPoints(points);
  grid->GetPointData()->AddArray(phi);
  grid->GetPointData()->AddArray(conc);
  grid->GetPointData()->AddArray(velocity);
  return grid;
}

bool WriteGrid(vtkStructuredGrid* grid, const QString& path) {
  auto writer = vtkSmartPointer<vtkXMLStructuredGridWriter>::New();
  writer->SetFileName(path.toUtf8().constData());
  writer->SetInputData(grid);
  writer->SetDataModeToBinary();
  return writer->Write() == 1;
}

QStringList WriteSeries(const QString& folder, const QString& prefix,
                        const QList<int>& indices, int nx, int ny, int nz) {
  QStringList paths;
  const QDir dir(folder);
  for (int index : indices) {
    const QString path =
        dir.absoluteFilePath(QString("%1%2.vts").arg(prefix).arg(index));
    auto grid = MakeBoxGrid(nx, ny, nz, index);
    if (WriteGrid(grid, path)) {
      paths << path;
    }
  }
  return paths;
}

bool TouchFile(const QString& path, const QByteArray& contents) {
  QFile file(path);
  if (!file.open(QIODevice::WriteOnly)) {
    return false;
  }
  file.write(contents);
  return true;
}

}  // namespace testing
}  // namespace mdv
