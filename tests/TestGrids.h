#pragma once

#include <QString>
#include <QByteArray>
#include <QList>
#include <QStringList>

#include <vtkSmartPointer.h>

class vtkStructuredGrid;

namespace mdv {
namespace testing {

// Box grid with spacing 1 starting at the origin. Point data:
//   "phi"      scalar, x + offset
//   "conc"     scalar, y
//   "velocity" vector, (1, 2, 2) * (1 + offset)
vtkSmartPointer<vtkStructuredGrid> MakeBoxGrid(int nx, int ny, int nz,
                                               double offset = 0.0);

// Writes `grid` as a VTK XML structured grid file.
bool WriteGrid(vtkStructuredGrid* grid, const QString& path);

// Writes <prefix><index>.vts into `folder` for each index, with offset
// equal to the index. Returns the written paths in index order.
QStringList WriteSeries(const QString& folder, const QString& prefix,
                        const QList<int>& indices, int nx = 4, int ny = 4,
                        int nz = 4);

// Creates an empty file, for name-only tests.
bool TouchFile(const QString& path, const QByteArray& contents = {});

}  // namespace testing
}  // namespace mdv
