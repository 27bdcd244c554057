#pragma once

#include <QString>
#include <QStringList>

#include <array>

#include <vtkSmartPointer.h>

class vtkLookupTable;

namespace mdv {

enum class ColorMap { kCoolWarm, kRainbow, kGrayscale, kViridis, kPlasma };

constexpr int kLookupTableSize = 256;

QStringList ColorMapNames();
QString ColorMapName(ColorMap map);
// Unknown names map to Cool-Warm.
ColorMap ColorMapFromName(const QString& name);

using Rgb = std::array<double, 3>;

// Color at t in [0, 1]. Rainbow and Grayscale follow the HSV ramps that
// FillLookupTable builds.
Rgb ColorAt(ColorMap map, double t);

// Fills `lut` with kLookupTableSize entries and sets its range.
void FillLookupTable(vtkLookupTable* lut, ColorMap map, double min,
                     double max);

// Keeps one lookup table and rebuilds it only when the map or the scalar
// range changes.
class LookupTableCache {
 public:
  LookupTableCache();

  // Returns true if the table was rebuilt.
  bool update(ColorMap map, double min, double max);
  vtkLookupTable* table() const { return lut_; }
  int build_count() const { return build_count_; }
  void invalidate() { valid_ = false; }

 private:
  vtkSmartPointer<vtkLookupTable> lut_;
  ColorMap map_ = ColorMap::kCoolWarm;
  double min_ = 0.0;
  double max_ = 1.0;
  bool valid_ = false;
  int build_count_ = 0;
};

}  // namespace mdv
