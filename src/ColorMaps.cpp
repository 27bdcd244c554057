#include "mdv/ColorMaps.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include <vtkLookupTable.h>
#include <vtkMath.h>

#include "mdv/Log.h"

namespace mdv {

namespace {

const std::vector<Rgb>& ViridisStops() {
  static const std::vector<Rgb> stops = {
      {0.267, 0.005, 0.329}, {0.282, 0.140, 0.450}, {0.251, 0.280, 0.528},
      {0.200, 0.410, 0.538}, {0.151, 0.520, 0.520}, {0.122, 0.610, 0.470},
      {0.208, 0.690, 0.388}, {0.380, 0.750, 0.280}, {0.600, 0.800, 0.150},
      {0.993, 0.906, 0.145}};
  return stops;
}

const std::vector<Rgb>& PlasmaStops() {
  static const std::vector<Rgb> stops = {
      {0.050, 0.030, 0.500}, {0.150, 0.080, 0.600}, {0.300, 0.120, 0.650},
      {0.500, 0.200, 0.600}, {0.700, 0.300, 0.500}, {0.850, 0.450, 0.350},
      {0.950, 0.700, 0.200}, {0.990, 0.900, 0.150}};
  return stops;
}

Rgb Lerp(const Rgb& a, const Rgb& b, double f) {
  return {a[0] + (b[0] - a[0]) * f, a[1] + (b[1] - a[1]) * f,
          a[2] + (b[2] - a[2]) * f};
}

Rgb Interpolate(const std::vector<Rgb>& stops, double t) {
  const int n = static_cast<int>(stops.size());
  const double scaled = t * (n - 1);
  const int idx = std::min(static_cast<int>(scaled), n - 2);
  return Lerp(stops[idx], stops[idx + 1], scaled - idx);
}

Rgb CoolWarm(double t) {
  static const Rgb kBlue = {0x3b / 255.0, 0x4c / 255.0, 0xc0 / 255.0};
  static const Rgb kGray = {0xdd / 255.0, 0xdd / 255.0, 0xdd / 255.0};
  static const Rgb kRed = {0xb4 / 255.0, 0x04 / 255.0, 0x26 / 255.0};
  if (t <= 0.5) {
    return Lerp(kBlue, kGray, t * 2.0);
  }
  return Lerp(kGray, kRed, (t - 0.5) * 2.0);
}

}  // namespace

QStringList ColorMapNames() {
  return {"Cool-Warm", "Rainbow", "Grayscale", "Viridis", "Plasma"};
}

QString ColorMapName(ColorMap map) {
  switch (map) {
    case ColorMap::kRainbow:
      return "Rainbow";
    case ColorMap::kGrayscale:
      return "Grayscale";
    case ColorMap::kViridis:
      return "Viridis";
    case ColorMap::kPlasma:
      return "Plasma";
    case ColorMap::kCoolWarm:
    default:
      return "Cool-Warm";
  }
}

ColorMap ColorMapFromName(const QString& name) {
  if (name == "Rainbow") {
    return ColorMap::kRainbow;
  }
  if (name == "Grayscale") {
    return ColorMap::kGrayscale;
  }
  if (name == "Viridis") {
    return ColorMap::kViridis;
  }
  if (name == "Plasma") {
    return ColorMap::kPlasma;
  }
  return ColorMap::kCoolWarm;
}

Rgb ColorAt(ColorMap map, double t) {
  t = std::clamp(t, 0.0, 1.0);
  switch (map) {
    case ColorMap::kViridis:
      return Interpolate(ViridisStops(), t);
    case ColorMap::kPlasma:
      return Interpolate(PlasmaStops(), t);
    case ColorMap::kRainbow: {
      double rgb[3] = {0, 0, 0};
      vtkMath::HSVToRGB(0.667 * t, 1.0, 1.0, rgb, rgb + 1, rgb + 2);
      return {rgb[0], rgb[1], rgb[2]};
    }
    case ColorMap::kGrayscale:
      return {t, t, t};
    case ColorMap::kCoolWarm:
    default:
      return CoolWarm(t);
  }
}

void FillLookupTable(vtkLookupTable* lut, ColorMap map, double min,
                     double max) {
  if (!lut) {
    return;
  }
  lut->SetNumberOfTableValues(kLookupTableSize);
  lut->SetRange(min, max);
  if (map == ColorMap::kRainbow) {
    lut->SetHueRange(0.0, 0.667);
    lut->SetSaturationRange(1.0, 1.0);
    lut->SetValueRange(1.0, 1.0);
    lut->ForceBuild();
  } else if (map == ColorMap::kGrayscale) {
    lut->SetHueRange(0.0, 0.0);
    lut->SetSaturationRange(0.0, 0.0);
    lut->SetValueRange(0.0, 1.0);
    lut->ForceBuild();
  } else {
    lut->Build();
    for (int i = 0; i < kLookupTableSize; ++i) {
      const double t = static_cast<double>(i) / (kLookupTableSize - 1);
      const Rgb c = ColorAt(map, t);
      lut->SetTableValue(i, c[0], c[1], c[2], 1.0);
    }
  }
  lut->Modified();
}

LookupTableCache::LookupTableCache()
    : lut_(vtkSmartPointer<vtkLookupTable>::New()) {}

bool LookupTableCache::update(ColorMap map, double min, double max) {
  if (valid_ && map == map_ && min == min_ && max == max_) {
    return false;
  }
  FillLookupTable(lut_, map, min, max);
  map_ = map;
  min_ = min;
  max_ = max;
  valid_ = true;
  ++build_count_;
  qCDebug(lcRender) << "lookup table" << ColorMapName(map) << min << max;
  return true;
}

}  // namespace mdv
