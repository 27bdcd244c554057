#pragma once

#include <QString>
#include <QStringList>
#include <QVariantMap>

#include <array>
#include <optional>
#include <vector>

#include "mdv/ColorMaps.h"
#include "mdv/GridFrame.h"

namespace mdv {

enum class VisMode {
  kSurface,
  kSurfaceWithGrid,
  kClip,
  kContour,
  kVectorArrows
};

enum class Axis { kX = 0, kY = 1, kZ = 2 };

enum class GlyphColorMode { kSingleColor, kColormap };
enum class GlyphSizeMode { kMagnitude, kUniform };

constexpr double kMinGlyphScale = 0.001;
constexpr double kMaxGlyphScale = 100.0;

struct ScalarRange {
  double min = 0.0;
  double max = 1.0;
};

// Everything the render pipeline reads on a redraw. Owned by the viewer.
struct VisualizationConfig {
  QString field_name;
  FieldKind field_kind = FieldKind::kScalar;

  VisMode mode = VisMode::kSurface;
  ColorMap color_map = ColorMap::kCoolWarm;

  Axis clip_axis = Axis::kX;
  double clip_position = 0.0;

  QString contour_levels;

  GlyphColorMode glyph_color_mode = GlyphColorMode::kSingleColor;
  GlyphSizeMode glyph_size_mode = GlyphSizeMode::kMagnitude;
  double glyph_scale = 1.0;
  Rgb glyph_color{{1.0, 1.0, 1.0}};

  double opacity = 1.0;
  bool include_boundary = true;

  bool auto_range = true;
  double range_min = 0.0;
  double range_max = 1.0;

  bool show_axes = false;
  bool show_bounds = false;
  bool show_color_bar = true;

  QString background = "Light Gray";
};

QStringList VisModeNames();
QString VisModeName(VisMode mode);
VisMode VisModeFromName(const QString& name);

QString AxisName(Axis axis);
Axis AxisFromName(const QString& name);

QStringList BackgroundNames();
// Gray level of a named background; unknown names give Light Gray.
Rgb BackgroundColorFromName(const QString& name);
// Black text on light backgrounds, white on dark ones.
Rgb TextColorForBackground(const Rgb& background);

// Comma-separated contour values. nullopt when any entry is not a number
// or the text holds no value at all.
std::optional<std::vector<double>> ParseContourLevels(const QString& text);

// Parses the glyph scale text, clamped to [kMinGlyphScale, kMaxGlyphScale].
// Unparseable text gives `fallback`.
double ParseGlyphScale(const QString& text, double fallback = 1.0);
double ClampGlyphScale(double scale);

// Slider 0..100 to opacity 0.0..1.0.
double OpacityFromSlider(int value);
int SliderFromOpacity(double opacity);
double WireframeOpacity(double opacity);

// Manual range unless auto or min >= max, in which case `data` is used.
ScalarRange ResolveScalarRange(const VisualizationConfig& config,
                               const ScalarRange& data);
// Decimals for range spin boxes: at least 6, more when the span needs them
// to keep four significant digits.
int RangeDecimals(const ScalarRange& range);

// "x, y, z" -> point. nullopt unless exactly three numbers are given.
std::optional<std::array<double, 3>> ParsePoint(const QString& text);
QString FormatPoint(const std::array<double, 3>& p, int decimals = 4);

QVariantMap ConfigToVariantMap(const VisualizationConfig& config);
// Keys missing from `map` keep the defaults.
VisualizationConfig ConfigFromVariantMap(const QVariantMap& map);

}  // namespace mdv
