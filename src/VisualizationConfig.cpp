#include "mdv/VisualizationConfig.h"

#include <QVariantList>

#include <algorithm>
#include <cmath>

namespace mdv {

QStringList VisModeNames() {
  return {"Surface", "Surface with Grid", "Clip", "Contour", "Vector Arrows"};
}

QString VisModeName(VisMode mode) {
  switch (mode) {
    case VisMode::kSurfaceWithGrid:
      return "Surface with Grid";
    case VisMode::kClip:
      return "Clip";
    case VisMode::kContour:
      return "Contour";
    case VisMode::kVectorArrows:
      return "Vector Arrows";
    case VisMode::kSurface:
    default:
      return "Surface";
  }
}

VisMode VisModeFromName(const QString& name) {
  const int idx = VisModeNames().indexOf(name);
  if (idx < 0) {
    return VisMode::kSurface;
  }
  return static_cast<VisMode>(idx);
}

QString AxisName(Axis axis) {
  switch (axis) {
    case Axis::kY:
      return "Y";
    case Axis::kZ:
      return "Z";
    case Axis::kX:
    default:
      return "X";
  }
}

Axis AxisFromName(const QString& name) {
  const QString upper = name.trimmed().toUpper();
  if (upper == "Y") {
    return Axis::kY;
  }
  if (upper == "Z") {
    return Axis::kZ;
  }
  return Axis::kX;
}

QStringList BackgroundNames() {
  return {"White", "Light Gray", "Gray", "Dark Gray", "Black"};
}

Rgb BackgroundColorFromName(const QString& name) {
  double level = 0.9;
  if (name == "White") {
    level = 1.0;
  } else if (name == "Gray") {
    level = 0.5;
  } else if (name == "Dark Gray") {
    level = 0.2;
  } else if (name == "Black") {
    level = 0.0;
  }
  return {level, level, level};
}

Rgb TextColorForBackground(const Rgb& bg) {
  const double luminance = (bg[0] * 299 + bg[1] * 587 + bg[2] * 114) / 1000.0;
  if (luminance > 0.5) {
    return {0.0, 0.0, 0.0};
  }
  return {1.0, 1.0, 1.0};
}

std::optional<std::vector<double>> ParseContourLevels(const QString& text) {
  std::vector<double> levels;
  const QStringList parts = text.split(',', Qt::SkipEmptyParts);
  for (const auto& part : parts) {
    const QString trimmed = part.trimmed();
    if (trimmed.isEmpty()) {
      continue;
    }
    bool ok = false;
    const double v = trimmed.toDouble(&ok);
    if (!ok) {
      return std::nullopt;
    }
    levels.push_back(v);
  }
  if (levels.empty()) {
    return std::nullopt;
  }
  return levels;
}

double ClampGlyphScale(double scale) {
  return std::clamp(scale, kMinGlyphScale, kMaxGlyphScale);
}

double ParseGlyphScale(const QString& text, double fallback) {
  bool ok = false;
  const double v = text.trimmed().toDouble(&ok);
  if (!ok) {
    return ClampGlyphScale(fallback);
  }
  return ClampGlyphScale(v);
}

double OpacityFromSlider(int value) {
  return std::clamp(value, 0, 100) / 100.0;
}

int SliderFromOpacity(double opacity) {
  return static_cast<int>(std::clamp(opacity, 0.0, 1.0) * 100.0 + 0.5);
}

double WireframeOpacity(double opacity) {
  return std::min(1.0, std::max(0.02, opacity * 1.2));
}

ScalarRange ResolveScalarRange(const VisualizationConfig& config,
                               const ScalarRange& data) {
  if (config.auto_range || config.range_min >= config.range_max) {
    return data;
  }
  return {config.range_min, config.range_max};
}

int RangeDecimals(const ScalarRange& range) {
  double scale = std::abs(range.max - range.min);
  if (!std::isfinite(scale) || scale <= 0.0) {
    scale = std::max(std::abs(range.min), std::abs(range.max));
  }
  if (!std::isfinite(scale) || scale <= 0.0) {
    return 6;
  }
  const int needed = 3 - static_cast<int>(std::floor(std::log10(scale)));
  return std::clamp(needed, 6, 15);
}

std::optional<std::array<double, 3>> ParsePoint(const QString& text) {
  const QStringList parts = text.split(',');
  if (parts.size() != 3) {
    return std::nullopt;
  }
  std::array<double, 3> p{{0, 0, 0}};
  for (int i = 0; i < 3; ++i) {
    bool ok = false;
    p[i] = parts[i].trimmed().toDouble(&ok);
    if (!ok) {
      return std::nullopt;
    }
  }
  return p;
}

QString FormatPoint(const std::array<double, 3>& p, int decimals) {
  return QString("%1, %2, %3")
      .arg(p[0], 0, 'f', decimals)
      .arg(p[1], 0, 'f', decimals)
      .arg(p[2], 0, 'f', decimals);
}

QVariantMap ConfigToVariantMap(const VisualizationConfig& c) {
  QVariantMap map;
  map.insert("field", c.field_name);
  map.insert("field_vector", c.field_kind == FieldKind::kVector);
  map.insert("mode", VisModeName(c.mode));
  map.insert("color_map", ColorMapName(c.color_map));
  map.insert("clip_axis", AxisName(c.clip_axis));
  map.insert("clip_position", c.clip_position);
  map.insert("contour_levels", c.contour_levels);
  map.insert("glyph_color_mode",
             c.glyph_color_mode == GlyphColorMode::kColormap ? "Colormap"
                                                             : "Single Color");
  map.insert("glyph_size_mode",
             c.glyph_size_mode == GlyphSizeMode::kUniform ? "Uniform"
                                                          : "Magnitude");
  map.insert("glyph_scale", c.glyph_scale);
  map.insert("glyph_color", QVariantList{c.glyph_color[0], c.glyph_color[1],
                                         c.glyph_color[2]});
  map.insert("opacity", c.opacity);
  map.insert("include_boundary", c.include_boundary);
  map.insert("auto_range", c.auto_range);
  map.insert("range_min", c.range_min);
  map.insert("range_max", c.range_max);
  map.insert("show_axes", c.show_axes);
  map.insert("show_bounds", c.show_bounds);
  map.insert("show_color_bar", c.show_color_bar);
  map.insert("background", c.background);
  return map;
}

VisualizationConfig ConfigFromVariantMap(const QVariantMap& map) {
  VisualizationConfig c;
  c.field_name = map.value("field", c.field_name).toString();
  c.field_kind = map.value("field_vector", false).toBool() ? FieldKind::kVector
                                                           : FieldKind::kScalar;
  c.mode = VisModeFromName(map.value("mode", VisModeName(c.mode)).toString());
  c.color_map = ColorMapFromName(
      map.value("color_map", ColorMapName(c.color_map)).toString());
  c.clip_axis =
      AxisFromName(map.value("clip_axis", AxisName(c.clip_axis)).toString());
  c.clip_position = map.value("clip_position", c.clip_position).toDouble();
  c.contour_levels = map.value("contour_levels", c.contour_levels).toString();
  c.glyph_color_mode = map.value("glyph_color_mode").toString() == "Colormap"
                           ? GlyphColorMode::kColormap
                           : GlyphColorMode::kSingleColor;
  c.glyph_size_mode = map.value("glyph_size_mode").toString() == "Uniform"
                          ? GlyphSizeMode::kUniform
                          : GlyphSizeMode::kMagnitude;
  c.glyph_scale =
      ClampGlyphScale(map.value("glyph_scale", c.glyph_scale).toDouble());
  const QVariantList color = map.value("glyph_color").toList();
  if (color.size() == 3) {
    for (int i = 0; i < 3; ++i) {
      c.glyph_color[i] = std::clamp(color[i].toDouble(), 0.0, 1.0);
    }
  }
  c.opacity = std::clamp(map.value("opacity", c.opacity).toDouble(), 0.0, 1.0);
  c.include_boundary =
      map.value("include_boundary", c.include_boundary).toBool();
  c.auto_range = map.value("auto_range", c.auto_range).toBool();
  c.range_min = map.value("range_min", c.range_min).toDouble();
  c.range_max = map.value("range_max", c.range_max).toDouble();
  c.show_axes = map.value("show_axes", c.show_axes).toBool();
  c.show_bounds = map.value("show_bounds", c.show_bounds).toBool();
  c.show_color_bar = map.value("show_color_bar", c.show_color_bar).toBool();
  c.background = map.value("background", c.background).toString();
  if (!BackgroundNames().contains(c.background)) {
    c.background = "Light Gray";
  }
  return c;
}

}  // namespace mdv
