#include <QtTest>

#include <cmath>

#include "mdv/VisualizationConfig.h"

using mdv::VisualizationConfig;

class VisualizationConfigTest : public QObject {
  Q_OBJECT

 private slots:
  void defaults();
  void contour_levels_data();
  void contour_levels();
  void glyph_scale_is_clamped();
  void opacity_slider_mapping();
  void manual_range_needs_ordered_bounds();
  void range_decimals_follow_span();
  void text_color_follows_background();
  void parse_point();
  void variant_map_round_trip();
  void variant_map_rejects_unknown_background();
};

void VisualizationConfigTest::defaults() {
  const VisualizationConfig c;
  QCOMPARE(c.mode, mdv::VisMode::kSurface);
  QCOMPARE(c.color_map, mdv::ColorMap::kCoolWarm);
  QCOMPARE(c.background, QString("Light Gray"));
  QVERIFY(c.auto_range);
  QVERIFY(c.include_boundary);
  QVERIFY(c.show_color_bar);
  QVERIFY(!c.show_axes);
  QCOMPARE(c.opacity, 1.0);
}

void VisualizationConfigTest::contour_levels_data() {
  QTest::addColumn<QString>("text");
  QTest::addColumn<bool>("valid");
  QTest::addColumn<int>("count");

  QTest::newRow("three") << "0.1, 0.5, 0.9" << true << 3;
  QTest::newRow("trailing comma") << "0.5," << true << 1;
  QTest::newRow("scientific") << "1e-3" << true << 1;
  QTest::newRow("letters") << "abc" << false << 0;
  QTest::newRow("mixed") << "0.5, x" << false << 0;
  QTest::newRow("empty") << "" << false << 0;
  QTest::newRow("blank") << "  ,  " << false << 0;
}

void VisualizationConfigTest::contour_levels() {
  QFETCH(QString, text);
  QFETCH(bool, valid);
  QFETCH(int, count);

  const auto levels = mdv::ParseContourLevels(text);
  QCOMPARE(levels.has_value(), valid);
  if (valid) {
    QCOMPARE(static_cast<int>(levels->size()), count);
  }
}

void VisualizationConfigTest::glyph_scale_is_clamped() {
  QCOMPARE(mdv::ParseGlyphScale("2.5"), 2.5);
  QCOMPARE(mdv::ParseGlyphScale("1000"), mdv::kMaxGlyphScale);
  QCOMPARE(mdv::ParseGlyphScale("0"), mdv::kMinGlyphScale);
  QCOMPARE(mdv::ParseGlyphScale("-4"), mdv::kMinGlyphScale);
  QCOMPARE(mdv::ParseGlyphScale("big", 3.0), 3.0);
}

void VisualizationConfigTest::opacity_slider_mapping() {
  QCOMPARE(mdv::OpacityFromSlider(0), 0.0);
  QCOMPARE(mdv::OpacityFromSlider(40), 0.4);
  QCOMPARE(mdv::OpacityFromSlider(250), 1.0);
  QCOMPARE(mdv::SliderFromOpacity(0.37), 37);
  QCOMPARE(mdv::WireframeOpacity(0.0), 0.02);
  QCOMPARE(mdv::WireframeOpacity(1.0), 1.0);
}

void VisualizationConfigTest::manual_range_needs_ordered_bounds() {
  const mdv::ScalarRange data{-1.0, 4.0};
  VisualizationConfig c;
  c.auto_range = false;
  c.range_min = 0.0;
  c.range_max = 2.0;
  auto r = mdv::ResolveScalarRange(c, data);
  QCOMPARE(r.min, 0.0);
  QCOMPARE(r.max, 2.0);

  c.range_min = 3.0;
  r = mdv::ResolveScalarRange(c, data);
  QCOMPARE(r.min, -1.0);
  QCOMPARE(r.max, 4.0);

  c.range_min = 0.0;
  c.auto_range = true;
  r = mdv::ResolveScalarRange(c, data);
  QCOMPARE(r.max, 4.0);
}

void VisualizationConfigTest::range_decimals_follow_span() {
  QCOMPARE(mdv::RangeDecimals({0.0, 1.0}), 6);
  QCOMPARE(mdv::RangeDecimals({1e6, 2e6}), 6);
  QCOMPARE(mdv::RangeDecimals({0.0, 1e-8}), 11);
  QCOMPARE(mdv::RangeDecimals({2e-9, 2e-9}), 12);
  QCOMPARE(mdv::RangeDecimals({0.0, 0.0}), 6);
  QCOMPARE(mdv::RangeDecimals({0.0, 1e-30}), 15);

  // A tiny auto range written to a spin box with these decimals keeps
  // min < max when it becomes the manual range.
  const mdv::ScalarRange tiny{1.0e-8, 3.0e-8};
  const int decimals = mdv::RangeDecimals(tiny);
  const double scale = std::pow(10.0, decimals);
  VisualizationConfig c;
  c.auto_range = false;
  c.range_min = std::round(tiny.min * scale) / scale;
  c.range_max = std::round(tiny.max * scale) / scale;
  const auto r = mdv::ResolveScalarRange(c, {-1.0, 1.0});
  QVERIFY(r.min < r.max);
  QCOMPARE(r.min, c.range_min);
}

void VisualizationConfigTest::text_color_follows_background() {
  for (const auto& name : mdv::BackgroundNames()) {
    const mdv::Rgb bg = mdv::BackgroundColorFromName(name);
    const mdv::Rgb text = mdv::TextColorForBackground(bg);
    const double expected = bg[0] > 0.5 ? 0.0 : 1.0;
    QCOMPARE(text[0], expected);
  }
  QCOMPARE(mdv::BackgroundColorFromName("Unknown")[0], 0.9);
}

void VisualizationConfigTest::parse_point() {
  const auto p = mdv::ParsePoint(" 1, -2.5 ,3e1");
  QVERIFY(p.has_value());
  QCOMPARE((*p)[0], 1.0);
  QCOMPARE((*p)[1], -2.5);
  QCOMPARE((*p)[2], 30.0);
  QVERIFY(!mdv::ParsePoint("1, 2").has_value());
  QVERIFY(!mdv::ParsePoint("1, 2, z").has_value());
  QCOMPARE(mdv::FormatPoint({{1.0, 0.5, -2.0}}),
           QString("1.0000, 0.5000, -2.0000"));
}

void VisualizationConfigTest::variant_map_round_trip() {
  VisualizationConfig c;
  c.field_name = "velocity";
  c.field_kind = mdv::FieldKind::kVector;
  c.mode = mdv::VisMode::kVectorArrows;
  c.color_map = mdv::ColorMap::kPlasma;
  c.clip_axis = mdv::Axis::kZ;
  c.clip_position = 1.25;
  c.contour_levels = "0.2, 0.4";
  c.glyph_color_mode = mdv::GlyphColorMode::kColormap;
  c.glyph_size_mode = mdv::GlyphSizeMode::kUniform;
  c.glyph_scale = 0.5;
  c.glyph_color = {{0.1, 0.2, 0.3}};
  c.opacity = 0.6;
  c.include_boundary = false;
  c.auto_range = false;
  c.range_min = -1.0;
  c.range_max = 1.0;
  c.show_axes = true;
  c.show_bounds = true;
  c.show_color_bar = false;
  c.background = "Black";

  const VisualizationConfig back =
      mdv::ConfigFromVariantMap(mdv::ConfigToVariantMap(c));
  QCOMPARE(back.field_name, c.field_name);
  QCOMPARE(back.field_kind, c.field_kind);
  QCOMPARE(back.mode, c.mode);
  QCOMPARE(back.color_map, c.color_map);
  QCOMPARE(back.clip_axis, c.clip_axis);
  QCOMPARE(back.clip_position, c.clip_position);
  QCOMPARE(back.contour_levels, c.contour_levels);
  QCOMPARE(back.glyph_color_mode, c.glyph_color_mode);
  QCOMPARE(back.glyph_size_mode, c.glyph_size_mode);
  QCOMPARE(back.glyph_scale, c.glyph_scale);
  QCOMPARE(back.glyph_color[2], 0.3);
  QCOMPARE(back.opacity, c.opacity);
  QCOMPARE(back.include_boundary, false);
  QCOMPARE(back.auto_range, false);
  QCOMPARE(back.range_min, -1.0);
  QCOMPARE(back.show_axes, true);
  QCOMPARE(back.show_color_bar, false);
  QCOMPARE(back.background, QString("Black"));
}

void VisualizationConfigTest::variant_map_rejects_unknown_background() {
  QVariantMap map;
  map.insert("background", "Purple");
  map.insert("glyph_scale", 500.0);
  const VisualizationConfig c = mdv::ConfigFromVariantMap(map);
  QCOMPARE(c.background, QString("Light Gray"));
  QCOMPARE(c.glyph_scale, mdv::kMaxGlyphScale);
}

QTEST_GUILESS_MAIN(VisualizationConfigTest)
#include "tst_visualization_config.moc"
