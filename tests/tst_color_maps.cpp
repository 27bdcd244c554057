#include <QtTest>

#include <cmath>

#include <vtkLookupTable.h>
#include <vtkSmartPointer.h>

#include "mdv/ColorMaps.h"

using mdv::ColorMap;
using mdv::Rgb;

namespace {

bool Near(const Rgb& a, const Rgb& b, double tol = 1e-3) {
  for (int i = 0; i < 3; ++i) {
    if (std::abs(a[i] - b[i]) > tol) {
      return false;
    }
  }
  return true;
}

}  // namespace

class ColorMapsTest : public QObject {
  Q_OBJECT

 private slots:
  void names_round_trip();
  void unknown_name_is_cool_warm();
  void cool_warm_end_points();
  void rainbow_runs_red_to_blue();
  void grayscale_is_linear();
  void color_at_clamps_input();
  void lookup_table_matches_color_at();
  void cache_rebuilds_only_on_change();
};

void ColorMapsTest::names_round_trip() {
  const QStringList names = mdv::ColorMapNames();
  QCOMPARE(names.size(), 5);
  QCOMPARE(names.front(), QString("Cool-Warm"));
  for (const auto& name : names) {
    QCOMPARE(mdv::ColorMapName(mdv::ColorMapFromName(name)), name);
  }
}

void ColorMapsTest::unknown_name_is_cool_warm() {
  QCOMPARE(mdv::ColorMapFromName("Jet"), ColorMap::kCoolWarm);
}

void ColorMapsTest::cool_warm_end_points() {
  QVERIFY(Near(mdv::ColorAt(ColorMap::kCoolWarm, 0.0),
               {0x3b / 255.0, 0x4c / 255.0, 0xc0 / 255.0}));
  QVERIFY(Near(mdv::ColorAt(ColorMap::kCoolWarm, 0.5),
               {0xdd / 255.0, 0xdd / 255.0, 0xdd / 255.0}));
  QVERIFY(Near(mdv::ColorAt(ColorMap::kCoolWarm, 1.0),
               {0xb4 / 255.0, 0x04 / 255.0, 0x26 / 255.0}));
}

void ColorMapsTest::rainbow_runs_red_to_blue() {
  const Rgb low = mdv::ColorAt(ColorMap::kRainbow, 0.0);
  const Rgb high = mdv::ColorAt(ColorMap::kRainbow, 1.0);
  QVERIFY(Near(low, {1.0, 0.0, 0.0}));
  QVERIFY(high[2] > 0.99);
  QVERIFY(high[0] < 0.01);
}

void ColorMapsTest::grayscale_is_linear() {
  QVERIFY(Near(mdv::ColorAt(ColorMap::kGrayscale, 0.25), {0.25, 0.25, 0.25}));
}

void ColorMapsTest::color_at_clamps_input() {
  QVERIFY(Near(mdv::ColorAt(ColorMap::kViridis, -3.0),
               mdv::ColorAt(ColorMap::kViridis, 0.0)));
  QVERIFY(Near(mdv::ColorAt(ColorMap::kPlasma, 7.0),
               mdv::ColorAt(ColorMap::kPlasma, 1.0)));
}

void ColorMapsTest::lookup_table_matches_color_at() {
  for (const auto& name : mdv::ColorMapNames()) {
    const ColorMap map = mdv::ColorMapFromName(name);
    auto lut = vtkSmartPointer<vtkLookupTable>::New();
    mdv::FillLookupTable(lut, map, -2.0, 3.0);
    QCOMPARE(lut->GetNumberOfTableValues(), vtkIdType(mdv::kLookupTableSize));
    const double* range = lut->GetRange();
    QCOMPARE(range[0], -2.0);
    QCOMPARE(range[1], 3.0);

    double rgba[4];
    lut->GetTableValue(0, rgba);
    QVERIFY2(Near({rgba[0], rgba[1], rgba[2]}, mdv::ColorAt(map, 0.0), 0.01),
             qPrintable(name));
    lut->GetTableValue(mdv::kLookupTableSize - 1, rgba);
    QVERIFY2(Near({rgba[0], rgba[1], rgba[2]}, mdv::ColorAt(map, 1.0), 0.01),
             qPrintable(name));
  }
}

void ColorMapsTest::cache_rebuilds_only_on_change() {
  mdv::LookupTableCache cache;
  QVERIFY(cache.update(ColorMap::kViridis, 0.0, 1.0));
  QVERIFY(!cache.update(ColorMap::kViridis, 0.0, 1.0));
  QCOMPARE(cache.build_count(), 1);
  QVERIFY(cache.update(ColorMap::kViridis, 0.0, 2.0));
  QVERIFY(cache.update(ColorMap::kPlasma, 0.0, 2.0));
  QCOMPARE(cache.build_count(), 3);
  cache.invalidate();
  QVERIFY(cache.update(ColorMap::kPlasma, 0.0, 2.0));
  QCOMPARE(cache.table()->GetRange()[1], 2.0);
}

QTEST_GUILESS_MAIN(ColorMapsTest)
#include "tst_color_maps.moc"
