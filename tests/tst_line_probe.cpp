#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtTest>

#include <algorithm>
#include <cmath>
#include <memory>

#include "TestGrids.h"
#include "mdv/GridFrame.h"
#include "mdv/LineProbe.h"

namespace {

mdv::GridFramePtr MakeFrame() {
  return std::make_shared<mdv::GridFrame>(
      "probe_3.vts", mdv::testing::MakeBoxGrid(4, 4, 4));
}

}  // namespace

class LineProbeTest : public QObject {
  Q_OBJECT

 private slots:
  void default_line_is_bounds_diagonal();
  void samples_scalars_and_vector_components();
  void default_resolution_gives_101_rows();
  void zero_length_line_is_empty();
  void null_frame_is_empty();
  void workbook_round_trip();
  void workbook_suffix_is_added();
  void non_workbook_is_rejected();
  void empty_table_is_not_exported();
  void control_characters_are_stripped();
};

void LineProbeTest::default_line_is_bounds_diagonal() {
  const auto line = mdv::DefaultProbeLine(*MakeFrame());
  QCOMPARE(line.first[0], 0.0);
  QCOMPARE(line.first[2], 0.0);
  QCOMPARE(line.second[0], 3.0);
  QCOMPARE(line.second[1], 3.0);
  QCOMPARE(line.second[2], 3.0);
}

void LineProbeTest::samples_scalars_and_vector_components() {
  const auto result = mdv::SampleLine(MakeFrame(), {{0.0, 1.0, 1.0}},
                                      {{3.0, 1.0, 1.0}}, 3);
  QCOMPARE(result.rows(), 4);
  QCOMPARE(result.source, QString("probe_3.vts"));
  QCOMPARE(result.column_names(),
           QStringList({"arc_length", "conc", "phi", "velocity_X",
                        "velocity_Y", "velocity_Z", "velocity_Magnitude"}));

  const auto* arc = result.column("arc_length");
  QVERIFY(arc);
  QCOMPARE(arc->values.front(), 0.0);
  QCOMPARE(arc->values.back(), 3.0);

  const auto* phi = result.column("phi");
  QVERIFY(phi);
  for (int i = 0; i < 4; ++i) {
    QCOMPARE(phi->values[i] + 1.0, i + 1.0);
  }
  const auto* conc = result.column("conc");
  QCOMPARE(conc->values[2], 1.0);
  const auto* mag = result.column("velocity_Magnitude");
  QVERIFY(mag);
  QCOMPARE(mag->values[1], 3.0);
  QCOMPARE(result.column("velocity_Y")->values[0], 2.0);
}

void LineProbeTest::default_resolution_gives_101_rows() {
  const auto frame = MakeFrame();
  const auto line = mdv::DefaultProbeLine(*frame);
  const auto result = mdv::SampleLine(frame, line.first, line.second);
  QCOMPARE(result.rows(), mdv::kDefaultProbeResolution + 1);
}

void LineProbeTest::zero_length_line_is_empty() {
  const mdv::Point3 p{{1.0, 1.0, 1.0}};
  const auto result = mdv::SampleLine(MakeFrame(), p, p);
  QVERIFY(result.empty());
  QCOMPARE(result.column_count(), 0);
}

void LineProbeTest::null_frame_is_empty() {
  const auto result =
      mdv::SampleLine(nullptr, {{0.0, 0.0, 0.0}}, {{1.0, 1.0, 1.0}});
  QVERIFY(result.empty());
}

void LineProbeTest::workbook_round_trip() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const auto result = mdv::SampleLine(MakeFrame(), {{0.0, 0.0, 0.0}},
                                      {{3.0, 3.0, 3.0}}, 10);
  const QString path = QDir(dir.path()).filePath("line.xlsx");
  QString error;
  QVERIFY2(mdv::WriteProbeTable(result, path, &error), qPrintable(error));
  QVERIFY(QFileInfo(path).size() > 0);

  const auto back = mdv::ReadProbeTable(path, &error);
  QVERIFY2(back.has_value(), qPrintable(error));
  QCOMPARE(back->source, QString("line.xlsx"));
  QCOMPARE(back->column_names(), result.column_names());
  QCOMPARE(back->rows(), result.rows());
  for (int c = 0; c < result.column_count(); ++c) {
    for (int r = 0; r < result.rows(); ++r) {
      const double expected = result.columns[c].values[r];
      const double actual = back->columns[c].values[r];
      QVERIFY2(std::abs(actual - expected) <=
                   1e-12 * std::max(1.0, std::abs(expected)),
               qPrintable(QString("%1 row %2: %3 != %4")
                              .arg(result.columns[c].name)
                              .arg(r)
                              .arg(actual)
                              .arg(expected)));
    }
  }
}

void LineProbeTest::workbook_suffix_is_added() {
  QCOMPARE(mdv::ProbeTablePath("/tmp/line"), QString("/tmp/line.xlsx"));
  QCOMPARE(mdv::ProbeTablePath("/tmp/line.XLSX"), QString("/tmp/line.XLSX"));
  QCOMPARE(mdv::ProbeTablePath("/tmp/line.csv"),
           QString("/tmp/line.csv.xlsx"));
}

void LineProbeTest::non_workbook_is_rejected() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = QDir(dir.path()).filePath("plain.xlsx");
  QVERIFY(mdv::testing::TouchFile(path, "arc_length,phi\n0,1\n"));
  QString error;
  QVERIFY(!mdv::ReadProbeTable(path, &error).has_value());
  QVERIFY(!error.isEmpty());
  QVERIFY(!mdv::ReadProbeTable(QDir(dir.path()).filePath("missing.xlsx"))
               .has_value());
}

void LineProbeTest::empty_table_is_not_exported() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = QDir(dir.path()).filePath("empty.xlsx");
  QString error;
  QVERIFY(!mdv::WriteProbeTable(mdv::LineProbeResult(), path, &error));
  QVERIFY(!error.isEmpty());
  QVERIFY(!QFile::exists(path));
}

void LineProbeTest::control_characters_are_stripped() {
  QCOMPARE(mdv::CleanSpreadsheetText(QString("phi\x01\x1f_a\tb")),
           QString("phi_a\tb"));
}

QTEST_GUILESS_MAIN(LineProbeTest)
#include "tst_line_probe.moc"
