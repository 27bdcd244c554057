#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtTest>

#include "TestGrids.h"
#include "mdv/Errors.h"
#include "mdv/SeriesResolver.h"

using mdv::testing::TouchFile;

class SeriesResolverTest : public QObject {
  Q_OBJECT

 private slots:
  void prefix_strips_trailing_digits_data();
  void prefix_strips_trailing_digits();
  void index_reads_digits_after_prefix();
  void discover_returns_sorted_unique_prefixes();
  void discover_empty_folder_throws();
  void resolve_orders_numerically_and_unindexed_last();
  void resolve_unknown_prefix_throws();
  void refresh_keeps_current_file();
  void refresh_reports_vanished_series();
};

void SeriesResolverTest::prefix_strips_trailing_digits_data() {
  QTest::addColumn<QString>("file_name");
  QTest::addColumn<QString>("prefix");
  QTest::addColumn<bool>("valid");

  QTest::newRow("padded") << "phi_000120.vts" << "phi_" << true;
  QTest::newRow("plain") << "step10.vts" << "step" << true;
  QTest::newRow("inner digits") << "run2_t15.vts" << "run2_t" << true;
  QTest::newRow("all digits") << "000120.vts" << "000120" << true;
  QTest::newRow("no digits") << "final.vts" << "final" << true;
  QTest::newRow("other extension") << "step10.vtu" << "" << false;
  QTest::newRow("bare extension") << ".vts" << "" << false;
}

void SeriesResolverTest::prefix_strips_trailing_digits() {
  QFETCH(QString, file_name);
  QFETCH(QString, prefix);
  QFETCH(bool, valid);

  const auto result = mdv::ExtractSeriesPrefix(file_name);
  QCOMPARE(result.has_value(), valid);
  if (valid) {
    QCOMPARE(*result, prefix);
  }
}

void SeriesResolverTest::index_reads_digits_after_prefix() {
  QCOMPARE(mdv::ExtractSeriesIndex("step0010.vts", "step").value(), 10ULL);
  QCOMPARE(mdv::ExtractSeriesIndex("run2_t15.vts", "run2_t").value(), 15ULL);
  QVERIFY(!mdv::ExtractSeriesIndex("stepABC.vts", "step").has_value());
}

void SeriesResolverTest::discover_returns_sorted_unique_prefixes() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  for (const char* name : {"phi_2.vts", "phi_10.vts", "conc1.vts",
                           "conc2.vts", "notes.txt"}) {
    QVERIFY(TouchFile(dir.filePath(name)));
  }
  const QStringList prefixes = mdv::DiscoverSeriesPrefixes(dir.path());
  QCOMPARE(prefixes, QStringList({"conc", "phi_"}));
}

void SeriesResolverTest::discover_empty_folder_throws() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  QVERIFY(TouchFile(dir.filePath("readme.txt")));
  QVERIFY_THROWS_EXCEPTION(mdv::NoFilesFound,
                           mdv::DiscoverSeriesPrefixes(dir.path()));
}

void SeriesResolverTest::resolve_orders_numerically_and_unindexed_last() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  QVERIFY(TouchFile(dir.filePath("stepABC.vts")));
  for (int i = 9; i >= 0; --i) {
    QVERIFY(TouchFile(dir.filePath(QString("step%1.vts").arg(i))));
  }
  QVERIFY(TouchFile(dir.filePath("step10.vts")));
  QVERIFY(TouchFile(dir.filePath("other3.vts")));

  const mdv::SeriesDescriptor series = mdv::ResolveSeries(dir.path(), "step");
  QCOMPARE(series.size(), 12);
  QCOMPARE(series.prefix, QString("step"));
  for (int i = 0; i <= 10; ++i) {
    QCOMPARE(QFileInfo(series.files[i]).fileName(),
             QString("step%1.vts").arg(i));
  }
  QCOMPARE(QFileInfo(series.files.last()).fileName(), QString("stepABC.vts"));
  QVERIFY(QFileInfo(series.files.front()).isAbsolute());
  QCOMPARE(series.index_of("step7.vts"), 7);
  QCOMPARE(series.index_of("missing.vts"), -1);
}

void SeriesResolverTest::resolve_unknown_prefix_throws() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  QVERIFY(TouchFile(dir.filePath("phi1.vts")));
  QVERIFY_THROWS_EXCEPTION(mdv::NoFilesFound,
                           mdv::ResolveSeries(dir.path(), "conc"));
}

void SeriesResolverTest::refresh_keeps_current_file() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  for (int i : {2, 4, 6}) {
    QVERIFY(TouchFile(dir.filePath(QString("t%1.vts").arg(i))));
  }
  mdv::SeriesDescriptor series = mdv::ResolveSeries(dir.path(), "t");
  QCOMPARE(series.size(), 3);

  // t4 is current; a new earlier file shifts it one slot down.
  QVERIFY(TouchFile(dir.filePath("t1.vts")));
  QVERIFY(TouchFile(dir.filePath("t8.vts")));
  QCOMPARE(mdv::RefreshSeries(series, 1), 2);
  QCOMPARE(series.size(), 5);

  // Current file removed: the old index survives while in range.
  QVERIFY(QFile::remove(dir.filePath("t4.vts")));
  QCOMPARE(mdv::RefreshSeries(series, 2), 2);
  QCOMPARE(series.size(), 4);
}

void SeriesResolverTest::refresh_reports_vanished_series() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  QVERIFY(TouchFile(dir.filePath("t1.vts")));
  mdv::SeriesDescriptor series = mdv::ResolveSeries(dir.path(), "t");
  QVERIFY(QFile::remove(dir.filePath("t1.vts")));
  QCOMPARE(mdv::RefreshSeries(series, 0), -1);
  QVERIFY(series.empty());
}

QTEST_GUILESS_MAIN(SeriesResolverTest)
#include "tst_series_resolver.moc"
