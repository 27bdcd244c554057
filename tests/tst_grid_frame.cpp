#include <QDir>
#include <QTemporaryDir>
#include <QtTest>

#include <vtkDoubleArray.h>
#include <vtkPointData.h>
#include <vtkStructuredGrid.h>

#include "TestGrids.h"
#include "mdv/Errors.h"
#include "mdv/GridFrame.h"

class GridFrameTest : public QObject {
  Q_OBJECT

 private slots:
  void loads_structured_grid();
  void fields_are_classified_and_sorted();
  void missing_file_throws();
  void malformed_file_throws();
  void display_names();
};

void GridFrameTest::loads_structured_grid() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = QDir(dir.path()).filePath("phi_7.vts");
  QVERIFY(mdv::testing::WriteGrid(mdv::testing::MakeBoxGrid(5, 4, 3), path));

  const mdv::GridFramePtr frame = mdv::LoadGridFrame(path);
  QVERIFY(frame);
  QCOMPARE(frame->path(), path);
  QCOMPARE(frame->file_name(), QString("phi_7.vts"));
  QCOMPARE(frame->point_count(), 60LL);
  QCOMPARE(frame->dimensions()[0], 5);
  QCOMPARE(frame->dimensions()[1], 4);
  QCOMPARE(frame->dimensions()[2], 3);
  QCOMPARE(frame->bounds()[1], 4.0);
  QCOMPARE(frame->bounds()[3], 3.0);
  QCOMPARE(frame->bounds()[5], 2.0);
}

void GridFrameTest::fields_are_classified_and_sorted() {
  auto grid = mdv::testing::MakeBoxGrid(2, 2, 2);
  auto tensor = vtkSmartPointer<vtkDoubleArray>::New();
  tensor->SetName("stress");
  tensor->SetNumberOfComponents(9);
  tensor->SetNumberOfTuples(grid->GetNumberOfPoints());
  tensor->Fill(0.0);
  grid->GetPointData()->AddArray(tensor);

  const mdv::GridFrame frame("memory.vts", grid);
  const auto& fields = frame.fields();
  QCOMPARE(static_cast<int>(fields.size()), 3);
  QCOMPARE(fields[0].name, QString("conc"));
  QCOMPARE(fields[1].name, QString("phi"));
  QCOMPARE(fields[2].name, QString("velocity"));
  QCOMPARE(fields[2].kind, mdv::FieldKind::kVector);
  QCOMPARE(fields[2].components, 3);
  QVERIFY(frame.has_field("phi"));
  QVERIFY(!frame.has_field("stress"));
  QVERIFY(frame.find_field("missing") == nullptr);
}

void GridFrameTest::missing_file_throws() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = QDir(dir.path()).filePath("absent.vts");
  try {
    mdv::LoadGridFrame(path);
    QFAIL("expected LoadError");
  } catch (const mdv::LoadError& e) {
    QCOMPARE(e.path(), path);
  }
}

void GridFrameTest::malformed_file_throws() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = QDir(dir.path()).filePath("broken.vts");
  QVERIFY(mdv::testing::TouchFile(path, "<VTKFile type=\"StructuredGrid\">"));
  QVERIFY_THROWS_EXCEPTION(mdv::LoadError, mdv::LoadGridFrame(path));
}

void GridFrameTest::display_names() {
  mdv::FieldInfo scalar{"phi", 1, mdv::FieldKind::kScalar};
  mdv::FieldInfo vector{"velocity", 3, mdv::FieldKind::kVector};
  QCOMPARE(scalar.display_name(), QString("[S] phi"));
  QCOMPARE(vector.display_name(), QString("[V] velocity"));
}

QTEST_GUILESS_MAIN(GridFrameTest)
#include "tst_grid_frame.moc"
