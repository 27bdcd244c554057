#include <QApplication>
#include <QCommandLineParser>
#include <QString>
#include <QSurfaceFormat>
#include <QTimer>

#include <QVTKOpenGLNativeWidget.h>

#include "mdv/Log.h"
#include "mdv/MainWindow.h"

int main(int argc, char** argv) {
  QSurfaceFormat::setDefaultFormat(QVTKOpenGLNativeWidget::defaultFormat());
  QApplication app(argc, argv);
  QApplication::setApplicationName("mdv_viewer");
  QApplication::setOrganizationName("mindes");
  mdv::InstallMessagePattern();

  QCommandLineParser parser;
  parser.setApplicationDescription("Viewer for MInDes .vts output series");
  parser.addHelpOption();
  parser.addPositionalArgument("folder", "Output folder to open.",
                               "[folder]");
  const QCommandLineOption prefix_option(
      "prefix", "Series prefix to open without asking.", "prefix");
  const QCommandLineOption session_option(
      "session", "Session file to restore.", "file");
  parser.addOption(prefix_option);
  parser.addOption(session_option);
  parser.process(app);

  mdv::MainWindow window;
  window.show();

  const QString session = parser.value(session_option);
  const QStringList positional = parser.positionalArguments();
  const QString prefix = parser.value(prefix_option);
  QTimer::singleShot(0, &window, [&window, session, positional, prefix]() {
    if (!session.isEmpty()) {
      window.load_session(session);
    } else if (!positional.isEmpty()) {
      window.open_folder(positional.front(), prefix);
    }
  });
  return app.exec();
}
