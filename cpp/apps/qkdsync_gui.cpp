#include "qkdsync/ui/MainWindow.h"
#include <QApplication>
#include <QByteArray>
#include <QCommandLineParser>
#include <QProcessEnvironment>
#include <iostream>

int main(int argc, char **argv) {
#ifndef Q_OS_WIN
  // Allow headless runs without X/Wayland: set QKDSYNC_HEADLESS=1 or unset DISPLAY.
  auto env = QProcessEnvironment::systemEnvironment();
  if (env.contains("QKDSYNC_HEADLESS") ||
      (!env.contains("DISPLAY") && !env.contains("WAYLAND_DISPLAY"))) {
    qputenv("QT_QPA_PLATFORM", QByteArray("offscreen"));
  }
#endif
  QApplication app(argc, argv);
  QApplication::setApplicationName("qkdsync_gui");

  QCommandLineParser parser;
  parser.setApplicationDescription("qkdsync interactive link simulation");
  parser.addHelpOption();
  QCommandLineOption configOpt({"c", "config"},
                               "JSON parameter file (default: app config dir)",
                               "file");
  QCommandLineOption runOpt("run", "Run one simulation at startup.");
  parser.addOption(configOpt);
  parser.addOption(runOpt);
  parser.process(app);

  qkdsync::ui::MainWindow w;
  if (parser.isSet(configOpt))
    w.setConfigFile(parser.value(configOpt));
  w.loadConfig();
  w.show();
  if (parser.isSet(runOpt))
    QMetaObject::invokeMethod(&w, "runOnce", Qt::QueuedConnection);

  const int rc = app.exec();
  std::cerr << "[qkdsync_gui] exit code " << rc << "\n";
  return rc;
}
