#include <QApplication>

#include "MainWindow.hpp"

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  MainWindow w;
  w.show();
  if (argc > 1) {
    w.loadParamsFile(QString::fromLocal8Bit(argv[1]));
  }
  return app.exec();
}
