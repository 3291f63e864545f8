#include "mainwindow.h"

#include <QApplication>
#include <QFont>
#include <QGuiApplication>
#include <QRect>
#include <QScreen>

#include <iostream>

int main(int argc, char *argv[])
{
    std::cout << "dashview start" << std::endl;

    QApplication app(argc, argv);
    QApplication::setFont(QFont(QStringLiteral("Segoe UI"), 10));

    MainWindow window;
    if (QScreen *screen = QGuiApplication::primaryScreen()) {
        const QRect available = screen->geometry();
        window.setGeometry(available.x() + available.width() / 10,
                           available.y() + available.height() / 10,
                           available.width() * 8 / 10,
                           available.height() * 8 / 10);
    }
    window.show();

    return app.exec();
}
