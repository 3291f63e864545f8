#include <QApplication>
#include <QDir>
#include <QFile>
#include <QLineEdit>
#include <QTabWidget>
#include <QTemporaryDir>
#include <QTextEdit>
#include <cassert>
#include <iostream>

#include "cutnavigator.h"
#include "folderbrowser.h"
#include "mainwindow.h"
#include "parser_table.h"
#include "plotmanager.h"
#include "qcustomplot.h"
#include "seriesconfigurator.h"

static QString writeFile(const QTemporaryDir &dir, const QString &name, const QByteArray &content)
{
    const QString path = QDir(dir.path()).filePath(name);
    QFile file(path);
    const bool opened = file.open(QIODevice::WriteOnly);
    assert(opened);
    file.write(content);
    return path;
}

static void test_matrix_load_and_cuts(const QTemporaryDir &dir)
{
    MainWindow window;
    window.setMessageBoxesEnabled(false);

    const QString path = writeFile(dir, QStringLiteral("map.csv"), "y,1,2,3\n10,1,2,3\n20,4,5,6\n");
    window.loadMatrixFile(path);

    assert(window.matrix());
    assert(window.lastMessageTitle().isEmpty());
    assert(window.matrixTitleEdit()->text() == QStringLiteral("map.csv"));
    assert(window.heatmapManager()->colorMap());
    assert(window.heatmapManager()->title() == QStringLiteral("map.csv"));
    assert(window.tabWidget()->currentWidget() == window.matrixTab());

    QCustomPlot *xCutPlot = window.xCutManager()->plot();
    assert(xCutPlot->graphCount() == 1);
    assert(xCutPlot->graph(0)->data()->size() == 3);
    assert(xCutPlot->graph(0)->data()->at(0)->value == 1.0);
    assert(window.xCutPreview()->toPlainText().startsWith(QStringLiteral("Y-Coordinate: 10.00")));
    assert(window.yCutPreview()->toPlainText().startsWith(QStringLiteral("X-Coordinate: 1.00")));

    window.rowCutEdit()->setText(QStringLiteral("1"));
    assert(window.cutNavigator()->rowCutIndex() == 1);
    assert(xCutPlot->graph(0)->data()->at(0)->value == 4.0);
    assert(window.xCutPreview()->toPlainText().startsWith(QStringLiteral("Y-Coordinate: 20.00")));

    window.colorbarLabelEdit()->setText(QStringLiteral("Counts"));
    emit window.colorbarLabelEdit()->editingFinished();
    assert(window.heatmapManager()->colorScale()->axis()->label() == QStringLiteral("Counts"));
    assert(window.cutNavigator()->rowCutIndex() == 1);
    assert(xCutPlot->yAxis->label() == QStringLiteral("Counts"));
}

static void test_matrix_load_failures(const QTemporaryDir &dir)
{
    MainWindow window;
    window.setMessageBoxesEnabled(false);
    window.loadMatrixFile(writeFile(dir, QStringLiteral("map.csv"), "y,1,2\n10,1,2\n"));
    assert(window.matrix());

    window.loadMatrixFile(writeFile(dir, QStringLiteral("map.json"), "{}"));
    assert(window.lastMessageTitle() == QStringLiteral("Unsupported 2D File Type"));
    assert(!window.matrix());
    assert(!window.heatmapManager()->colorMap());
    assert(window.xCutManager()->plot()->graphCount() == 0);
    assert(window.xCutPreview()->toPlainText().isEmpty());
    assert(!window.cutNavigator()->hasMatrix());

    window.loadMatrixFile(writeFile(dir, QStringLiteral("bad.csv"), "1,2,x\n3,4,y\n"));
    assert(window.lastMessageTitle() == QStringLiteral("2D Data Load Error"));
    assert(!window.matrix());
    assert(window.rowCutEdit()->text() == QStringLiteral("0"));

    window.loadMatrixFile(writeFile(dir, QStringLiteral("single.csv"), "1,2,3\n"));
    assert(window.lastMessageTitle() == QStringLiteral("2D Data Format Warning"));
    assert(window.matrix());
    assert(window.matrix()->positionalFallback);
    assert(window.heatmapManager()->colorMap());

    window.loadMatrixFile(writeFile(dir, QStringLiteral("coerced.csv"), "y,a,2\n1,5,6\n2,7,8\n"));
    assert(window.lastMessageTitle() == QStringLiteral("Coordinate Conversion Warning"));
    assert(window.matrix());
}

static void test_table_load(const QTemporaryDir &dir)
{
    MainWindow window;
    window.setMessageBoxesEnabled(false);
    assert(window.seriesConfigurator()->seriesCount() == 1);

    window.loadTableFile(writeFile(dir, QStringLiteral("series.csv"), "x,a,b\n0,1,2\n1,3,4\n"));
    assert(window.table());
    assert(window.tabWidget()->currentWidget() == window.tableTab());
    QCustomPlot *seriesPlot = window.seriesManager()->plot();
    assert(seriesPlot->graphCount() == 1);
    assert(seriesPlot->graph(0)->name() == QStringLiteral("(x vs a)"));
    assert(window.tablePreview()->toPlainText().contains(QStringLiteral("3.00")));

    // QApplication applies the environment locale; decimals still use a point.
    window.loadTableFile(writeFile(dir, QStringLiteral("decimal.csv"), "t,v\n0.5,1.25\n1.5,2.75\n"));
    assert(window.lastMessageTitle().isEmpty());
    assert(seriesPlot->graphCount() == 1);
    assert(seriesPlot->graph(0)->data()->at(1)->key == 1.5);
    assert(seriesPlot->graph(0)->data()->at(1)->value == 2.75);

    window.tableTitleEdit()->setText(QStringLiteral("Sweep"));
    emit window.tableTitleEdit()->editingFinished();
    assert(window.seriesManager()->title() == QStringLiteral("Sweep"));

    window.loadTableFile(writeFile(dir, QStringLiteral("empty.csv"), "x,y\n"));
    assert(window.lastMessageTitle() == QStringLiteral("Empty 1D Data"));
    assert(!window.table());
    assert(window.seriesConfigurator()->seriesCount() == 1);
    assert(seriesPlot->graphCount() == 0);
    assert(window.tablePreview()->toPlainText().isEmpty());

    window.loadTableFile(QDir(dir.path()).filePath(QStringLiteral("missing.csv")));
    assert(window.lastMessageTitle() == QStringLiteral("1D Data Load Error"));
    assert(!window.table());
    assert(window.seriesConfigurator()->specs() == (QVector<SeriesSpec>{SeriesSpec{0, 0, false}}));
}

static void test_browsers_drive_loading(const QTemporaryDir &dir)
{
    MainWindow window;
    window.setMessageBoxesEnabled(false);

    const QString matrixPath = writeFile(dir, QStringLiteral("browse.txt"), "0 1 2\n5 7 8\n6 9 10\n");
    window.matrixBrowser()->setRootFolder(dir.path());
    assert(window.matrixBrowser()->rootFolder() == QDir(dir.path()).absolutePath());
    assert(window.matrixBrowser()->pathEdit()->text() == QDir::toNativeSeparators(QDir(dir.path()).absolutePath()));

    window.matrixBrowser()->activatePath(dir.path());
    assert(!window.matrix());

    window.matrixBrowser()->activatePath(matrixPath);
    assert(window.matrix());
    assert(window.matrix()->rowCount() == 2);

    window.matrixBrowser()->setRootFolder(dir.path());
    assert(!window.matrix());
    assert(!window.heatmapManager()->colorMap());

    const QString tablePath = writeFile(dir, QStringLiteral("browse.dat"), "t v\n0 1\n1 2\n");
    window.tableBrowser()->activatePath(tablePath);
    assert(window.table());
    window.tableBrowser()->setRootFolder(dir.path());
    assert(!window.table());
    assert(window.seriesManager()->plot()->graphCount() == 0);
}

static void test_theme_toggle()
{
    MainWindow window;
    assert(window.theme() == Theme::Light);
    const QString light = window.styleSheet();
    window.setTheme(toggledTheme(window.theme()));
    assert(window.theme() == Theme::Dark);
    assert(!window.styleSheet().isEmpty());
    assert(window.styleSheet() != light);
}

int main(int argc, char **argv)
{
    qputenv("QT_QPA_PLATFORM", QByteArray("offscreen"));
    QApplication app(argc, argv);

    QTemporaryDir dir;
    assert(dir.isValid());

    test_matrix_load_and_cuts(dir);
    test_matrix_load_failures(dir);
    test_table_load(dir);
    test_browsers_drive_loading(dir);
    test_theme_toggle();

    std::cout << "Main window tests passed" << std::endl;
    return 0;
}
