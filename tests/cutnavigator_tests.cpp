#include <QApplication>
#include <QLineEdit>
#include <QString>
#include <cassert>
#include <cmath>
#include <iostream>

#include "cutnavigator.h"
#include "parser_table.h"

static dv::MatrixData makeMatrix()
{
    dv::MatrixData matrix;
    matrix.values.resize(4, 3);
    matrix.values << 1, 2, 3,
                     4, 5, 6,
                     7, 8, 9,
                     10, 11, 12;
    matrix.xCoords.resize(3);
    matrix.xCoords << 1, 2, 3;
    matrix.yCoords.resize(4);
    matrix.yCoords << 10, 20, 30, 40;
    return matrix;
}

struct SignalCounter
{
    int changed = 0;
    int cleared = 0;
    int warnings = 0;
    QString lastTitle;
    QString lastMessage;

    void attach(CutNavigator &navigator)
    {
        QObject::connect(&navigator, &CutNavigator::slicesChanged, [this]() { ++changed; });
        QObject::connect(&navigator, &CutNavigator::slicesCleared, [this]() { ++cleared; });
        QObject::connect(&navigator, &CutNavigator::warningRaised,
                         [this](const QString &title, const QString &message) {
                             ++warnings;
                             lastTitle = title;
                             lastMessage = message;
                         });
    }
};

static void test_x_cut_follows_row_cursor()
{
    dv::MatrixData matrix = makeMatrix();
    QLineEdit rowEdit;
    QLineEdit columnEdit;
    CutNavigator navigator(&rowEdit, &columnEdit);
    navigator.setMatrix(&matrix);

    assert(navigator.setRowCut(QStringLiteral("2")) == CutNavigator::Status::Accepted);
    assert(navigator.rowCutIndex() == 2);
    assert(rowEdit.text() == QStringLiteral("2"));

    const CutSlice &xCut = navigator.xCut();
    assert(xCut.coordinates == (QVector<double>{1, 2, 3}));
    assert(xCut.values == (QVector<double>{7, 8, 9}));
    assert(xCut.fixedCoordinate == 30.0);
    assert(xCut.title.endsWith(QStringLiteral("30.00")));

    assert(navigator.setColumnCut(QStringLiteral("1")) == CutNavigator::Status::Accepted);
    const CutSlice &yCut = navigator.yCut();
    assert(yCut.coordinates == (QVector<double>{10, 20, 30, 40}));
    assert(yCut.values == (QVector<double>{2, 5, 8, 11}));
    assert(yCut.title == QStringLiteral("Y-Cut at X-coord 2.00"));
}

static void test_same_index_recomputes_once()
{
    dv::MatrixData matrix = makeMatrix();
    QLineEdit rowEdit;
    QLineEdit columnEdit;
    CutNavigator navigator(&rowEdit, &columnEdit);
    navigator.setMatrix(&matrix);

    SignalCounter counter;
    counter.attach(navigator);

    assert(navigator.setRowCut(QStringLiteral("1")) == CutNavigator::Status::Accepted);
    assert(navigator.setRowCut(QStringLiteral("1")) == CutNavigator::Status::Unchanged);
    assert(counter.changed == 1);
    assert(counter.warnings == 0);
}

static void test_out_of_range_reverts_field()
{
    dv::MatrixData matrix = makeMatrix();
    QLineEdit rowEdit;
    QLineEdit columnEdit;
    CutNavigator navigator(&rowEdit, &columnEdit);
    navigator.setMatrix(&matrix);
    navigator.setRowCut(QStringLiteral("1"));

    SignalCounter counter;
    counter.attach(navigator);

    assert(navigator.setRowCut(QStringLiteral("7")) == CutNavigator::Status::RangeError);
    assert(navigator.rowCutIndex() == 1);
    assert(rowEdit.text() == QStringLiteral("1"));
    assert(counter.changed == 0);
    assert(counter.warnings == 1);
    assert(counter.lastTitle == QStringLiteral("Invalid Y-Index"));
    assert(counter.lastMessage == QStringLiteral("Y-Index must be between 0 and 3."));

    assert(navigator.setColumnCut(QStringLiteral("-1")) == CutNavigator::Status::RangeError);
    assert(counter.lastTitle == QStringLiteral("Invalid X-Index"));
    assert(counter.lastMessage == QStringLiteral("X-Index must be between 0 and 2."));
    assert(columnEdit.text() == QStringLiteral("0"));
}

static void test_non_integer_input()
{
    dv::MatrixData matrix = makeMatrix();
    QLineEdit rowEdit;
    QLineEdit columnEdit;
    CutNavigator navigator(&rowEdit, &columnEdit);
    navigator.setMatrix(&matrix);

    SignalCounter counter;
    counter.attach(navigator);

    assert(navigator.setColumnCut(QStringLiteral("1.5")) == CutNavigator::Status::ParseError);
    assert(navigator.columnCutIndex() == 0);
    assert(columnEdit.text() == QStringLiteral("0"));
    assert(counter.lastTitle == QStringLiteral("Invalid Input"));
    assert(counter.lastMessage == QStringLiteral("Please enter a valid integer."));
}

static void test_typing_drives_cursor()
{
    dv::MatrixData matrix = makeMatrix();
    QLineEdit rowEdit;
    QLineEdit columnEdit;
    CutNavigator navigator(&rowEdit, &columnEdit);
    navigator.setMatrix(&matrix);

    SignalCounter counter;
    counter.attach(navigator);

    rowEdit.setText(QStringLiteral("3"));
    assert(navigator.rowCutIndex() == 3);
    assert(counter.changed == 1);

    rowEdit.setText(QString());
    assert(navigator.rowCutIndex() == 3);
    assert(counter.warnings == 0);

    columnEdit.setText(QStringLiteral("2"));
    assert(navigator.columnCutIndex() == 2);
    assert(counter.changed == 2);
}

static void test_navigate_clamps()
{
    dv::MatrixData matrix = makeMatrix();
    QLineEdit rowEdit;
    QLineEdit columnEdit;
    CutNavigator navigator(&rowEdit, &columnEdit);
    navigator.setMatrix(&matrix);

    SignalCounter counter;
    counter.attach(navigator);

    navigator.navigate(CutNavigator::Axis::Row, 1);
    navigator.navigate(CutNavigator::Axis::Row, 1);
    navigator.navigate(CutNavigator::Axis::Row, 1);
    assert(navigator.rowCutIndex() == 3);
    navigator.navigate(CutNavigator::Axis::Row, 1);
    assert(navigator.rowCutIndex() == 3);
    assert(rowEdit.text() == QStringLiteral("3"));
    assert(counter.changed == 4);

    navigator.navigate(CutNavigator::Axis::Column, -1);
    assert(navigator.columnCutIndex() == 0);
    assert(columnEdit.text() == QStringLiteral("0"));
    assert(counter.warnings == 0);
}

static void test_clear_resets_without_warning()
{
    dv::MatrixData matrix = makeMatrix();
    QLineEdit rowEdit;
    QLineEdit columnEdit;
    CutNavigator navigator(&rowEdit, &columnEdit);
    navigator.setMatrix(&matrix);
    navigator.setRowCut(QStringLiteral("2"));
    navigator.setColumnCut(QStringLiteral("2"));

    SignalCounter counter;
    counter.attach(navigator);

    navigator.clear();
    assert(!navigator.hasMatrix());
    assert(navigator.rowCutIndex() == 0);
    assert(navigator.columnCutIndex() == 0);
    assert(rowEdit.text() == QStringLiteral("0"));
    assert(columnEdit.text() == QStringLiteral("0"));
    assert(counter.cleared == 1);
    assert(counter.warnings == 0);
    assert(navigator.xCut().values.isEmpty());

    assert(navigator.setRowCut(QStringLiteral("1")) == CutNavigator::Status::NoData);
    navigator.navigate(CutNavigator::Axis::Row, 1);
    assert(navigator.rowCutIndex() == 0);
    assert(counter.warnings == 0);
}

static void test_new_matrix_resets_cursors()
{
    dv::MatrixData matrix = makeMatrix();
    QLineEdit rowEdit;
    QLineEdit columnEdit;
    CutNavigator navigator(&rowEdit, &columnEdit);
    navigator.setMatrix(&matrix);
    navigator.setRowCut(QStringLiteral("3"));

    dv::MatrixData other = makeMatrix();
    navigator.setMatrix(&other);
    assert(navigator.rowCutIndex() == 0);
    assert(rowEdit.text() == QStringLiteral("0"));
    assert(navigator.xCut().values == (QVector<double>{1, 2, 3}));
}

static void test_nan_coordinate_title()
{
    dv::MatrixData matrix = makeMatrix();
    matrix.yCoords[0] = std::nan("");
    QLineEdit rowEdit;
    QLineEdit columnEdit;
    CutNavigator navigator(&rowEdit, &columnEdit);
    navigator.setMatrix(&matrix);
    assert(navigator.xCut().title == QStringLiteral("X-Cut at Y-coord NaN"));
}

int main(int argc, char **argv)
{
    qputenv("QT_QPA_PLATFORM", QByteArray("offscreen"));
    QApplication app(argc, argv);

    test_x_cut_follows_row_cursor();
    test_same_index_recomputes_once();
    test_out_of_range_reverts_field();
    test_non_integer_input();
    test_typing_drives_cursor();
    test_navigate_clamps();
    test_clear_resets_without_warning();
    test_new_matrix_resets_cursors();
    test_nan_coordinate_title();

    std::cout << "Cut navigator tests passed" << std::endl;
    return 0;
}
