#include <QApplication>
#include <QCheckBox>
#include <QLayoutItem>
#include <QLineEdit>
#include <QVBoxLayout>
#include <QWidget>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "parser_table.h"
#include "seriesconfigurator.h"

static dv::TableData makeTable(int columns)
{
    dv::TableData table;
    table.values.resize(3, columns);
    for (int c = 0; c < columns; ++c) {
        table.columnNames.push_back(c == 0 ? std::string("x") : "c" + std::to_string(c));
        for (int r = 0; r < 3; ++r)
            table.values(r, c) = r * 10.0 + c;
    }
    return table;
}

struct Recorder
{
    int plotted = 0;
    int cleared = 0;
    QStringList warnings;
    QStringList information;

    void attach(SeriesConfigurator &configurator)
    {
        QObject::connect(&configurator, &SeriesConfigurator::seriesPlotted, [this]() { ++plotted; });
        QObject::connect(&configurator, &SeriesConfigurator::seriesCleared, [this]() { ++cleared; });
        QObject::connect(&configurator, &SeriesConfigurator::warningRaised,
                         [this](const QString &title, const QString &) { warnings.append(title); });
        QObject::connect(&configurator, &SeriesConfigurator::informationRaised,
                         [this](const QString &title, const QString &) { information.append(title); });
    }
};

static void test_default_series()
{
    SeriesConfigurator configurator;

    dv::TableData two = makeTable(2);
    configurator.setTable(&two);
    assert(configurator.specs() == (QVector<SeriesSpec>{SeriesSpec{0, 1, false}}));

    dv::TableData five = makeTable(5);
    configurator.setTable(&five);
    assert(configurator.specs() == (QVector<SeriesSpec>{SeriesSpec{0, 1, false}, SeriesSpec{0, 3, true}}));
    assert(configurator.plottedSeries().size() == 2);
    assert(configurator.plottedSeries().at(1).secondaryAxis);

    dv::TableData one = makeTable(1);
    configurator.setTable(&one);
    assert(configurator.specs() == (QVector<SeriesSpec>{SeriesSpec{0, 0, false}}));

    configurator.setTable(nullptr);
    assert(configurator.specs() == (QVector<SeriesSpec>{SeriesSpec{0, 1, false}, SeriesSpec{0, 3, true}}));
    assert(configurator.plottedSeries().isEmpty());
}

static void test_add_then_remove_restores_list()
{
    dv::TableData table = makeTable(3);
    SeriesConfigurator configurator;
    configurator.setTable(&table);
    const QVector<SeriesSpec> before = configurator.specs();

    Recorder recorder;
    recorder.attach(configurator);

    configurator.addSeries();
    assert(configurator.seriesCount() == before.size() + 1);
    assert(configurator.specs().last() == (SeriesSpec{0, 0, false}));
    assert(recorder.plotted == 1);

    assert(configurator.removeLastSeries() == SeriesConfigurator::Status::Ok);
    assert(configurator.specs() == before);
    assert(recorder.plotted == 2);
}

static void test_add_without_table_does_not_recompute()
{
    SeriesConfigurator configurator;
    Recorder recorder;
    recorder.attach(configurator);

    configurator.addSeries(1, 2, true);
    assert(configurator.seriesCount() == 1);
    assert(configurator.specs().first() == (SeriesSpec{1, 2, true}));
    assert(recorder.plotted == 0);
    assert(recorder.cleared == 0);
}

static void test_remove_from_empty_list()
{
    SeriesConfigurator configurator;
    Recorder recorder;
    recorder.attach(configurator);

    assert(configurator.removeLastSeries() == SeriesConfigurator::Status::EmptyListError);
    assert(recorder.information == QStringList{QStringLiteral("No Series to Remove")});
}

static void test_out_of_range_series_is_skipped()
{
    dv::TableData table = makeTable(3);
    SeriesConfigurator configurator;
    configurator.setTable(&table);
    configurator.addSeries(0, 2, false);
    assert(configurator.plottedSeries().size() == 2);

    Recorder recorder;
    recorder.attach(configurator);

    configurator.setSeries(0, SeriesSpec{0, 3, false});
    assert(configurator.plottedSeries().size() == 1);
    assert(configurator.plottedSeries().first().colorSlot == 1);
    assert(configurator.plottedSeries().first().label == QStringLiteral("(x vs c2)"));
    assert(configurator.skippedSeries().size() == 1);
    assert(configurator.skippedSeries().first().contains(QStringLiteral("Max index is 2")));
    assert(recorder.plotted == 1);
    assert(recorder.warnings == QStringList{QStringLiteral("Series Skipped")});
    assert(recorder.information.isEmpty());
}

static void test_non_integer_and_empty_series()
{
    dv::TableData table = makeTable(2);
    table.values(0, 1) = std::numeric_limits<double>::quiet_NaN();
    table.values(1, 1) = std::numeric_limits<double>::quiet_NaN();
    table.values(2, 1) = std::numeric_limits<double>::quiet_NaN();

    SeriesConfigurator configurator;
    Recorder recorder;
    recorder.attach(configurator);
    configurator.setTable(&table);

    assert(configurator.recomputeAll() == SeriesConfigurator::Status::NoPlottableSeries);
    assert(configurator.skippedSeries().first().contains(QStringLiteral("No valid numeric data points")));
    assert(recorder.information.contains(QStringLiteral("No Plottable Series")));
    assert(recorder.cleared >= 1);

    configurator.setSeries(0, SeriesSpec{std::nullopt, 0, false});
    assert(configurator.skippedSeries().first().contains(QStringLiteral("valid integer")));
    assert(configurator.previewText().isEmpty());
}

static void test_nan_points_are_dropped()
{
    dv::TableData table = makeTable(2);
    table.values(1, 1) = std::numeric_limits<double>::quiet_NaN();

    SeriesConfigurator configurator;
    configurator.setTable(&table);
    const PlotSeries &series = configurator.plottedSeries().first();
    assert(series.x == (QVector<double>{0.0, 20.0}));
    assert(series.y == (QVector<double>{1.0, 21.0}));
    assert(configurator.previewText().startsWith(QStringLiteral("    x     c1")));
}

static void test_preview_keeps_first_column_occurrence()
{
    dv::TableData table = makeTable(3);
    table.values(1, 2) = std::numeric_limits<double>::quiet_NaN();

    SeriesConfigurator configurator;
    configurator.setTable(&table);
    configurator.setSeries(0, SeriesSpec{0, 2, false});
    configurator.addSeries(0, 1, false);
    assert(configurator.plottedSeries().size() == 2);

    // The shared x column comes from the first series, which lost row 1.
    const QStringList lines = configurator.previewText().split(QLatin1Char('\n'));
    assert(lines.size() == 4);
    assert(lines.at(0) == QStringLiteral("    x     c2     c1"));
    assert(lines.at(1) == QStringLiteral(" 0.00   2.00   1.00"));
    assert(lines.at(2) == QStringLiteral("20.00  22.00  11.00"));
    assert(lines.at(3) == QStringLiteral("  NaN    NaN  21.00"));
}

static void test_no_table()
{
    SeriesConfigurator configurator;
    Recorder recorder;
    recorder.attach(configurator);
    assert(configurator.recomputeAll() == SeriesConfigurator::Status::NoData);
    assert(recorder.cleared == 1);
    assert(recorder.warnings.isEmpty());
    assert(recorder.information.isEmpty());
}

static QLineEdit *rowEdit(QVBoxLayout *layout, int row, int which)
{
    QWidget *frame = layout->itemAt(row)->widget();
    const QList<QLineEdit *> edits = frame->findChildren<QLineEdit *>();
    return edits.at(which);
}

static void test_rows_follow_series_list()
{
    QWidget container;
    auto *layout = new QVBoxLayout(&container);
    dv::TableData table = makeTable(4);

    SeriesConfigurator configurator(layout);
    configurator.setTable(&table);
    assert(layout->count() == 2);
    assert(rowEdit(layout, 1, 1)->text() == QStringLiteral("3"));
    QCheckBox *secondary = layout->itemAt(1)->widget()->findChild<QCheckBox *>();
    assert(secondary && secondary->isChecked());

    configurator.addSeries();
    assert(layout->count() == 3);
    configurator.removeLastSeries();
    configurator.removeLastSeries();
    assert(layout->count() == 1);

    QLineEdit *yEdit = rowEdit(layout, 0, 1);
    yEdit->setText(QStringLiteral("2"));
    emit yEdit->editingFinished();
    assert(configurator.specs().first() == (SeriesSpec{0, 2, false}));
    assert(configurator.plottedSeries().first().label == QStringLiteral("(x vs c2)"));

    yEdit->setText(QStringLiteral("two"));
    emit yEdit->editingFinished();
    assert(!configurator.specs().first().yColumn.has_value());
    assert(configurator.plottedSeries().isEmpty());

    configurator.setSeries(0, SeriesSpec{0, 1, true});
    assert(yEdit->text() == QStringLiteral("1"));
    assert(layout->itemAt(0)->widget()->findChild<QCheckBox *>()->isChecked());
}

int main(int argc, char **argv)
{
    qputenv("QT_QPA_PLATFORM", QByteArray("offscreen"));
    QApplication app(argc, argv);

    test_default_series();
    test_add_then_remove_restores_list();
    test_add_without_table_does_not_recompute();
    test_remove_from_empty_list();
    test_out_of_range_series_is_skipped();
    test_non_integer_and_empty_series();
    test_nan_points_are_dropped();
    test_preview_keeps_first_column_occurrence();
    test_no_table();
    test_rows_follow_series_list();

    std::cout << "Series configurator tests passed" << std::endl;
    return 0;
}
