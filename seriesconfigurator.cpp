#include "seriesconfigurator.h"
#include "parser_table.h"
#include "textpreview.h"

#include <QCheckBox>
#include <QDebug>
#include <QFrame>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QSignalBlocker>
#include <QVBoxLayout>

#include <cmath>

namespace {

std::optional<int> parseColumn(const QString &text)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok)
        return std::nullopt;
    return value;
}

QString columnText(const std::optional<int> &column)
{
    return column ? QString::number(*column) : QString();
}

} // namespace

SeriesConfigurator::SeriesConfigurator(QVBoxLayout *rowLayout, QObject *parent)
    : QObject(parent)
    , m_rowLayout(rowLayout)
    , m_table(nullptr)
{
}

SeriesConfigurator::~SeriesConfigurator() = default;

void SeriesConfigurator::setTable(const dv::TableData *table)
{
    m_table = table;
    clearAllSeries();

    if (!m_table)
    {
        // Folder re-selection: both defaults, to be checked once a table loads.
        m_specs.append(SeriesSpec{0, 1, false});
        m_specs.append(SeriesSpec{0, 3, true});
    }
    else
    {
        const Eigen::Index columnCount = m_table->columnCount();
        if (columnCount >= 2)
            m_specs.append(SeriesSpec{0, 1, false});
        if (columnCount >= 4)
            m_specs.append(SeriesSpec{0, 3, true});
        if (m_specs.isEmpty() && columnCount > 0)
            m_specs.append(SeriesSpec{0, 0, false});
    }

    syncRows();
    recomputeAll();
}

void SeriesConfigurator::clearTable()
{
    m_table = nullptr;
    m_skipped.clear();
    clearOutputs();
    emit seriesCleared();
}

const dv::TableData *SeriesConfigurator::table() const
{
    return m_table;
}

void SeriesConfigurator::addSeries(int defaultX, int defaultY, bool defaultUseSecondaryAxis)
{
    m_specs.append(SeriesSpec{defaultX, defaultY, defaultUseSecondaryAxis});
    syncRows();
    if (m_table)
        recomputeAll();
}

SeriesConfigurator::Status SeriesConfigurator::removeLastSeries()
{
    if (m_specs.isEmpty())
    {
        emit informationRaised(tr("No Series to Remove"), tr("There are no plot series to remove."));
        return Status::EmptyListError;
    }

    m_specs.removeLast();
    syncRows();
    recomputeAll();
    return Status::Ok;
}

void SeriesConfigurator::clearAllSeries()
{
    m_specs.clear();
    syncRows();
}

void SeriesConfigurator::setSeries(int index, const SeriesSpec &spec)
{
    if (index < 0 || index >= m_specs.size())
        return;

    m_specs[index] = spec;
    writeRow(index);
    recomputeAll();
}

SeriesConfigurator::Status SeriesConfigurator::recomputeAll()
{
    m_skipped.clear();

    if (!m_table)
    {
        clearOutputs();
        emit seriesCleared();
        return Status::NoData;
    }

    m_plotted.clear();
    QStringList previewHeaders;
    QVector<QVector<double>> previewColumns;

    const int columnCount = static_cast<int>(m_table->columnCount());
    const Eigen::Index rowCount = m_table->rowCount();

    auto columnName = [this](int column) {
        if (column < static_cast<int>(m_table->columnNames.size()))
            return QString::fromStdString(m_table->columnNames[static_cast<std::size_t>(column)]);
        return QStringLiteral("Column %1").arg(column);
    };

    for (int i = 0; i < m_specs.size(); ++i)
    {
        const SeriesSpec &spec = m_specs.at(i);
        const QString prefix = tr("Series %1").arg(i + 1);

        if (!spec.xColumn || !spec.yColumn)
        {
            m_skipped.append(tr("%1: Please enter valid integer numbers for column indices.").arg(prefix));
            continue;
        }
        const int xColumn = *spec.xColumn;
        const int yColumn = *spec.yColumn;
        if (xColumn < 0 || xColumn >= columnCount)
        {
            m_skipped.append(tr("%1: X Column Index %2 is out of bounds. Max index is %3.")
                             .arg(prefix).arg(xColumn).arg(columnCount - 1));
            continue;
        }
        if (yColumn < 0 || yColumn >= columnCount)
        {
            m_skipped.append(tr("%1: Y Column Index %2 is out of bounds. Max index is %3.")
                             .arg(prefix).arg(yColumn).arg(columnCount - 1));
            continue;
        }

        PlotSeries series;
        series.x.reserve(static_cast<int>(rowCount));
        series.y.reserve(static_cast<int>(rowCount));
        for (Eigen::Index r = 0; r < rowCount; ++r)
        {
            const double x = m_table->values(r, xColumn);
            const double y = m_table->values(r, yColumn);
            if (std::isnan(x) || std::isnan(y))
                continue;
            series.x.append(x);
            series.y.append(y);
        }

        if (series.x.isEmpty())
        {
            m_skipped.append(tr("%1: No valid numeric data points found for the selected columns to plot.").arg(prefix));
            continue;
        }

        const QString xName = columnName(xColumn);
        const QString yName = columnName(yColumn);
        series.label = QStringLiteral("(%1 vs %2)").arg(xName, yName);
        series.secondaryAxis = spec.useSecondaryAxis;
        series.colorSlot = i;

        if (!previewHeaders.contains(xName))
        {
            previewHeaders.append(xName);
            previewColumns.append(series.x);
        }
        if (!previewHeaders.contains(yName))
        {
            previewHeaders.append(yName);
            previewColumns.append(series.y);
        }

        m_plotted.append(series);
    }

    for (const QString &message : qAsConst(m_skipped))
        qWarning().noquote() << "Skipping" << message;

    Status status = Status::Ok;
    if (m_plotted.isEmpty())
    {
        clearOutputs();
        emit seriesCleared();
        status = Status::NoPlottableSeries;
    }
    else
    {
        m_previewText = formatColumns(previewHeaders, previewColumns);
        emit seriesPlotted();
    }

    if (!m_skipped.isEmpty())
        emit warningRaised(tr("Series Skipped"), m_skipped.join(QLatin1Char('\n')));
    if (status == Status::NoPlottableSeries)
        emit informationRaised(tr("No Plottable Series"), tr("No valid series configured or found to plot."));

    return status;
}

const QVector<SeriesSpec> &SeriesConfigurator::specs() const
{
    return m_specs;
}

int SeriesConfigurator::seriesCount() const
{
    return m_specs.size();
}

const QVector<PlotSeries> &SeriesConfigurator::plottedSeries() const
{
    return m_plotted;
}

const QString &SeriesConfigurator::previewText() const
{
    return m_previewText;
}

const QStringList &SeriesConfigurator::skippedSeries() const
{
    return m_skipped;
}

void SeriesConfigurator::syncRows()
{
    if (!m_rowLayout)
        return;

    while (m_rows.size() > m_specs.size())
        destroyRow(m_rows.takeLast());

    while (m_rows.size() < m_specs.size())
    {
        m_rows.append(createRow(m_rows.size()));
        writeRow(m_rows.size() - 1);
    }
}

SeriesConfigurator::RowWidgets SeriesConfigurator::createRow(int index)
{
    RowWidgets row;
    row.frame = new QFrame(m_rowLayout->parentWidget());
    row.frame->setFrameShape(QFrame::StyledPanel);
    row.frame->setFrameShadow(QFrame::Raised);

    auto *layout = new QHBoxLayout(row.frame);
    layout->addWidget(new QLabel(tr("Series %1:").arg(index + 1), row.frame));

    layout->addWidget(new QLabel(tr("X:"), row.frame));
    row.xEdit = new QLineEdit(row.frame);
    layout->addWidget(row.xEdit);

    layout->addWidget(new QLabel(tr("Y:"), row.frame));
    row.yEdit = new QLineEdit(row.frame);
    layout->addWidget(row.yEdit);

    row.secondaryCheck = new QCheckBox(tr("Twinx"), row.frame);
    layout->addWidget(row.secondaryCheck);

    connect(row.xEdit, &QLineEdit::editingFinished, this, [this, index]() { onRowEdited(index); });
    connect(row.yEdit, &QLineEdit::editingFinished, this, [this, index]() { onRowEdited(index); });
    connect(row.secondaryCheck, &QCheckBox::toggled, this, [this, index]() { onRowEdited(index); });

    m_rowLayout->addWidget(row.frame);
    return row;
}

void SeriesConfigurator::destroyRow(const RowWidgets &row)
{
    // Detach first: a focused edit emits editingFinished while it is torn down.
    disconnect(row.xEdit, nullptr, this, nullptr);
    disconnect(row.yEdit, nullptr, this, nullptr);
    disconnect(row.secondaryCheck, nullptr, this, nullptr);
    m_rowLayout->removeWidget(row.frame);
    row.frame->hide();
    row.frame->deleteLater();
}

void SeriesConfigurator::writeRow(int index)
{
    if (index < 0 || index >= m_rows.size())
        return;

    const SeriesSpec &spec = m_specs.at(index);
    const RowWidgets &row = m_rows.at(index);
    {
        QSignalBlocker blocker(row.xEdit);
        row.xEdit->setText(columnText(spec.xColumn));
    }
    {
        QSignalBlocker blocker(row.yEdit);
        row.yEdit->setText(columnText(spec.yColumn));
    }
    {
        QSignalBlocker blocker(row.secondaryCheck);
        row.secondaryCheck->setChecked(spec.useSecondaryAxis);
    }
}

void SeriesConfigurator::onRowEdited(int index)
{
    if (index < 0 || index >= m_rows.size() || index >= m_specs.size())
        return;

    const RowWidgets &row = m_rows.at(index);
    SeriesSpec &spec = m_specs[index];
    spec.xColumn = parseColumn(row.xEdit->text());
    spec.yColumn = parseColumn(row.yEdit->text());
    spec.useSecondaryAxis = row.secondaryCheck->isChecked();
    recomputeAll();
}

void SeriesConfigurator::clearOutputs()
{
    m_plotted.clear();
    m_previewText.clear();
}
