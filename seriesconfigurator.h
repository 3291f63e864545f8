#ifndef SERIESCONFIGURATOR_H
#define SERIESCONFIGURATOR_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "plotseries.h"

class QCheckBox;
class QFrame;
class QLineEdit;
class QVBoxLayout;

namespace dv {
struct TableData;
}

struct SeriesSpec
{
    std::optional<int> xColumn; // empty when the entered text is not an integer
    std::optional<int> yColumn;
    bool useSecondaryAxis = false;

    bool operator==(const SeriesSpec &other) const
    {
        return xColumn == other.xColumn && yColumn == other.yColumn
                && useSecondaryAxis == other.useSecondaryAxis;
    }
    bool operator!=(const SeriesSpec &other) const { return !(*this == other); }
};

// Keeps the ordered list of series specs of the 1D tab and the row widgets
// that edit them. The rows are a projection of the list: they are added and
// removed to match it, and edits in a row are written back into its spec.
class SeriesConfigurator : public QObject
{
    Q_OBJECT
public:
    enum class Status { Ok, EmptyListError, NoData, NoPlottableSeries };

    explicit SeriesConfigurator(QVBoxLayout *rowLayout = nullptr, QObject *parent = nullptr);
    ~SeriesConfigurator() override;

    void setTable(const dv::TableData *table);
    // Drops the table but keeps the configured series.
    void clearTable();
    const dv::TableData *table() const;

    void addSeries(int defaultX = 0, int defaultY = 0, bool defaultUseSecondaryAxis = false);
    Status removeLastSeries();
    void clearAllSeries();
    void setSeries(int index, const SeriesSpec &spec);
    Status recomputeAll();

    const QVector<SeriesSpec> &specs() const;
    int seriesCount() const;

    const QVector<PlotSeries> &plottedSeries() const;
    const QString &previewText() const;
    const QStringList &skippedSeries() const;

signals:
    void seriesPlotted();
    void seriesCleared();
    void warningRaised(const QString &title, const QString &message);
    void informationRaised(const QString &title, const QString &message);

private:
    struct RowWidgets
    {
        QFrame *frame = nullptr;
        QLineEdit *xEdit = nullptr;
        QLineEdit *yEdit = nullptr;
        QCheckBox *secondaryCheck = nullptr;
    };

    void syncRows();
    RowWidgets createRow(int index);
    void destroyRow(const RowWidgets &row);
    void writeRow(int index);
    void onRowEdited(int index);
    void clearOutputs();

    QVBoxLayout *m_rowLayout;
    const dv::TableData *m_table;
    QVector<SeriesSpec> m_specs;
    QVector<RowWidgets> m_rows;
    QVector<PlotSeries> m_plotted;
    QString m_previewText;
    QStringList m_skipped;
};

#endif // SERIESCONFIGURATOR_H
