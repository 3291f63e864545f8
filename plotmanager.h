#ifndef PLOTMANAGER_H
#define PLOTMANAGER_H

#include <QObject>
#include <QVector>
#include <QColor>
#include <QMouseEvent>
#include <QPoint>

#include "plotseries.h"
#include "qcustomplot.h"

namespace dv {
struct MatrixData;
}

class QCustomPlot;
class QCPColorMap;
class QCPColorScale;
class QCPMarginGroup;
class QCPTextElement;
class PlotSettingsDialog;

class PlotManager : public QObject
{
    Q_OBJECT
public:
    explicit PlotManager(QCustomPlot* plot, QObject *parent = nullptr);

    void plotHeatmap(const dv::MatrixData &matrix, const PlotLabels &labels);
    void plotSeries(const QVector<PlotSeries> &series, const PlotLabels &labels);
    void clear();
    void autoscale();
    bool saveImage(const QString &path, QString *errorMessage = nullptr);
    void applySettingsFromDialog(const PlotSettingsDialog &dialog);

    QColor seriesColor(int slot) const;
    QCustomPlot *plot() const;
    QCPColorMap *colorMap() const;
    QCPColorScale *colorScale() const;
    QString title() const;

public slots:
    void mouseDoubleClick(QMouseEvent *event);
    void mousePress(QMouseEvent *event);
    void mouseMove(QMouseEvent *event);
    void mouseRelease(QMouseEvent *event);

private:
    void reset();
    void setTitle(const QString &title);
    void showPlotSettingsDialog();
    void applyAxisRanges(const PlotSettingsDialog &dialog);
    void applyStoredGridSettings();

    QCustomPlot* m_plot;
    QVector<QColor> m_colors;

    QCPColorMap *m_colorMap;
    QCPColorScale *m_colorScale;
    QCPMarginGroup *m_marginGroup;
    QCPTextElement *m_title;

    bool m_showPlotSettingsOnRightRelease;
    QPoint m_rightClickPressPos;

    Qt::PenStyle m_gridPenStyle;
    QColor m_gridColor;
};

#endif // PLOTMANAGER_H
