#ifndef PLOTSERIES_H
#define PLOTSERIES_H

#include <QString>
#include <QVector>

struct PlotSeries
{
    QVector<double> x;
    QVector<double> y;
    QString label;
    bool secondaryAxis = false;
    int colorSlot = 0; // position in the palette, stable while other series are skipped
};

struct PlotLabels
{
    QString title;
    QString xLabel;
    QString yLabel;
    QString valueLabel; // colorbar of a heatmap
};

#endif // PLOTSERIES_H
