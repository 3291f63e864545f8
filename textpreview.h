#ifndef TEXTPREVIEW_H
#define TEXTPREVIEW_H

#include <QString>
#include <QStringList>
#include <QVector>

// Right-aligned fixed-point table. Columns shorter than the longest one are
// padded with "NaN" so every row has a cell per column.
QString formatColumns(const QStringList &headers,
                      const QVector<QVector<double>> &columns,
                      int precision = 2);

QString formatCutPreview(const QString &coordinateName,
                         double fixedCoordinate,
                         const QString &coordinateHeader,
                         const QString &valueHeader,
                         const QVector<double> &coordinates,
                         const QVector<double> &values);

QString formatFixed(double value, int precision = 2);

#endif // TEXTPREVIEW_H
