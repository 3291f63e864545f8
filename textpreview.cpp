#include "textpreview.h"

#include <QStringList>

#include <algorithm>
#include <cmath>

QString formatFixed(double value, int precision)
{
    if (std::isnan(value))
        return QStringLiteral("NaN");
    if (std::isinf(value))
        return value > 0 ? QStringLiteral("inf") : QStringLiteral("-inf");
    return QString::number(value, 'f', precision);
}

QString formatColumns(const QStringList &headers,
                      const QVector<QVector<double>> &columns,
                      int precision)
{
    const int columnCount = std::min<int>(headers.size(), columns.size());
    if (columnCount == 0)
        return QString();

    int rowCount = 0;
    for (int c = 0; c < columnCount; ++c)
        rowCount = std::max(rowCount, static_cast<int>(columns.at(c).size()));

    QVector<QStringList> cells(columnCount);
    QVector<int> widths(columnCount, 0);
    for (int c = 0; c < columnCount; ++c)
    {
        QStringList &column = cells[c];
        column.reserve(rowCount + 1);
        column.append(headers.at(c));
        const QVector<double> &values = columns.at(c);
        for (int r = 0; r < rowCount; ++r)
            column.append(r < values.size() ? formatFixed(values.at(r), precision) : QStringLiteral("NaN"));

        for (const QString &cell : column)
            widths[c] = std::max(widths[c], static_cast<int>(cell.size()));
    }

    QStringList lines;
    lines.reserve(rowCount + 1);
    for (int r = 0; r <= rowCount; ++r)
    {
        QStringList parts;
        parts.reserve(columnCount);
        for (int c = 0; c < columnCount; ++c)
            parts.append(cells.at(c).at(r).rightJustified(widths.at(c)));
        lines.append(parts.join(QStringLiteral("  ")));
    }
    return lines.join(QLatin1Char('\n'));
}

QString formatCutPreview(const QString &coordinateName,
                         double fixedCoordinate,
                         const QString &coordinateHeader,
                         const QString &valueHeader,
                         const QVector<double> &coordinates,
                         const QVector<double> &values)
{
    return QStringLiteral("%1: %2\n").arg(coordinateName, formatFixed(fixedCoordinate))
         + formatColumns({coordinateHeader, valueHeader}, {coordinates, values});
}
