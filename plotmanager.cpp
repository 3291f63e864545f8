#include "plotmanager.h"
#include "qcustomplot.h"
#include "parser_table.h"
#include "plotsettingsdialog.h"
#include <QDebug>
#include <QApplication>
#include <QFileInfo>
#include <QColor>
#include <QPen>
#include <QVector>
#include <algorithm>
#include <limits>
#include <cmath>

namespace
{
// Extent covered by a coordinate vector: first to last entry, or the
// positional indices when the coordinates are missing.
QCPRange coordinateExtent(const Eigen::ArrayXd &coords)
{
    const Eigen::Index n = coords.size();
    double lower = 0.0;
    double upper = n > 0 ? static_cast<double>(n - 1) : 0.0;
    if (n > 0 && std::isfinite(coords[0]) && std::isfinite(coords[n - 1]))
    {
        lower = coords[0];
        upper = coords[n - 1];
    }
    if (lower == upper)
    {
        lower -= 0.5;
        upper += 0.5;
    }
    return QCPRange(lower, upper);
}

// Color map cells run from the lower to the upper key, so descending
// coordinates are written mirrored to keep each row at its own coordinate.
bool isDescending(const Eigen::ArrayXd &coords)
{
    const Eigen::Index n = coords.size();
    return n > 1 && std::isfinite(coords[0]) && std::isfinite(coords[n - 1]) && coords[0] > coords[n - 1];
}
}

PlotManager::PlotManager(QCustomPlot* plot, QObject *parent)
    : QObject(parent)
    , m_plot(plot)
    , m_colorMap(nullptr)
    , m_colorScale(nullptr)
    , m_marginGroup(nullptr)
    , m_title(nullptr)
    , m_showPlotSettingsOnRightRelease(false)
    , m_rightClickPressPos()
    , m_gridPenStyle(Qt::DashLine)
    , m_gridColor(QColor(200, 200, 200))
{
    m_plot->setInteractions(QCP::iRangeDrag | QCP::iRangeZoom);
    connect(m_plot, &QCustomPlot::mouseDoubleClick, this, &PlotManager::mouseDoubleClick);
    connect(m_plot, &QCustomPlot::mousePress, this, &PlotManager::mousePress);
    connect(m_plot, &QCustomPlot::mouseMove, this, &PlotManager::mouseMove);
    connect(m_plot, &QCustomPlot::mouseRelease, this, &PlotManager::mouseRelease);

    m_colors.append(QColor(  0,   0, 255));   // Blue
    m_colors.append(QColor(  0, 128,   0));   // Green
    m_colors.append(QColor(255,   0,   0));   // Red
    m_colors.append(QColor(  0, 191, 191));   // Cyan
    m_colors.append(QColor(191,   0, 191));   // Magenta
    m_colors.append(QColor(191, 191,   0));   // Olive
    m_colors.append(QColor(  0,   0,   0));   // Black
    m_colors.append(QColor(128,   0, 128));   // Purple
    m_colors.append(QColor(255, 165,   0));   // Orange

    m_plot->legend->setVisible(false);
    applyStoredGridSettings();
}

QColor PlotManager::seriesColor(int slot) const
{
    if (m_colors.isEmpty())
        return QColor(Qt::black);
    const int n = m_colors.size();
    return m_colors.at(((slot % n) + n) % n);
}

QCustomPlot *PlotManager::plot() const
{
    return m_plot;
}

QCPColorMap *PlotManager::colorMap() const
{
    return m_colorMap;
}

QCPColorScale *PlotManager::colorScale() const
{
    return m_colorScale;
}

QString PlotManager::title() const
{
    return m_title ? m_title->text() : QString();
}

void PlotManager::plotHeatmap(const dv::MatrixData &matrix, const PlotLabels &labels)
{
    reset();

    const int nx = static_cast<int>(matrix.columnCount());
    const int ny = static_cast<int>(matrix.rowCount());
    if (nx == 0 || ny == 0)
    {
        m_plot->replot();
        return;
    }

    m_colorMap = new QCPColorMap(m_plot->xAxis, m_plot->yAxis);
    m_colorMap->removeFromLegend();
    m_colorMap->data()->setSize(nx, ny);
    m_colorMap->data()->setRange(coordinateExtent(matrix.xCoords), coordinateExtent(matrix.yCoords));

    const bool xDescending = isDescending(matrix.xCoords);
    const bool yDescending = isDescending(matrix.yCoords);

    double lower = std::numeric_limits<double>::infinity();
    double upper = -std::numeric_limits<double>::infinity();
    for (int yIndex = 0; yIndex < ny; ++yIndex)
    {
        for (int xIndex = 0; xIndex < nx; ++xIndex)
        {
            const double value = matrix.values(yIndex, xIndex);
            m_colorMap->data()->setCell(xDescending ? nx - 1 - xIndex : xIndex,
                                        yDescending ? ny - 1 - yIndex : yIndex,
                                        value);
            if (std::isfinite(value))
            {
                lower = std::min(lower, value);
                upper = std::max(upper, value);
            }
        }
    }
    if (!std::isfinite(lower))
    {
        lower = 0.0;
        upper = 1.0;
    }
    else if (lower == upper)
    {
        lower -= 0.5;
        upper += 0.5;
    }

    m_colorScale = new QCPColorScale(m_plot);
    m_plot->plotLayout()->addElement(0, 1, m_colorScale);
    m_colorScale->setType(QCPAxis::atRight);
    m_colorScale->axis()->setLabel(labels.valueLabel);
    m_colorMap->setColorScale(m_colorScale);

    QCPColorGradient gradient(QCPColorGradient::gpJet);
    gradient = gradient.inverted();
    gradient.setNanHandling(QCPColorGradient::nhTransparent);
    m_colorMap->setGradient(gradient);
    m_colorMap->setInterpolate(false);
    m_colorMap->setDataRange(QCPRange(lower, upper));

    m_marginGroup = new QCPMarginGroup(m_plot);
    m_plot->axisRect()->setMarginGroup(QCP::msBottom | QCP::msTop, m_marginGroup);
    m_colorScale->setMarginGroup(QCP::msBottom | QCP::msTop, m_marginGroup);

    m_plot->xAxis->setLabel(labels.xLabel);
    m_plot->yAxis->setLabel(labels.yLabel);
    setTitle(labels.title);

#ifdef DASHVIEW_ENABLE_PLOT_DEBUG
    qDebug() << "  plotHeatmap()" << nx << "x" << ny << "range" << lower << upper;
#endif

    m_plot->rescaleAxes();
    m_plot->replot();
}

void PlotManager::plotSeries(const QVector<PlotSeries> &series, const PlotLabels &labels)
{
    reset();

    for (const PlotSeries &entry : series)
    {
        QCPAxis *valueAxis = m_plot->yAxis;
        if (entry.secondaryAxis)
        {
            valueAxis = m_plot->yAxis2;
            if (!m_plot->yAxis2->visible())
            {
                m_plot->yAxis2->setVisible(true);
                m_plot->yAxis2->setLabel(tr("Secondary Y-axis"));
            }
        }

        QCPGraph *graph = m_plot->addGraph(m_plot->xAxis, valueAxis);
        QPen pen(seriesColor(entry.colorSlot));
        pen.setWidthF(1.5);
        graph->setPen(pen);
        graph->setName(entry.label);
        graph->setData(entry.x, entry.y);
    }

    m_plot->xAxis->setLabel(labels.xLabel);
    m_plot->yAxis->setLabel(labels.yLabel);
    setTitle(labels.title);
    m_plot->legend->setVisible(m_plot->graphCount() > 0);

#ifdef DASHVIEW_ENABLE_PLOT_DEBUG
    qDebug() << "  plotSeries()" << m_plot->graphCount() << "graphs";
#endif

    m_plot->rescaleAxes();
    m_plot->replot();
}

void PlotManager::clear()
{
    reset();
    m_plot->replot();
}

void PlotManager::reset()
{
    m_plot->clearPlottables();
    m_colorMap = nullptr;

    if (m_colorScale)
    {
        m_plot->plotLayout()->remove(m_colorScale);
        m_colorScale = nullptr;
    }
    if (m_marginGroup)
    {
        m_plot->axisRect()->setMarginGroup(QCP::msBottom | QCP::msTop, nullptr);
        delete m_marginGroup;
        m_marginGroup = nullptr;
    }
    if (m_title)
    {
        m_plot->plotLayout()->remove(m_title);
        m_title = nullptr;
    }
    m_plot->plotLayout()->simplify();

    m_plot->legend->setVisible(false);
    m_plot->yAxis2->setVisible(false);
    m_plot->yAxis2->setLabel(QString());
    m_plot->xAxis->setLabel(QString());
    m_plot->yAxis->setLabel(QString());
}

void PlotManager::setTitle(const QString &title)
{
    if (title.isEmpty())
        return;

    m_plot->plotLayout()->insertRow(0);
    m_title = new QCPTextElement(m_plot, title, QFont(m_plot->font().family(), 12, QFont::Bold));
    m_plot->plotLayout()->addElement(0, 0, m_title);
}

void PlotManager::autoscale()
{
    m_plot->rescaleAxes();
    m_plot->replot();
}

bool PlotManager::saveImage(const QString &path, QString *errorMessage)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    bool ok = false;
    if (suffix == QLatin1String("png"))
        ok = m_plot->savePng(path);
    else if (suffix == QLatin1String("jpg") || suffix == QLatin1String("jpeg"))
        ok = m_plot->saveJpg(path);
    else if (suffix == QLatin1String("pdf"))
        ok = m_plot->savePdf(path);
    else
    {
        if (errorMessage)
            *errorMessage = tr("Unsupported image format: %1").arg(path);
        return false;
    }

    if (!ok && errorMessage)
        *errorMessage = tr("Failed to write %1").arg(path);
    return ok;
}

void PlotManager::mouseDoubleClick(QMouseEvent *event)
{
    if (event->button() == Qt::LeftButton)
    {
        autoscale();
    }
}

void PlotManager::mousePress(QMouseEvent *event)
{
    if (event->button() == Qt::RightButton)
    {
        m_rightClickPressPos = event->pos();
        m_showPlotSettingsOnRightRelease = true;
    }
}

void PlotManager::mouseMove(QMouseEvent *event)
{
    if (m_showPlotSettingsOnRightRelease && (event->buttons() & Qt::RightButton))
    {
        if ((event->pos() - m_rightClickPressPos).manhattanLength() > QApplication::startDragDistance())
            m_showPlotSettingsOnRightRelease = false;
    }
}

void PlotManager::mouseRelease(QMouseEvent *event)
{
    if (event->button() == Qt::RightButton)
    {
        if (m_showPlotSettingsOnRightRelease)
            showPlotSettingsDialog();
        m_showPlotSettingsOnRightRelease = false;
    }
}

void PlotManager::showPlotSettingsDialog()
{
    if (!m_plot)
        return;

    PlotSettingsDialog dialog(m_plot);
    dialog.setAxisLabels(m_plot->xAxis->label(), m_plot->yAxis->label(), m_plot->yAxis2->label());
    dialog.setXAxisRange(m_plot->xAxis->range().lower, m_plot->xAxis->range().upper);
    dialog.setYAxisRange(m_plot->yAxis->range().lower, m_plot->yAxis->range().upper);
    dialog.setY2AxisRange(m_plot->yAxis2->range().lower, m_plot->yAxis2->range().upper,
                          m_plot->yAxis2->visible());
    dialog.setGridStyle(m_gridPenStyle);
    dialog.setLegendVisible(m_plot->legend->visible(), m_plot->graphCount() > 0);

    if (dialog.exec() == QDialog::Accepted)
        applySettingsFromDialog(dialog);
}

void PlotManager::applySettingsFromDialog(const PlotSettingsDialog &dialog)
{
    applyAxisRanges(dialog);
    m_gridPenStyle = dialog.gridStyle();
    applyStoredGridSettings();
    if (m_plot->graphCount() > 0)
        m_plot->legend->setVisible(dialog.legendVisible());
    m_plot->replot();
}

void PlotManager::applyAxisRanges(const PlotSettingsDialog &dialog)
{
    double xMin = dialog.xMinimum();
    double xMax = dialog.xMaximum();
    double yMin = dialog.yMinimum();
    double yMax = dialog.yMaximum();

    if (std::isfinite(xMin) && std::isfinite(xMax) && xMax > xMin)
        m_plot->xAxis->setRange(xMin, xMax);
    if (std::isfinite(yMin) && std::isfinite(yMax) && yMax > yMin)
        m_plot->yAxis->setRange(yMin, yMax);

    if (dialog.y2AxisIsEnabled())
    {
        double y2Min = dialog.y2Minimum();
        double y2Max = dialog.y2Maximum();
        if (std::isfinite(y2Min) && std::isfinite(y2Max) && y2Max > y2Min)
            m_plot->yAxis2->setRange(y2Min, y2Max);
    }
}

void PlotManager::applyStoredGridSettings()
{
    auto applyToAxis = [&](QCPAxis *axis)
    {
        if (!axis)
            return;
        if (QCPGrid *grid = axis->grid())
        {
            bool gridVisible = m_gridPenStyle != Qt::NoPen;
            grid->setVisible(gridVisible);
            QPen pen = gridVisible ? grid->pen() : QPen(Qt::NoPen);
            if (gridVisible)
            {
                pen.setColor(m_gridColor);
                pen.setStyle(m_gridPenStyle);
                pen.setWidthF(0.0);
            }
            grid->setPen(pen);
        }
    };

    applyToAxis(m_plot->xAxis);
    applyToAxis(m_plot->yAxis);
}
