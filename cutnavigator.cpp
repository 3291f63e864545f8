#include "cutnavigator.h"
#include "parser_table.h"
#include "textpreview.h"

#include <QDebug>
#include <QLineEdit>
#include <QSignalBlocker>

#include <algorithm>

namespace {

QString indexName(CutNavigator::Axis axis)
{
    // The row cursor picks a y position, the column cursor an x position.
    return axis == CutNavigator::Axis::Row ? QStringLiteral("Y-Index") : QStringLiteral("X-Index");
}

} // namespace

CutNavigator::CutNavigator(QLineEdit *rowEdit, QLineEdit *columnEdit, QObject *parent)
    : QObject(parent)
    , m_rowEdit(rowEdit)
    , m_columnEdit(columnEdit)
    , m_matrix(nullptr)
    , m_rowCutIndex(0)
    , m_columnCutIndex(0)
{
    if (m_rowEdit)
        connect(m_rowEdit, &QLineEdit::textChanged, this, &CutNavigator::onRowTextChanged);
    if (m_columnEdit)
        connect(m_columnEdit, &QLineEdit::textChanged, this, &CutNavigator::onColumnTextChanged);
    refreshFields();
}

void CutNavigator::setMatrix(const dv::MatrixData *matrix)
{
    m_matrix = matrix;
    m_rowCutIndex = 0;
    m_columnCutIndex = 0;
    recomputeSlices();
}

void CutNavigator::clear()
{
    setMatrix(nullptr);
}

const dv::MatrixData *CutNavigator::matrix() const
{
    return m_matrix;
}

bool CutNavigator::hasMatrix() const
{
    return m_matrix && m_matrix->rowCount() > 0 && m_matrix->columnCount() > 0;
}

CutNavigator::Status CutNavigator::setRowCut(const QString &rawText)
{
    return applyCut(Axis::Row, rawText);
}

CutNavigator::Status CutNavigator::setColumnCut(const QString &rawText)
{
    return applyCut(Axis::Column, rawText);
}

CutNavigator::Status CutNavigator::applyCut(Axis axis, const QString &rawText)
{
    if (!hasMatrix())
        return Status::NoData;

    bool ok = false;
    const int requested = rawText.trimmed().toInt(&ok);
    if (!ok)
    {
        refreshField(axis);
        emit warningRaised(tr("Invalid Input"), tr("Please enter a valid integer."));
        return Status::ParseError;
    }

    const int maxIndex = count(axis) - 1;
    if (requested < 0 || requested > maxIndex)
    {
        refreshField(axis);
        const QString name = indexName(axis);
        emit warningRaised(tr("Invalid %1").arg(name),
                           tr("%1 must be between 0 and %2.").arg(name).arg(maxIndex));
        return Status::RangeError;
    }

    int &current = cursor(axis);
    if (current == requested)
        return Status::Unchanged;

    current = requested;
    recomputeSlices();
    return Status::Accepted;
}

void CutNavigator::navigate(Axis axis, int direction)
{
    if (!hasMatrix())
        return;

    int &current = cursor(axis);
    current = std::clamp(current + direction, 0, count(axis) - 1);
    refreshFields();
    recomputeSlices();
}

void CutNavigator::recomputeSlices()
{
    if (!hasMatrix())
    {
        m_rowCutIndex = 0;
        m_columnCutIndex = 0;
        m_xCut = CutSlice();
        m_yCut = CutSlice();
        refreshFields();
        emit slicesCleared();
        return;
    }

    m_rowCutIndex = std::clamp(m_rowCutIndex, 0, rowCount() - 1);
    m_columnCutIndex = std::clamp(m_columnCutIndex, 0, columnCount() - 1);
    refreshFields();

    const Eigen::Index row = m_rowCutIndex;
    const Eigen::Index col = m_columnCutIndex;

    m_xCut = CutSlice();
    m_xCut.fixedCoordinate = m_matrix->yCoords[row];
    m_xCut.coordinates = QVector<double>(m_matrix->xCoords.data(), m_matrix->xCoords.data() + m_matrix->xCoords.size());
    m_xCut.values.reserve(columnCount());
    for (Eigen::Index c = 0; c < m_matrix->columnCount(); ++c)
        m_xCut.values.append(m_matrix->values(row, c));
    m_xCut.title = tr("X-Cut at Y-coord %1").arg(formatFixed(m_xCut.fixedCoordinate));

    m_yCut = CutSlice();
    m_yCut.fixedCoordinate = m_matrix->xCoords[col];
    m_yCut.coordinates = QVector<double>(m_matrix->yCoords.data(), m_matrix->yCoords.data() + m_matrix->yCoords.size());
    m_yCut.values.reserve(rowCount());
    for (Eigen::Index r = 0; r < m_matrix->rowCount(); ++r)
        m_yCut.values.append(m_matrix->values(r, col));
    m_yCut.title = tr("Y-Cut at X-coord %1").arg(formatFixed(m_yCut.fixedCoordinate));

#ifdef DASHVIEW_ENABLE_PLOT_DEBUG
    qDebug() << "  recomputeSlices()" << m_rowCutIndex << m_columnCutIndex;
#endif
    emit slicesChanged();
}

int CutNavigator::rowCutIndex() const
{
    return m_rowCutIndex;
}

int CutNavigator::columnCutIndex() const
{
    return m_columnCutIndex;
}

int CutNavigator::rowCount() const
{
    return m_matrix ? static_cast<int>(m_matrix->rowCount()) : 0;
}

int CutNavigator::columnCount() const
{
    return m_matrix ? static_cast<int>(m_matrix->columnCount()) : 0;
}

const CutSlice &CutNavigator::xCut() const
{
    return m_xCut;
}

const CutSlice &CutNavigator::yCut() const
{
    return m_yCut;
}

void CutNavigator::refreshFields()
{
    refreshField(Axis::Row);
    refreshField(Axis::Column);
}

void CutNavigator::refreshField(Axis axis)
{
    QLineEdit *edit = field(axis);
    if (!edit)
        return;

    QSignalBlocker blocker(edit);
    edit->setText(QString::number(cursor(axis)));
}

void CutNavigator::onRowTextChanged(const QString &text)
{
    // Partial input such as a cleared field is ignored until it forms a number.
    if (text.trimmed().isEmpty())
        return;
    setRowCut(text);
}

void CutNavigator::onColumnTextChanged(const QString &text)
{
    if (text.trimmed().isEmpty())
        return;
    setColumnCut(text);
}

int CutNavigator::count(Axis axis) const
{
    return axis == Axis::Row ? rowCount() : columnCount();
}

int &CutNavigator::cursor(Axis axis)
{
    return axis == Axis::Row ? m_rowCutIndex : m_columnCutIndex;
}

QLineEdit *CutNavigator::field(Axis axis) const
{
    return axis == Axis::Row ? m_rowEdit : m_columnEdit;
}
