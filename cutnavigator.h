#ifndef CUTNAVIGATOR_H
#define CUTNAVIGATOR_H

#include <QObject>
#include <QString>
#include <QVector>

#include <limits>

class QLineEdit;

namespace dv {
struct MatrixData;
}

struct CutSlice
{
    QVector<double> coordinates;
    QVector<double> values;
    double fixedCoordinate = std::numeric_limits<double>::quiet_NaN();
    QString title;
};

// Owns the row and column cut cursors of the 2D tab. The two line edits are
// views of the cursors: user edits are validated into the cursors, and every
// programmatic refresh of an edit happens with its signals blocked.
class CutNavigator : public QObject
{
    Q_OBJECT
public:
    enum class Axis { Row, Column };
    enum class Status { Accepted, Unchanged, ParseError, RangeError, NoData };

    CutNavigator(QLineEdit *rowEdit, QLineEdit *columnEdit, QObject *parent = nullptr);

    void setMatrix(const dv::MatrixData *matrix);
    void clear();
    const dv::MatrixData *matrix() const;
    bool hasMatrix() const;

    Status setRowCut(const QString &rawText);
    Status setColumnCut(const QString &rawText);
    void navigate(Axis axis, int direction);
    void recomputeSlices();

    int rowCutIndex() const;
    int columnCutIndex() const;
    int rowCount() const;
    int columnCount() const;

    // X-cut: values along the fixed row. Y-cut: values along the fixed column.
    const CutSlice &xCut() const;
    const CutSlice &yCut() const;

signals:
    void slicesChanged();
    void slicesCleared();
    void warningRaised(const QString &title, const QString &message);

private:
    Status applyCut(Axis axis, const QString &rawText);
    void refreshFields();
    void refreshField(Axis axis);
    void onRowTextChanged(const QString &text);
    void onColumnTextChanged(const QString &text);
    int count(Axis axis) const;
    int &cursor(Axis axis);
    QLineEdit *field(Axis axis) const;

    QLineEdit *m_rowEdit;
    QLineEdit *m_columnEdit;
    const dv::MatrixData *m_matrix;
    int m_rowCutIndex;
    int m_columnCutIndex;
    CutSlice m_xCut;
    CutSlice m_yCut;
};

#endif // CUTNAVIGATOR_H
