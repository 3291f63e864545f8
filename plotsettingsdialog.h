#ifndef PLOTSETTINGSDIALOG_H
#define PLOTSETTINGSDIALOG_H

#include <QDialog>

class QCheckBox;
class QComboBox;
class QLineEdit;
class QLabel;

class PlotSettingsDialog : public QDialog
{
    Q_OBJECT
public:
    explicit PlotSettingsDialog(QWidget *parent = nullptr);

    void setAxisLabels(const QString &xLabel, const QString &yLabel, const QString &y2Label);
    void setXAxisRange(double minimum, double maximum);
    void setYAxisRange(double minimum, double maximum);
    void setY2AxisRange(double minimum, double maximum, bool enabled);
    void setGridStyle(Qt::PenStyle style);
    void setLegendVisible(bool visible, bool available);

    double xMinimum() const;
    double xMaximum() const;
    double yMinimum() const;
    double yMaximum() const;
    double y2Minimum() const;
    double y2Maximum() const;
    bool y2AxisIsEnabled() const;

    Qt::PenStyle gridStyle() const;
    bool legendVisible() const;

private:
    static QString formatValue(double value);
    static double parseValue(const QLineEdit *edit, double fallback);
    static void populatePenStyleCombo(QComboBox *combo);

    QLabel *m_xMinLabel;
    QLabel *m_xMaxLabel;
    QLabel *m_yMinLabel;
    QLabel *m_yMaxLabel;
    QLabel *m_y2MinLabel;
    QLabel *m_y2MaxLabel;

    QLineEdit *m_xMinEdit;
    QLineEdit *m_xMaxEdit;
    QLineEdit *m_yMinEdit;
    QLineEdit *m_yMaxEdit;
    QLineEdit *m_y2MinEdit;
    QLineEdit *m_y2MaxEdit;

    QComboBox *m_gridStyleCombo;
    QCheckBox *m_legendCheck;
};

#endif // PLOTSETTINGSDIALOG_H
