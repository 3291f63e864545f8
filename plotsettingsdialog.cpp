#include "plotsettingsdialog.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QDoubleValidator>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QLocale>
#include <QVBoxLayout>

#include <cmath>
#include <limits>

namespace {

QLineEdit *makeLineEdit(QWidget *parent)
{
    auto *edit = new QLineEdit(parent);
    auto *validator = new QDoubleValidator(edit);
    validator->setNotation(QDoubleValidator::ScientificNotation);
    validator->setLocale(QLocale::c());
    validator->setBottom(-std::numeric_limits<double>::max());
    validator->setTop(std::numeric_limits<double>::max());
    edit->setValidator(validator);
    edit->setAlignment(Qt::AlignRight);
    return edit;
}

QString makeAxisLabelText(const QString &base, const QString &axisLabel)
{
    if (axisLabel.isEmpty())
        return base;
    return QStringLiteral("%1 (%2)").arg(base, axisLabel);
}

} // namespace

PlotSettingsDialog::PlotSettingsDialog(QWidget *parent)
    : QDialog(parent)
    , m_xMinLabel(new QLabel(this))
    , m_xMaxLabel(new QLabel(this))
    , m_yMinLabel(new QLabel(this))
    , m_yMaxLabel(new QLabel(this))
    , m_y2MinLabel(new QLabel(this))
    , m_y2MaxLabel(new QLabel(this))
    , m_xMinEdit(makeLineEdit(this))
    , m_xMaxEdit(makeLineEdit(this))
    , m_yMinEdit(makeLineEdit(this))
    , m_yMaxEdit(makeLineEdit(this))
    , m_y2MinEdit(makeLineEdit(this))
    , m_y2MaxEdit(makeLineEdit(this))
    , m_gridStyleCombo(new QComboBox(this))
    , m_legendCheck(new QCheckBox(tr("Show legend"), this))
{
    setWindowTitle(tr("Plot Settings"));
    setModal(true);

    populatePenStyleCombo(m_gridStyleCombo);

    auto *formLayout = new QFormLayout;
    formLayout->addRow(m_xMinLabel, m_xMinEdit);
    formLayout->addRow(m_xMaxLabel, m_xMaxEdit);
    formLayout->addRow(m_yMinLabel, m_yMinEdit);
    formLayout->addRow(m_yMaxLabel, m_yMaxEdit);
    formLayout->addRow(m_y2MinLabel, m_y2MinEdit);
    formLayout->addRow(m_y2MaxLabel, m_y2MaxEdit);
    formLayout->addRow(tr("Grid"), m_gridStyleCombo);
    formLayout->addRow(QString(), m_legendCheck);

    auto *buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);

    auto *layout = new QVBoxLayout(this);
    layout->addLayout(formLayout);
    layout->addWidget(buttonBox);

    setLayout(layout);

    setAxisLabels(QString(), QString(), QString());
    setY2AxisRange(std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN(), false);
}

void PlotSettingsDialog::setAxisLabels(const QString &xLabel, const QString &yLabel, const QString &y2Label)
{
    m_xMinLabel->setText(makeAxisLabelText(tr("X axis minimum"), xLabel));
    m_xMaxLabel->setText(makeAxisLabelText(tr("X axis maximum"), xLabel));
    m_yMinLabel->setText(makeAxisLabelText(tr("Y axis minimum"), yLabel));
    m_yMaxLabel->setText(makeAxisLabelText(tr("Y axis maximum"), yLabel));
    m_y2MinLabel->setText(makeAxisLabelText(tr("Secondary Y minimum"), y2Label));
    m_y2MaxLabel->setText(makeAxisLabelText(tr("Secondary Y maximum"), y2Label));
}

void PlotSettingsDialog::setXAxisRange(double minimum, double maximum)
{
    m_xMinEdit->setText(formatValue(minimum));
    m_xMaxEdit->setText(formatValue(maximum));
}

void PlotSettingsDialog::setYAxisRange(double minimum, double maximum)
{
    m_yMinEdit->setText(formatValue(minimum));
    m_yMaxEdit->setText(formatValue(maximum));
}

void PlotSettingsDialog::setY2AxisRange(double minimum, double maximum, bool enabled)
{
    m_y2MinEdit->setText(formatValue(minimum));
    m_y2MaxEdit->setText(formatValue(maximum));

    m_y2MinEdit->setEnabled(enabled);
    m_y2MaxEdit->setEnabled(enabled);
    m_y2MinLabel->setEnabled(enabled);
    m_y2MaxLabel->setEnabled(enabled);
}

void PlotSettingsDialog::setGridStyle(Qt::PenStyle style)
{
    int index = m_gridStyleCombo->findData(static_cast<int>(style));
    if (index < 0)
        index = m_gridStyleCombo->findData(static_cast<int>(Qt::DashLine));
    m_gridStyleCombo->setCurrentIndex(index);
}

void PlotSettingsDialog::setLegendVisible(bool visible, bool available)
{
    m_legendCheck->setChecked(visible);
    m_legendCheck->setEnabled(available);
}

double PlotSettingsDialog::xMinimum() const
{
    return parseValue(m_xMinEdit, std::numeric_limits<double>::quiet_NaN());
}

double PlotSettingsDialog::xMaximum() const
{
    return parseValue(m_xMaxEdit, std::numeric_limits<double>::quiet_NaN());
}

double PlotSettingsDialog::yMinimum() const
{
    return parseValue(m_yMinEdit, std::numeric_limits<double>::quiet_NaN());
}

double PlotSettingsDialog::yMaximum() const
{
    return parseValue(m_yMaxEdit, std::numeric_limits<double>::quiet_NaN());
}

double PlotSettingsDialog::y2Minimum() const
{
    return parseValue(m_y2MinEdit, std::numeric_limits<double>::quiet_NaN());
}

double PlotSettingsDialog::y2Maximum() const
{
    return parseValue(m_y2MaxEdit, std::numeric_limits<double>::quiet_NaN());
}

bool PlotSettingsDialog::y2AxisIsEnabled() const
{
    return m_y2MinEdit->isEnabled();
}

Qt::PenStyle PlotSettingsDialog::gridStyle() const
{
    bool ok = false;
    const int value = m_gridStyleCombo->currentData().toInt(&ok);
    return ok ? static_cast<Qt::PenStyle>(value) : Qt::DashLine;
}

bool PlotSettingsDialog::legendVisible() const
{
    return m_legendCheck->isChecked();
}

QString PlotSettingsDialog::formatValue(double value)
{
    if (!std::isfinite(value))
        return QString();
    return QString::number(value, 'g', 8);
}

double PlotSettingsDialog::parseValue(const QLineEdit *edit, double fallback)
{
    if (!edit || !edit->isEnabled())
        return fallback;
    bool ok = false;
    double value = edit->text().trimmed().toDouble(&ok);
    return ok ? value : fallback;
}

void PlotSettingsDialog::populatePenStyleCombo(QComboBox *combo)
{
    if (!combo)
        return;

    combo->clear();
    combo->addItem(QObject::tr("None"), static_cast<int>(Qt::NoPen));
    combo->addItem(QObject::tr("Solid"), static_cast<int>(Qt::SolidLine));
    combo->addItem(QObject::tr("Dash"), static_cast<int>(Qt::DashLine));
    combo->addItem(QObject::tr("Dot"), static_cast<int>(Qt::DotLine));
}
