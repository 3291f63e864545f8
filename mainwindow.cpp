#include "mainwindow.h"
#include "cutnavigator.h"
#include "folderbrowser.h"
#include "parser_table.h"
#include "plotmanager.h"
#include "qcustomplot.h"
#include "seriesconfigurator.h"
#include "textpreview.h"

#include <QDebug>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QFrame>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QIntValidator>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QScrollArea>
#include <QSignalBlocker>
#include <QSizePolicy>
#include <QSplitter>
#include <QTabWidget>
#include <QTextEdit>
#include <QVBoxLayout>

#include <exception>
#include <string>
#include <utility>

namespace {

std::string toLocalPath(const QString &path)
{
    return QFile::encodeName(path).toStdString();
}

QLabel *makeTitleLabel(const QString &text, QWidget *parent)
{
    auto *label = new QLabel(text, parent);
    label->setObjectName(QStringLiteral("titleLabel"));
    return label;
}

} // namespace

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_matrixBrowser(nullptr)
    , m_tableBrowser(nullptr)
    , m_tabWidget(nullptr)
    , m_matrixTab(nullptr)
    , m_tableTab(nullptr)
    , m_themeButton(nullptr)
    , m_heatmapPlot(nullptr)
    , m_xCutPlot(nullptr)
    , m_yCutPlot(nullptr)
    , m_seriesPlot(nullptr)
    , m_heatmapManager(nullptr)
    , m_xCutManager(nullptr)
    , m_yCutManager(nullptr)
    , m_seriesManager(nullptr)
    , m_matrixTitleEdit(nullptr)
    , m_matrixXLabelEdit(nullptr)
    , m_matrixYLabelEdit(nullptr)
    , m_colorbarLabelEdit(nullptr)
    , m_rowCutEdit(nullptr)
    , m_columnCutEdit(nullptr)
    , m_xCutPreview(nullptr)
    , m_yCutPreview(nullptr)
    , m_tableTitleEdit(nullptr)
    , m_tableXLabelEdit(nullptr)
    , m_tableYLabelEdit(nullptr)
    , m_tablePreview(nullptr)
    , m_seriesLayout(nullptr)
    , m_cutNavigator(nullptr)
    , m_seriesConfigurator(nullptr)
    , m_theme(Theme::Light)
    , m_messageBoxesEnabled(true)
{
    setWindowTitle(tr("Advanced Data Dashboard"));

    auto *central = new QWidget(this);
    setCentralWidget(central);
    auto *overallLayout = new QVBoxLayout(central);

    auto *topBar = new QHBoxLayout;
    topBar->addStretch();
    m_themeButton = new QPushButton(tr("Toggle Theme"), central);
    connect(m_themeButton, &QPushButton::clicked, this, &MainWindow::toggleTheme);
    topBar->addWidget(m_themeButton);
    overallLayout->addLayout(topBar);

    auto *contentLayout = new QHBoxLayout;
    contentLayout->addWidget(createLeftPanel());

    m_tabWidget = new QTabWidget(central);
    m_tabWidget->addTab(createMatrixTab(), tr("2D Data Plot"));
    m_tabWidget->addTab(createTableTab(), tr("1D Data Plot"));
    contentLayout->addWidget(m_tabWidget, 1);
    overallLayout->addLayout(contentLayout);

    connect(m_matrixBrowser, &FolderBrowser::fileSelected, this, &MainWindow::loadMatrixFile);
    connect(m_matrixBrowser, &FolderBrowser::rootFolderChanged, this, &MainWindow::resetMatrixState);
    connect(m_tableBrowser, &FolderBrowser::fileSelected, this, &MainWindow::loadTableFile);
    connect(m_tableBrowser, &FolderBrowser::rootFolderChanged, this, &MainWindow::resetTableState);

    connect(m_cutNavigator, &CutNavigator::slicesChanged, this, &MainWindow::onSlicesChanged);
    connect(m_cutNavigator, &CutNavigator::slicesCleared, this, &MainWindow::onSlicesCleared);
    connect(m_cutNavigator, &CutNavigator::warningRaised, this, &MainWindow::showWarning);

    connect(m_seriesConfigurator, &SeriesConfigurator::seriesPlotted, this, &MainWindow::onSeriesPlotted);
    connect(m_seriesConfigurator, &SeriesConfigurator::seriesCleared, this, &MainWindow::onSeriesCleared);
    connect(m_seriesConfigurator, &SeriesConfigurator::warningRaised, this, &MainWindow::showWarning);
    connect(m_seriesConfigurator, &SeriesConfigurator::informationRaised, this, &MainWindow::showInformation);

    m_seriesConfigurator->addSeries(0, 1, false);

    setTheme(m_theme);
}

MainWindow::~MainWindow()
{
    // The controllers hold raw pointers into the datasets.
    m_cutNavigator->disconnect(this);
    m_seriesConfigurator->disconnect(this);
    m_cutNavigator->clear();
    m_seriesConfigurator->clearTable();
}

QWidget *MainWindow::createLeftPanel()
{
    auto *splitter = new QSplitter(Qt::Vertical, this);
    splitter->setFixedWidth(400);

    m_matrixBrowser = new FolderBrowser(tr("Load Folder: 2D Plot"), splitter);
    m_tableBrowser = new FolderBrowser(tr("Load Folder: 1D Plot"), splitter);
    splitter->addWidget(m_matrixBrowser);
    splitter->addWidget(m_tableBrowser);
    return splitter;
}

QWidget *MainWindow::createMatrixTab()
{
    m_matrixTab = new QWidget(this);
    auto *grid = new QGridLayout(m_matrixTab);

    m_heatmapPlot = createPlot(m_matrixTab);
    m_xCutPlot = createPlot(m_matrixTab);
    m_yCutPlot = createPlot(m_matrixTab);
    m_heatmapManager = new PlotManager(m_heatmapPlot, this);
    m_xCutManager = new PlotManager(m_xCutPlot, this);
    m_yCutManager = new PlotManager(m_yCutPlot, this);

    grid->addWidget(m_heatmapPlot, 0, 0);
    grid->addWidget(m_xCutPlot, 0, 1);
    grid->addWidget(m_yCutPlot, 0, 2);
    grid->addWidget(createPlotToolRow(m_heatmapManager, m_matrixTab), 1, 0);
    grid->addWidget(createPlotToolRow(m_xCutManager, m_matrixTab), 1, 1);
    grid->addWidget(createPlotToolRow(m_yCutManager, m_matrixTab), 1, 2);
    for (int column = 0; column < 3; ++column)
        grid->setColumnStretch(column, 1);

    auto *controls = new QFrame(m_matrixTab);
    auto *controlsLayout = new QVBoxLayout(controls);
    controlsLayout->addWidget(makeTitleLabel(tr("2D Plot Labels & Cut Controls:"), controls));

    m_matrixTitleEdit = new QLineEdit(tr("2D Image Plot"), controls);
    m_matrixXLabelEdit = new QLineEdit(tr("X-axis"), controls);
    m_matrixYLabelEdit = new QLineEdit(tr("Y-axis"), controls);
    m_colorbarLabelEdit = new QLineEdit(tr("Intensity"), controls);
    controlsLayout->addWidget(createLabeledEdit(tr("Plot Title:"), m_matrixTitleEdit, controls));
    controlsLayout->addWidget(createLabeledEdit(tr("X-axis Label:"), m_matrixXLabelEdit, controls));
    controlsLayout->addWidget(createLabeledEdit(tr("Y-axis Label:"), m_matrixYLabelEdit, controls));
    controlsLayout->addWidget(createLabeledEdit(tr("Colorbar Label:"), m_colorbarLabelEdit, controls));
    connect(m_matrixTitleEdit, &QLineEdit::editingFinished, this, &MainWindow::renderHeatmap);
    connect(m_matrixXLabelEdit, &QLineEdit::editingFinished, this, &MainWindow::onMatrixLabelEdited);
    connect(m_matrixYLabelEdit, &QLineEdit::editingFinished, this, &MainWindow::onMatrixLabelEdited);
    connect(m_colorbarLabelEdit, &QLineEdit::editingFinished, this, &MainWindow::onMatrixLabelEdited);

    controlsLayout->addWidget(new QLabel(tr("Direct Cut Index Input:"), controls));

    m_rowCutEdit = new QLineEdit(QStringLiteral("0"), controls);
    m_rowCutEdit->setValidator(new QIntValidator(0, 99999, m_rowCutEdit));
    m_columnCutEdit = new QLineEdit(QStringLiteral("0"), controls);
    m_columnCutEdit->setValidator(new QIntValidator(0, 99999, m_columnCutEdit));
    m_cutNavigator = new CutNavigator(m_rowCutEdit, m_columnCutEdit, this);

    auto addCutRow = [this, controls, controlsLayout](const QString &label, QLineEdit *edit, CutNavigator::Axis axis) {
        auto *row = new QHBoxLayout;
        row->addWidget(new QLabel(label, controls));
        row->addWidget(edit);
        auto *prevButton = new QPushButton(tr("Prev"), controls);
        auto *nextButton = new QPushButton(tr("Next"), controls);
        connect(prevButton, &QPushButton::clicked, this, [this, axis]() { m_cutNavigator->navigate(axis, -1); });
        connect(nextButton, &QPushButton::clicked, this, [this, axis]() { m_cutNavigator->navigate(axis, 1); });
        row->addWidget(prevButton);
        row->addWidget(nextButton);
        controlsLayout->addLayout(row);
    };
    addCutRow(tr("Y-Index for X-Cut:"), m_rowCutEdit, CutNavigator::Axis::Row);
    addCutRow(tr("X-Index for Y-Cut:"), m_columnCutEdit, CutNavigator::Axis::Column);

    grid->addWidget(controls, 2, 0);

    m_xCutPreview = createPreview(tr("X-Cut Data will appear here (Value vs X)"), m_matrixTab);
    m_yCutPreview = createPreview(tr("Y-Cut Data will appear here (Value vs Y)"), m_matrixTab);
    grid->addWidget(m_xCutPreview, 2, 1);
    grid->addWidget(m_yCutPreview, 2, 2);

    return m_matrixTab;
}

QWidget *MainWindow::createTableTab()
{
    m_tableTab = new QWidget(this);
    auto *grid = new QGridLayout(m_tableTab);

    auto *plotContainer = new QWidget(m_tableTab);
    auto *plotLayout = new QVBoxLayout(plotContainer);
    m_seriesPlot = createPlot(plotContainer);
    m_seriesManager = new PlotManager(m_seriesPlot, this);
    plotLayout->addWidget(m_seriesPlot);
    plotLayout->addWidget(createPlotToolRow(m_seriesManager, plotContainer));
    grid->addWidget(plotContainer, 0, 0);

    auto *labels = new QFrame(m_tableTab);
    auto *labelsLayout = new QVBoxLayout(labels);
    labelsLayout->addWidget(makeTitleLabel(tr("1D Plot Labels:"), labels));
    m_tableTitleEdit = new QLineEdit(tr("1D Line Plot"), labels);
    m_tableXLabelEdit = new QLineEdit(tr("X-axis"), labels);
    m_tableYLabelEdit = new QLineEdit(tr("Y-axis"), labels);
    labelsLayout->addWidget(createLabeledEdit(tr("Plot Title:"), m_tableTitleEdit, labels));
    labelsLayout->addWidget(createLabeledEdit(tr("X-axis Label:"), m_tableXLabelEdit, labels));
    labelsLayout->addWidget(createLabeledEdit(tr("Y-axis Label:"), m_tableYLabelEdit, labels));
    connect(m_tableTitleEdit, &QLineEdit::editingFinished, this, &MainWindow::onTableLabelEdited);
    connect(m_tableXLabelEdit, &QLineEdit::editingFinished, this, &MainWindow::onTableLabelEdited);
    connect(m_tableYLabelEdit, &QLineEdit::editingFinished, this, &MainWindow::onTableLabelEdited);
    grid->addWidget(labels, 1, 0);

    auto *data = new QFrame(m_tableTab);
    auto *dataLayout = new QVBoxLayout(data);
    dataLayout->addWidget(makeTitleLabel(tr("1D Data Values:"), data));
    m_tablePreview = createPreview(tr("1D Data will appear here (X vs Y)"), data);
    dataLayout->addWidget(m_tablePreview);
    grid->addWidget(data, 0, 1);

    auto *seriesFrame = new QFrame(m_tableTab);
    auto *seriesFrameLayout = new QVBoxLayout(seriesFrame);
    seriesFrameLayout->addWidget(makeTitleLabel(tr("Plot Series"), seriesFrame));

    auto *scrollArea = new QScrollArea(seriesFrame);
    scrollArea->setWidgetResizable(true);
    scrollArea->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    auto *rowsContainer = new QWidget(scrollArea);
    m_seriesLayout = new QVBoxLayout(rowsContainer);
    m_seriesLayout->setAlignment(Qt::AlignTop);
    scrollArea->setWidget(rowsContainer);
    seriesFrameLayout->addWidget(scrollArea);

    m_seriesConfigurator = new SeriesConfigurator(m_seriesLayout, this);

    auto *buttons = new QHBoxLayout;
    auto *addButton = new QPushButton(tr("Add Plot Series"), seriesFrame);
    auto *removeButton = new QPushButton(tr("Remove Last Series"), seriesFrame);
    connect(addButton, &QPushButton::clicked, this, [this]() { m_seriesConfigurator->addSeries(); });
    connect(removeButton, &QPushButton::clicked, this, [this]() { m_seriesConfigurator->removeLastSeries(); });
    buttons->addWidget(addButton);
    buttons->addWidget(removeButton);
    seriesFrameLayout->addLayout(buttons);
    grid->addWidget(seriesFrame, 1, 1);

    return m_tableTab;
}

QCustomPlot *MainWindow::createPlot(QWidget *parent)
{
    auto *plot = new QCustomPlot(parent);
    plot->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    plot->setMinimumSize(200, 200);
    return plot;
}

QWidget *MainWindow::createPlotToolRow(PlotManager *manager, QWidget *parent)
{
    auto *row = new QWidget(parent);
    auto *layout = new QHBoxLayout(row);
    layout->setContentsMargins(0, 0, 0, 0);

    auto *autoscaleButton = new QPushButton(tr("Autoscale"), row);
    auto *saveButton = new QPushButton(tr("Save ..."), row);
    connect(autoscaleButton, &QPushButton::clicked, manager, &PlotManager::autoscale);
    connect(saveButton, &QPushButton::clicked, this, [this, manager]() { saveImage(manager); });

    layout->addWidget(autoscaleButton);
    layout->addWidget(saveButton);
    layout->addStretch();
    return row;
}

QWidget *MainWindow::createLabeledEdit(const QString &label, QLineEdit *edit, QWidget *parent)
{
    auto *row = new QWidget(parent);
    auto *layout = new QHBoxLayout(row);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(new QLabel(label, row));
    layout->addWidget(edit);
    return row;
}

QTextEdit *MainWindow::createPreview(const QString &placeholder, QWidget *parent)
{
    auto *preview = new QTextEdit(parent);
    preview->setReadOnly(true);
    preview->setPlaceholderText(placeholder);
    preview->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    return preview;
}

void MainWindow::loadMatrixFile(const QString &path)
{
    const QString fileName = QFileInfo(path).fileName();
    m_matrixPath = path;
    m_heatmapManager->clear();
    m_cutNavigator->clear();

    if (!dv::matrix_delimiter_for_path(toLocalPath(path))) {
        showWarning(tr("Unsupported 2D File Type"),
                    tr("File '%1' is not a supported 2D type (.csv, .txt).").arg(fileName));
        resetMatrixState();
        return;
    }

    try {
        auto matrix = std::make_unique<dv::MatrixData>(dv::parse_matrix(toLocalPath(path)));
        if (matrix->positionalFallback) {
            showWarning(tr("2D Data Format Warning"),
                        tr("Could not parse '%1' with first column as Y-axis and header as X-axis. "
                           "Reason: %2.\n\nLoaded as a raw matrix with numerical indices.")
                            .arg(fileName, QString::fromStdString(matrix->fallbackReason)));
        }
        if (matrix->coordinatesCoerced) {
            showWarning(tr("Coordinate Conversion Warning"),
                        tr("Some non-numeric values were found in X or Y coordinates of '%1' "
                           "and converted to NaN. These might affect plotting accuracy.").arg(fileName));
        }
        m_matrix = std::move(matrix);
    } catch (const std::exception &e) {
        showCritical(tr("2D Data Load Error"),
                     tr("Failed to load 2D data from '%1':\n%2").arg(fileName, QString::fromLocal8Bit(e.what())));
        resetMatrixState();
        return;
    }

    qDebug().noquote() << "Loaded 2D data" << path << m_matrix->rowCount() << "x" << m_matrix->columnCount();

    {
        QSignalBlocker blocker(m_matrixTitleEdit);
        m_matrixTitleEdit->setText(fileName);
    }
    renderHeatmap();
    m_cutNavigator->setMatrix(m_matrix.get());
    m_tabWidget->setCurrentWidget(m_matrixTab);
}

void MainWindow::loadTableFile(const QString &path)
{
    const QString fileName = QFileInfo(path).fileName();
    m_tablePath = path;
    m_seriesConfigurator->clearTable();
    m_table.reset();

    std::unique_ptr<dv::TableData> table;
    try {
        table = std::make_unique<dv::TableData>(dv::parse_table(toLocalPath(path)));
    } catch (const std::exception &e) {
        showCritical(tr("1D Data Load Error"),
                     tr("Failed to load 1D data from '%1':\n%2").arg(fileName, QString::fromLocal8Bit(e.what())));
        m_seriesConfigurator->clearAllSeries();
        m_seriesConfigurator->addSeries(0, 0, false);
        return;
    }

    if (table->empty()) {
        showWarning(tr("Empty 1D Data"), tr("File '%1' is empty or contains no valid data.").arg(fileName));
        return;
    }

    qDebug().noquote() << "Loaded 1D data" << path << table->rowCount() << "rows," << table->columnCount() << "columns";

    m_table = std::move(table);
    m_seriesConfigurator->setTable(m_table.get());
    m_tabWidget->setCurrentWidget(m_tableTab);
}

void MainWindow::resetMatrixState()
{
    m_cutNavigator->clear();
    m_matrix.reset();
    m_matrixPath.clear();
    m_heatmapManager->clear();
}

void MainWindow::resetTableState()
{
    m_seriesConfigurator->setTable(nullptr);
    m_table.reset();
    m_tablePath.clear();
}

void MainWindow::setTheme(Theme theme)
{
    m_theme = theme;
    setStyleSheet(themeStyleSheet(m_theme));
#ifdef DASHVIEW_ENABLE_PLOT_DEBUG
    qDebug() << "  setTheme()" << themeName(m_theme);
#endif
}

Theme MainWindow::theme() const
{
    return m_theme;
}

void MainWindow::setMessageBoxesEnabled(bool enabled)
{
    m_messageBoxesEnabled = enabled;
}

QString MainWindow::lastMessageTitle() const
{
    return m_lastMessageTitle;
}

void MainWindow::toggleTheme()
{
    setTheme(toggledTheme(m_theme));
}

void MainWindow::renderHeatmap()
{
    if (!m_matrix)
        return;

    PlotLabels labels;
    labels.title = m_matrixTitleEdit->text();
    labels.xLabel = m_matrixXLabelEdit->text();
    labels.yLabel = m_matrixYLabelEdit->text();
    labels.valueLabel = m_colorbarLabelEdit->text();
    m_heatmapManager->plotHeatmap(*m_matrix, labels);
}

void MainWindow::onMatrixLabelEdited()
{
    if (!m_matrix)
        return;
    renderHeatmap();
    m_cutNavigator->recomputeSlices();
}

void MainWindow::onSlicesChanged()
{
    const CutSlice &xCut = m_cutNavigator->xCut();
    const CutSlice &yCut = m_cutNavigator->yCut();
    const QString xLabel = m_matrixXLabelEdit->text();
    const QString yLabel = m_matrixYLabelEdit->text();
    const QString valueLabel = m_colorbarLabelEdit->text();

    PlotSeries xSeries;
    xSeries.x = xCut.coordinates;
    xSeries.y = xCut.values;
    xSeries.label = tr("X-Cut Data");
    m_xCutManager->plotSeries(QVector<PlotSeries>{xSeries}, PlotLabels{xCut.title, xLabel, valueLabel, QString()});
    m_xCutPreview->setPlainText(formatCutPreview(tr("Y-Coordinate"), xCut.fixedCoordinate, xLabel, valueLabel,
                                                 xCut.coordinates, xCut.values));

    PlotSeries ySeries;
    ySeries.x = yCut.coordinates;
    ySeries.y = yCut.values;
    ySeries.label = tr("Y-Cut Data");
    m_yCutManager->plotSeries(QVector<PlotSeries>{ySeries}, PlotLabels{yCut.title, yLabel, valueLabel, QString()});
    m_yCutPreview->setPlainText(formatCutPreview(tr("X-Coordinate"), yCut.fixedCoordinate, yLabel, valueLabel,
                                                 yCut.coordinates, yCut.values));
}

void MainWindow::onSlicesCleared()
{
    m_xCutManager->clear();
    m_yCutManager->clear();
    m_xCutPreview->clear();
    m_yCutPreview->clear();
}

void MainWindow::onSeriesPlotted()
{
    PlotLabels labels;
    labels.title = m_tableTitleEdit->text();
    labels.xLabel = m_tableXLabelEdit->text();
    labels.yLabel = m_tableYLabelEdit->text();
    m_seriesManager->plotSeries(m_seriesConfigurator->plottedSeries(), labels);
    m_tablePreview->setPlainText(m_seriesConfigurator->previewText());
}

void MainWindow::onSeriesCleared()
{
    m_seriesManager->clear();
    m_tablePreview->clear();
}

void MainWindow::onTableLabelEdited()
{
    if (m_table)
        m_seriesConfigurator->recomputeAll();
}

void MainWindow::saveImage(PlotManager *manager)
{
    const QString path = QFileDialog::getSaveFileName(
        this,
        tr("Save Plot"),
        QString(),
        tr("PNG image (*.png);;JPEG image (*.jpg);;PDF document (*.pdf)"));
    if (path.isEmpty())
        return;

    QString errorMessage;
    if (!manager->saveImage(path, &errorMessage)) {
        if (errorMessage.isEmpty())
            errorMessage = tr("Failed to save plot.");
        showCritical(tr("Save Plot"), errorMessage);
    }
}

void MainWindow::showWarning(const QString &title, const QString &message)
{
    qWarning().noquote() << title << ":" << message;
    m_lastMessageTitle = title;
    if (m_messageBoxesEnabled)
        QMessageBox::warning(this, title, message);
}

void MainWindow::showInformation(const QString &title, const QString &message)
{
    qDebug().noquote() << title << ":" << message;
    m_lastMessageTitle = title;
    if (m_messageBoxesEnabled)
        QMessageBox::information(this, title, message);
}

void MainWindow::showCritical(const QString &title, const QString &message)
{
    qWarning().noquote() << title << ":" << message;
    m_lastMessageTitle = title;
    if (m_messageBoxesEnabled)
        QMessageBox::critical(this, title, message);
}

const dv::MatrixData *MainWindow::matrix() const
{
    return m_matrix.get();
}

const dv::TableData *MainWindow::table() const
{
    return m_table.get();
}

CutNavigator *MainWindow::cutNavigator() const
{
    return m_cutNavigator;
}

SeriesConfigurator *MainWindow::seriesConfigurator() const
{
    return m_seriesConfigurator;
}

FolderBrowser *MainWindow::matrixBrowser() const
{
    return m_matrixBrowser;
}

FolderBrowser *MainWindow::tableBrowser() const
{
    return m_tableBrowser;
}

PlotManager *MainWindow::heatmapManager() const
{
    return m_heatmapManager;
}

PlotManager *MainWindow::xCutManager() const
{
    return m_xCutManager;
}

PlotManager *MainWindow::yCutManager() const
{
    return m_yCutManager;
}

PlotManager *MainWindow::seriesManager() const
{
    return m_seriesManager;
}

QTabWidget *MainWindow::tabWidget() const
{
    return m_tabWidget;
}

QWidget *MainWindow::matrixTab() const
{
    return m_matrixTab;
}

QWidget *MainWindow::tableTab() const
{
    return m_tableTab;
}

QLineEdit *MainWindow::matrixTitleEdit() const
{
    return m_matrixTitleEdit;
}

QLineEdit *MainWindow::matrixXLabelEdit() const
{
    return m_matrixXLabelEdit;
}

QLineEdit *MainWindow::colorbarLabelEdit() const
{
    return m_colorbarLabelEdit;
}

QLineEdit *MainWindow::rowCutEdit() const
{
    return m_rowCutEdit;
}

QLineEdit *MainWindow::columnCutEdit() const
{
    return m_columnCutEdit;
}

QTextEdit *MainWindow::xCutPreview() const
{
    return m_xCutPreview;
}

QTextEdit *MainWindow::yCutPreview() const
{
    return m_yCutPreview;
}

QLineEdit *MainWindow::tableTitleEdit() const
{
    return m_tableTitleEdit;
}

QTextEdit *MainWindow::tablePreview() const
{
    return m_tablePreview;
}
