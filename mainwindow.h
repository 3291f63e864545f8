#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QString>

#include <memory>

#include "theme.h"

namespace dv {
struct MatrixData;
struct TableData;
}

class CutNavigator;
class FolderBrowser;
class PlotManager;
class QCustomPlot;
class QLineEdit;
class QPushButton;
class QTabWidget;
class QTextEdit;
class QVBoxLayout;
class SeriesConfigurator;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

    void loadMatrixFile(const QString &path);
    void loadTableFile(const QString &path);
    void resetMatrixState();
    void resetTableState();

    void setTheme(Theme theme);
    Theme theme() const;

    // Message boxes are modal; with them disabled messages are only logged.
    void setMessageBoxesEnabled(bool enabled);
    QString lastMessageTitle() const;

    const dv::MatrixData *matrix() const;
    const dv::TableData *table() const;
    CutNavigator *cutNavigator() const;
    SeriesConfigurator *seriesConfigurator() const;
    FolderBrowser *matrixBrowser() const;
    FolderBrowser *tableBrowser() const;
    PlotManager *heatmapManager() const;
    PlotManager *xCutManager() const;
    PlotManager *yCutManager() const;
    PlotManager *seriesManager() const;
    QTabWidget *tabWidget() const;
    QWidget *matrixTab() const;
    QWidget *tableTab() const;
    QLineEdit *matrixTitleEdit() const;
    QLineEdit *matrixXLabelEdit() const;
    QLineEdit *colorbarLabelEdit() const;
    QLineEdit *rowCutEdit() const;
    QLineEdit *columnCutEdit() const;
    QTextEdit *xCutPreview() const;
    QTextEdit *yCutPreview() const;
    QLineEdit *tableTitleEdit() const;
    QTextEdit *tablePreview() const;

private slots:
    void toggleTheme();
    void renderHeatmap();
    void onMatrixLabelEdited();
    void onSlicesChanged();
    void onSlicesCleared();
    void onSeriesPlotted();
    void onSeriesCleared();
    void onTableLabelEdited();
    void showWarning(const QString &title, const QString &message);
    void showInformation(const QString &title, const QString &message);

private:
    QWidget *createLeftPanel();
    QWidget *createMatrixTab();
    QWidget *createTableTab();
    QCustomPlot *createPlot(QWidget *parent);
    QWidget *createPlotToolRow(PlotManager *manager, QWidget *parent);
    QWidget *createLabeledEdit(const QString &label, QLineEdit *edit, QWidget *parent);
    QTextEdit *createPreview(const QString &placeholder, QWidget *parent);
    void saveImage(PlotManager *manager);
    void showCritical(const QString &title, const QString &message);

    FolderBrowser *m_matrixBrowser;
    FolderBrowser *m_tableBrowser;
    QTabWidget *m_tabWidget;
    QWidget *m_matrixTab;
    QWidget *m_tableTab;
    QPushButton *m_themeButton;

    QCustomPlot *m_heatmapPlot;
    QCustomPlot *m_xCutPlot;
    QCustomPlot *m_yCutPlot;
    QCustomPlot *m_seriesPlot;
    PlotManager *m_heatmapManager;
    PlotManager *m_xCutManager;
    PlotManager *m_yCutManager;
    PlotManager *m_seriesManager;

    QLineEdit *m_matrixTitleEdit;
    QLineEdit *m_matrixXLabelEdit;
    QLineEdit *m_matrixYLabelEdit;
    QLineEdit *m_colorbarLabelEdit;
    QLineEdit *m_rowCutEdit;
    QLineEdit *m_columnCutEdit;
    QTextEdit *m_xCutPreview;
    QTextEdit *m_yCutPreview;

    QLineEdit *m_tableTitleEdit;
    QLineEdit *m_tableXLabelEdit;
    QLineEdit *m_tableYLabelEdit;
    QTextEdit *m_tablePreview;
    QVBoxLayout *m_seriesLayout;

    CutNavigator *m_cutNavigator;
    SeriesConfigurator *m_seriesConfigurator;

    std::unique_ptr<dv::MatrixData> m_matrix;
    std::unique_ptr<dv::TableData> m_table;
    QString m_matrixPath;
    QString m_tablePath;

    Theme m_theme;
    bool m_messageBoxesEnabled;
    QString m_lastMessageTitle;
};
#endif // MAINWINDOW_H
