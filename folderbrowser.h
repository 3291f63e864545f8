#ifndef FOLDERBROWSER_H
#define FOLDERBROWSER_H

#include <QWidget>
#include <QString>

class QFileSystemModel;
class QLineEdit;
class QModelIndex;
class QPushButton;
class QTreeView;

class FolderBrowser : public QWidget
{
    Q_OBJECT
public:
    explicit FolderBrowser(const QString &title, QWidget *parent = nullptr);

    void setRootFolder(const QString &path);
    QString rootFolder() const;
    void activatePath(const QString &path);

    QTreeView *treeView() const;
    QLineEdit *pathEdit() const;

signals:
    void fileSelected(const QString &path);
    void directorySelected(const QString &path);
    void rootFolderChanged(const QString &path);

private slots:
    void browse();
    void onIndexClicked(const QModelIndex &index);

private:
    QFileSystemModel *m_model;
    QTreeView *m_treeView;
    QLineEdit *m_pathEdit;
    QPushButton *m_browseButton;
    QString m_rootFolder;
};

#endif // FOLDERBROWSER_H
