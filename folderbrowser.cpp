#include "folderbrowser.h"

#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QFileSystemModel>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QTreeView>
#include <QVBoxLayout>

FolderBrowser::FolderBrowser(const QString &title, QWidget *parent)
    : QWidget(parent)
    , m_model(new QFileSystemModel(this))
    , m_treeView(new QTreeView(this))
    , m_pathEdit(new QLineEdit(tr("No folder selected"), this))
    , m_browseButton(new QPushButton(tr("Browse ..."), this))
{
    m_model->setFilter(QDir::AllDirs | QDir::Files | QDir::NoDotAndDotDot);

    m_treeView->setModel(m_model);
    m_treeView->setHeaderHidden(true);
    for (int column = 1; column < m_model->columnCount(); ++column)
        m_treeView->hideColumn(column);
    m_treeView->setRootIndex(QModelIndex());

    m_pathEdit->setReadOnly(true);

    auto *titleLabel = new QLabel(title, this);
    titleLabel->setObjectName(QStringLiteral("titleLabel"));

    auto *pathLayout = new QHBoxLayout;
    pathLayout->addWidget(m_pathEdit);
    pathLayout->addWidget(m_browseButton);

    auto *layout = new QVBoxLayout(this);
    layout->addWidget(titleLabel);
    layout->addLayout(pathLayout);
    layout->addWidget(m_treeView);

    connect(m_browseButton, &QPushButton::clicked, this, &FolderBrowser::browse);
    connect(m_treeView, &QTreeView::clicked, this, &FolderBrowser::onIndexClicked);
}

void FolderBrowser::setRootFolder(const QString &path)
{
    if (path.isEmpty())
        return;

    m_rootFolder = QDir(path).absolutePath();
    m_pathEdit->setText(QDir::toNativeSeparators(m_rootFolder));
    m_treeView->setRootIndex(m_model->setRootPath(m_rootFolder));
    emit rootFolderChanged(m_rootFolder);
}

QString FolderBrowser::rootFolder() const
{
    return m_rootFolder;
}

void FolderBrowser::activatePath(const QString &path)
{
    const QFileInfo info(path);
    if (info.isDir())
    {
        qDebug().noquote() << "Directory selected:" << info.absoluteFilePath();
        emit directorySelected(info.absoluteFilePath());
    }
    else
    {
        qDebug().noquote() << "File selected:" << info.absoluteFilePath();
        emit fileSelected(info.absoluteFilePath());
    }
}

QTreeView *FolderBrowser::treeView() const
{
    return m_treeView;
}

QLineEdit *FolderBrowser::pathEdit() const
{
    return m_pathEdit;
}

void FolderBrowser::browse()
{
    const QString folder = QFileDialog::getExistingDirectory(this, tr("Select Data Root Folder"), m_rootFolder);
    if (!folder.isEmpty())
        setRootFolder(folder);
}

void FolderBrowser::onIndexClicked(const QModelIndex &index)
{
    if (!index.isValid())
        return;
    activatePath(m_model->filePath(index));
}
