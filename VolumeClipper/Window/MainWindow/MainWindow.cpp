#include "MainWindow.h"

#include "Window/Render/RenderView.h"
#include "Services/LogSetup.h"
#include "Services/VolumeLoader.h"
#include <QApplication>
#include <QFileDialog>
#include <QLabel>
#include <QShortcut>
#include <QStatusBar>
#include <QTimer>

MainWindow::MainWindow(const AppConfig& config, QWidget* parent, const QString& path)
    : QMainWindow(parent)
    , mDicomPath(path)
    , mConfig(config)
{
    setWindowTitle(tr("Volume Clipper"));
    setMinimumSize(960, 640);
    resize(1280, 800);

    buildUi();
    wireSignals();
}

void MainWindow::buildUi()
{
    mRenderView = new RenderView(this);
    mRenderView->setObjectName("RenderView");
    mRenderView->applyConfig(mConfig);
    setCentralWidget(mRenderView);

    mStatusText = new QLabel(tr("Ready"), this);
    statusBar()->addWidget(mStatusText, 1);
}

void MainWindow::wireSignals()
{
    connect(mRenderView, &RenderView::showInfo, this, &MainWindow::showInfo);
    connect(mRenderView, &RenderView::showWarning, this, &MainWindow::showWarning);

    auto* scOpen = new QShortcut(QKeySequence::Open, this);
    connect(scOpen, &QShortcut::activated, this, &MainWindow::onOpenFolder);
}

void MainWindow::StartLoading()
{
    mLoading = true;
    if (centralWidget()) centralWidget()->setEnabled(false);
    QApplication::setOverrideCursor(Qt::BusyCursor);
    qApp->processEvents(QEventLoop::ExcludeUserInputEvents);
}

void MainWindow::StopLoading()
{
    while (QApplication::overrideCursor())
        QApplication::restoreOverrideCursor();

    if (centralWidget()) centralWidget()->setEnabled(true);
    mLoading = false;
}

void MainWindow::onOpenFolder()
{
    if (mLoading) return;

    const QString dir = QFileDialog::getExistingDirectory(this, tr("Open DICOM folder"), mDicomPath);
    if (dir.isEmpty())
        return;

    mDicomPath = dir;
    onOpenStudy();
}

void MainWindow::onOpenStudy()
{
    if (mDicomPath.isEmpty())
        return;

    showInfo(tr("Reading DICOM series…"));
    StartLoading();

    const auto res = VolumeLoader::loadFolder(mDicomPath);
    StopLoading();

    if (!res.ok())
    {
        showWarning(res.error);
        return;
    }

    if (!res.seriesDescription.isEmpty())
        setWindowTitle(tr("Volume Clipper: %1").arg(res.seriesDescription));
    mRenderView->setVolume(res.image);
}

void MainWindow::showInfo(const QString& text)
{
    if (mStatusText) mStatusText->setText(text);
}

void MainWindow::showWarning(const QString& text)
{
    qCWarning(lcApp) << text;
    if (mStatusText) mStatusText->setText(text);
}
