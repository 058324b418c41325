#include "Window/MainWindow/MainWindow.h"
#include "Services/AppConfig.h"
#include "Services/LogSetup.h"

#include <QApplication>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QStyleFactory>
#include <QSurfaceFormat>
#include <QTimer>
#include <QVTKOpenGLNativeWidget.h>
#include <vtkOutputWindow.h>

int main(int argc, char* argv[])
{
    vtkOutputWindow::SetGlobalWarningDisplay(false);

    QSurfaceFormat::setDefaultFormat(QVTKOpenGLNativeWidget::defaultFormat());
    QApplication app(argc, argv);
    app.setApplicationName("VolumeClipper");

    app.setStyle(QStyleFactory::create("Fusion"));

    const QString configPath = QCoreApplication::applicationDirPath() + "/VolumeClipper.xml";
    const AppConfig config = AppConfig::loadOrCreateDefault(configPath);
    LogSetup::install(config);
    qCInfo(lcApp) << "config" << configPath << "maxUndo" << config.maxUndo
                  << "compressionLevel" << config.compressionLevel;

    // --- если есть аргумент пути ---
    QString path;
    if (argc > 1) {
        const QString arg = QString::fromLocal8Bit(argv[1]);
        const QFileInfo fi(arg);
        if (fi.isDir())
            path = fi.absoluteFilePath();
        else if (fi.isFile())
            path = fi.absolutePath();
        else
            qCWarning(lcApp) << "path does not exist:" << arg;
    }

    if (path.isEmpty())
        path = QFileDialog::getExistingDirectory(nullptr, QObject::tr("Open DICOM folder"), QDir::homePath());

    if (path.isEmpty())
    {
        LogSetup::shutdown();
        return 0;
    }

    int rc = 0;
    {
        MainWindow w(config, nullptr, path);
        w.show();
        QTimer::singleShot(0, &w, &MainWindow::onOpenStudy);
        rc = app.exec();
    }

    LogSetup::shutdown();
    return rc;
}
