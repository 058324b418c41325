#include "LogSetup.h"
#include "AppConfig.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <memory>

Q_LOGGING_CATEGORY(lcApp, "volumeclipper.app")

namespace
{
    std::unique_ptr<QFile> gLogFile;
    QMutex gLogMutex;
    QtMessageHandler gPrevHandler = nullptr;
    bool gInstalled = false;

    const char* levelName(QtMsgType type)
    {
        switch (type)
        {
        case QtDebugMsg: return "DEBUG";
        case QtInfoMsg: return "INFO";
        case QtWarningMsg: return "WARN";
        case QtCriticalMsg: return "CRIT";
        case QtFatalMsg: return "FATAL";
        }
        return "?";
    }

    void fileMessageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
    {
        {
            QMutexLocker lock(&gLogMutex);
            if (gLogFile && gLogFile->isOpen())
            {
                QTextStream ts(gLogFile.get());
                ts << QDateTime::currentDateTime().toString(Qt::ISODateWithMs)
                   << ' ' << levelName(type)
                   << ' ' << (ctx.category ? ctx.category : "default")
                   << ": " << msg << '\n';
                ts.flush();
            }
        }

        if (gPrevHandler)
            gPrevHandler(type, ctx, msg);
    }

    bool isWritableDir(const QString& path)
    {
        if (!QDir().mkpath(path))
            return false;
        const QFileInfo fi(path);
        return fi.isDir() && fi.isWritable();
    }
}

namespace LogSetup
{
    QString logDirectory(const QStringList& candidates)
    {
        for (const QString& dir : candidates)
        {
            if (!dir.isEmpty() && isWritableDir(dir))
                return dir;
        }
        return {};
    }

    QString logDirectory()
    {
        return logDirectory({ QCoreApplication::applicationDirPath() + "/logs",
                              QDir::homePath() + "/.volumeclipper/logs" });
    }

    QString install(const AppConfig& config)
    {
        if (!config.logToFile)
            return install(config, QString());
        return install(config, logDirectory());
    }

    QString install(const AppConfig& config, const QString& dir)
    {
        if (!config.logRules.isEmpty())
            QLoggingCategory::setFilterRules(QString(config.logRules).replace(';', '\n'));

        if (!config.logToFile)
            return {};

        if (dir.isEmpty())
        {
            qCWarning(lcApp) << "no writable log directory, file logging disabled";
            return {};
        }

        const QString path = dir + "/volumeclipper.log";
        {
            QMutexLocker lock(&gLogMutex);
            if (gLogFile && gLogFile->fileName() != path)
                gLogFile.reset();
            if (!gLogFile)
                gLogFile = std::make_unique<QFile>(path);
            if (!gLogFile->isOpen() && !gLogFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
                gLogFile.reset();
        }

        if (!gLogFile)
        {
            qCWarning(lcApp) << "cannot open log file" << path;
            return {};
        }

        if (!gInstalled)
        {
            gPrevHandler = qInstallMessageHandler(fileMessageHandler);
            gInstalled = true;
        }
        qCInfo(lcApp) << "logging to" << path;
        return path;
    }

    void shutdown()
    {
        if (gInstalled)
        {
            qInstallMessageHandler(gPrevHandler);
            gPrevHandler = nullptr;
            gInstalled = false;
        }

        QMutexLocker lock(&gLogMutex);
        if (gLogFile)
        {
            gLogFile->close();
            gLogFile.reset();
        }
    }
}
