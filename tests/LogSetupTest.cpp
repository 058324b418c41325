#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "Services/AppConfig.h"
#include "Services/LogSetup.h"

TEST(LogSetup, FirstWritableCandidateWins)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    const QString first = tmp.filePath("app/logs");
    const QString second = tmp.filePath("home/logs");
    EXPECT_EQ(LogSetup::logDirectory({ first, second }), first);
    EXPECT_TRUE(QDir(first).exists());
}

TEST(LogSetup, FallsBackWhenFirstCandidateCannotBeCreated)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    // обычный файл на месте каталога: mkpath под ним не пройдёт
    QFile blocker(tmp.filePath("app"));
    ASSERT_TRUE(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    const QString fallback = tmp.filePath("home/logs");
    EXPECT_EQ(LogSetup::logDirectory({ tmp.filePath("app/logs"), fallback }), fallback);
}

TEST(LogSetup, NoCandidatesMeansNoDirectory)
{
    EXPECT_TRUE(LogSetup::logDirectory(QStringList{}).isEmpty());
}

TEST(LogSetup, FileLoggingOffWritesNothing)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    AppConfig cfg;
    cfg.logToFile = false;
    EXPECT_TRUE(LogSetup::install(cfg, tmp.path()).isEmpty());
    EXPECT_FALSE(QFile::exists(tmp.filePath("volumeclipper.log")));
}

TEST(LogSetup, MessagesAreMirroredToFile)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    AppConfig cfg;
    const QString path = LogSetup::install(cfg, tmp.path());
    ASSERT_EQ(path, tmp.filePath("volumeclipper.log"));

    qCWarning(lcApp) << "mask snapshot mismatch";
    LogSetup::shutdown();

    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString text = QString::fromUtf8(f.readAll());
    EXPECT_TRUE(text.contains("WARN volumeclipper.app: mask snapshot mismatch")) << text.toStdString();
}
