#pragma once
#include <QLoggingCategory>
#include <QString>
#include <QStringList>

struct AppConfig;

Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace LogSetup
{
    // Правила фильтра из конфига + зеркало сообщений в файл (если включено).
    // Возвращает путь к файлу журнала или пустую строку.
    QString install(const AppConfig& config);
    // То же, но журнал пишется в заданный каталог
    QString install(const AppConfig& config, const QString& directory);

    // Каталог журналов: <app>/logs, если туда можно писать, иначе ~/.volumeclipper/logs
    QString logDirectory();
    // Первый из кандидатов, который удалось создать и куда можно писать
    QString logDirectory(const QStringList& candidates);

    // Снять обработчик и закрыть файл
    void shutdown();
}
