#pragma once
#include <QString>

struct AppConfig
{
    QString language = "ru";   // ru/en

    int maxUndo = 10;            // 1..100
    int compressionLevel = -1;   // -1 (zlib по умолчанию) или 0..9

    bool logToFile = true;
    QString logRules;            // правила QLoggingCategory, например "volumeclipper.*.debug=true"

    static AppConfig loadOrCreateDefault(const QString& filePath);
    bool save(const QString& filePath) const;

    // Приводит значения к допустимым диапазонам
    void sanitize();
};
