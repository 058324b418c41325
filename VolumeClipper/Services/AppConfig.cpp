#include "AppConfig.h"

#include <QFile>
#include <QSaveFile>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>
#include <QDir>
#include <QFileInfo>

static bool parseBool(const QString& s, bool fallback)
{
    const QString v = s.trimmed().toLower();
    if (v == "on" || v == "true" || v == "1" || v == "yes") return true;
    if (v == "off" || v == "false" || v == "0" || v == "no") return false;
    return fallback;
}

void AppConfig::sanitize()
{
    if (language != "ru" && language != "en")
        language = "ru";

    maxUndo = qBound(1, maxUndo, 100);

    if (compressionLevel < -1 || compressionLevel > 9)
        compressionLevel = -1;
}

AppConfig AppConfig::loadOrCreateDefault(const QString& filePath)
{
    AppConfig cfg;

    QFile f(filePath);
    if (!f.exists())
    {
        const QDir dir = QFileInfo(filePath).absoluteDir();
        if (!dir.exists())
            QDir().mkpath(dir.absolutePath());
        cfg.save(filePath);
        return cfg;
    }

    if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
        return cfg;

    QXmlStreamReader xr(&f);

    // секция, внутри которой стоим: ui / clipping / logging
    QString section;

    while (!xr.atEnd())
    {
        xr.readNext();

        if (xr.isStartElement())
        {
            const auto name = xr.name();

            if (name == u"ui" || name == u"clipping" || name == u"logging")
            {
                section = name.toString();
            }
            else if (section == "ui" && name == u"language")
            {
                cfg.language = xr.readElementText().trimmed().toLower();
            }
            else if (section == "clipping" && name == u"maxUndo")
            {
                bool ok = false;
                const int v = xr.readElementText().trimmed().toInt(&ok);
                if (ok) cfg.maxUndo = v;
            }
            else if (section == "clipping" && name == u"compressionLevel")
            {
                bool ok = false;
                const int v = xr.readElementText().trimmed().toInt(&ok);
                if (ok) cfg.compressionLevel = v;
            }
            else if (section == "logging" && name == u"file")
            {
                cfg.logToFile = parseBool(xr.readElementText(), cfg.logToFile);
            }
            else if (section == "logging" && name == u"rules")
            {
                cfg.logRules = xr.readElementText().trimmed();
            }
        }
        else if (xr.isEndElement())
        {
            const auto name = xr.name();
            if (name == u"ui" || name == u"clipping" || name == u"logging")
                section.clear();
        }
    }

    cfg.sanitize();
    return cfg;
}

bool AppConfig::save(const QString& filePath) const
{
    QSaveFile f(filePath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text))
        return false;

    QXmlStreamWriter xw(&f);
    xw.setAutoFormatting(true);
    xw.writeStartDocument("1.0");
    xw.writeStartElement("VolumeClipper");
    xw.writeAttribute("version", "1");

    xw.writeStartElement("ui");
    xw.writeTextElement("language", language);
    xw.writeEndElement(); // ui

    xw.writeStartElement("clipping");
    xw.writeTextElement("maxUndo", QString::number(maxUndo));
    xw.writeTextElement("compressionLevel", QString::number(compressionLevel));
    xw.writeEndElement(); // clipping

    xw.writeStartElement("logging");
    xw.writeTextElement("file", logToFile ? "on" : "off");
    xw.writeTextElement("rules", logRules);
    xw.writeEndElement(); // logging

    xw.writeEndElement(); // VolumeClipper
    xw.writeEndDocument();

    return f.commit();
}
