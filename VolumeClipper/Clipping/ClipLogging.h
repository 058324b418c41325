#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcSelection)
Q_DECLARE_LOGGING_CATEGORY(lcProjection)
Q_DECLARE_LOGGING_CATEGORY(lcRaster)
Q_DECLARE_LOGGING_CATEGORY(lcHistory)
Q_DECLARE_LOGGING_CATEGORY(lcSession)
