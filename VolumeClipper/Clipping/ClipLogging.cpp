#include "ClipLogging.h"

Q_LOGGING_CATEGORY(lcSelection, "volumeclipper.selection")
Q_LOGGING_CATEGORY(lcProjection, "volumeclipper.projection")
Q_LOGGING_CATEGORY(lcRaster, "volumeclipper.raster")
Q_LOGGING_CATEGORY(lcHistory, "volumeclipper.history")
Q_LOGGING_CATEGORY(lcSession, "volumeclipper.session")
