#pragma once

#include <QLoggingCategory>

namespace mdv {

Q_DECLARE_LOGGING_CATEGORY(lcLoader)
Q_DECLARE_LOGGING_CATEGORY(lcSeries)
Q_DECLARE_LOGGING_CATEGORY(lcPrefetch)
Q_DECLARE_LOGGING_CATEGORY(lcPlayback)
Q_DECLARE_LOGGING_CATEGORY(lcRender)
Q_DECLARE_LOGGING_CATEGORY(lcProbe)
Q_DECLARE_LOGGING_CATEGORY(lcSession)

// Installs the message pattern used by the viewer executable.
void InstallMessagePattern();

}  // namespace mdv
