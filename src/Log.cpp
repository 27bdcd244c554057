#include "mdv/Log.h"

namespace mdv {

Q_LOGGING_CATEGORY(lcLoader, "mdv.loader")
Q_LOGGING_CATEGORY(lcSeries, "mdv.series")
Q_LOGGING_CATEGORY(lcPrefetch, "mdv.prefetch")
Q_LOGGING_CATEGORY(lcPlayback, "mdv.playback")
Q_LOGGING_CATEGORY(lcRender, "mdv.render")
Q_LOGGING_CATEGORY(lcProbe, "mdv.probe")
Q_LOGGING_CATEGORY(lcSession, "mdv.session")

void InstallMessagePattern() {
  qSetMessagePattern(
      "%{time hh:mm:ss.zzz} %{if-category}[%{category}] %{endif}"
      "%{type}: %{message}");
}

}  // namespace mdv
