#pragma once

#include <QString>
#include <QVariantMap>

#include <optional>

namespace mdv {

constexpr int kSessionVersion = 1;

// Viewer settings persisted as YAML:
//
//   version: 1
//   viewer:
//     folder: "/data/run1"
//     frame_index: 12
//     ...
//
// Strings are written quoted so they load back as strings.
bool SaveSession(const QString& path, const QVariantMap& viewer,
                 QString* error = nullptr);
std::optional<QVariantMap> LoadSession(const QString& path,
                                       QString* error = nullptr);

}  // namespace mdv
