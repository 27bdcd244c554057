#pragma once

#include <QString>
#include <QStringList>

#include <optional>

namespace mdv {

// Same-prefix .vts files in one folder, ordered by their embedded index.
struct SeriesDescriptor {
  QString folder;
  QString prefix;
  QStringList files;  // absolute paths

  bool empty() const { return files.isEmpty(); }
  int size() const { return files.size(); }
  int index_of(const QString& file_name) const;
};

// "phi_000120.vts" -> "phi_". An all-digit stem keeps the whole stem.
std::optional<QString> ExtractSeriesPrefix(const QString& file_name);

// Integer formed by the digits after `prefix`; nullopt sorts last.
std::optional<qulonglong> ExtractSeriesIndex(const QString& file_name,
                                             const QString& prefix);

// Sorted unique prefixes of the .vts files in `folder`.
// Throws NoFilesFound or NoValidSeries.
QStringList DiscoverSeriesPrefixes(const QString& folder);

// Throws NoFilesFound when no file starts with `prefix`.
SeriesDescriptor ResolveSeries(const QString& folder, const QString& prefix);

// Re-scans the folder. Returns the new index of the file at
// `current_index`, or the old index when still in range, or 0; returns -1
// when the series has become empty.
int RefreshSeries(SeriesDescriptor& series, int current_index);

}  // namespace mdv
