#include "mdv/SeriesResolver.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <set>
#include <utility>
#include <vector>

#include "mdv/Errors.h"
#include "mdv/Log.h"

namespace mdv {

namespace {

constexpr char kExtension[] = ".vts";

QStringList ListVtsFiles(const QString& folder) {
  QDir dir(folder);
  if (!dir.exists()) {
    return {};
  }
  return dir.entryList(QStringList{"*.vts"}, QDir::Files, QDir::Name);
}

QString StemOf(const QString& file_name) {
  return file_name.left(file_name.size() - int(sizeof(kExtension) - 1));
}

}  // namespace

int SeriesDescriptor::index_of(const QString& file_name) const {
  for (int i = 0; i < files.size(); ++i) {
    if (QFileInfo(files[i]).fileName() == file_name) {
      return i;
    }
  }
  return -1;
}

std::optional<QString> ExtractSeriesPrefix(const QString& file_name) {
  if (!file_name.endsWith(kExtension, Qt::CaseInsensitive)) {
    return std::nullopt;
  }
  const QString stem = StemOf(file_name);
  if (stem.isEmpty()) {
    return std::nullopt;
  }
  int end = stem.size();
  while (end > 0 && stem.at(end - 1).isDigit()) {
    --end;
  }
  if (end == 0) {
    return stem;
  }
  return stem.left(end);
}

std::optional<qulonglong> ExtractSeriesIndex(const QString& file_name,
                                             const QString& prefix) {
  QString suffix = file_name;
  if (suffix.startsWith(prefix)) {
    suffix = suffix.mid(prefix.size());
  }
  if (suffix.endsWith(kExtension, Qt::CaseInsensitive)) {
    suffix = StemOf(suffix);
  }
  QString digits;
  for (const QChar c : suffix) {
    if (c.isDigit()) {
      digits.append(c);
    }
  }
  if (digits.isEmpty()) {
    return std::nullopt;
  }
  bool ok = false;
  const qulonglong value = digits.toULongLong(&ok);
  if (!ok) {
    return std::nullopt;
  }
  return value;
}

QStringList DiscoverSeriesPrefixes(const QString& folder) {
  const QStringList names = ListVtsFiles(folder);
  if (names.isEmpty()) {
    throw NoFilesFound(folder);
  }
  std::set<QString> prefixes;
  for (const auto& name : names) {
    if (auto prefix = ExtractSeriesPrefix(name)) {
      prefixes.insert(*prefix);
    }
  }
  if (prefixes.empty()) {
    throw NoValidSeries(folder);
  }
  QStringList out;
  for (const auto& p : prefixes) {
    out << p;
  }
  qCDebug(lcSeries) << "prefixes in" << folder << out;
  return out;
}

SeriesDescriptor ResolveSeries(const QString& folder, const QString& prefix) {
  struct Entry {
    std::optional<qulonglong> index;
    QString name;
  };
  std::vector<Entry> entries;
  for (const auto& name : ListVtsFiles(folder)) {
    if (name.startsWith(prefix)) {
      entries.push_back({ExtractSeriesIndex(name, prefix), name});
    }
  }
  if (entries.empty()) {
    throw NoFilesFound(folder);
  }
  std::stable_sort(entries.begin(), entries.end(),
                   [](const Entry& a, const Entry& b) {
                     if (a.index.has_value() != b.index.has_value()) {
                       return a.index.has_value();
                     }
                     if (a.index && *a.index != *b.index) {
                       return *a.index < *b.index;
                     }
                     return a.name < b.name;
                   });

  SeriesDescriptor series;
  series.folder = QDir(folder).absolutePath();
  series.prefix = prefix;
  const QDir dir(series.folder);
  for (const auto& e : entries) {
    series.files << dir.absoluteFilePath(e.name);
  }
  qCInfo(lcSeries) << "series" << prefix << "in" << series.folder << "has"
                   << series.files.size() << "files";
  return series;
}

int RefreshSeries(SeriesDescriptor& series, int current_index) {
  QString current_name;
  if (current_index >= 0 && current_index < series.files.size()) {
    current_name = QFileInfo(series.files[current_index]).fileName();
  }
  try {
    series = ResolveSeries(series.folder, series.prefix);
  } catch (const NoFilesFound&) {
    qCWarning(lcSeries) << "series" << series.prefix << "vanished from"
                        << series.folder;
    series.files.clear();
    return -1;
  }
  if (!current_name.isEmpty()) {
    const int idx = series.index_of(current_name);
    if (idx >= 0) {
      return idx;
    }
  }
  if (current_index >= 0 && current_index < series.files.size()) {
    return current_index;
  }
  return 0;
}

}  // namespace mdv
