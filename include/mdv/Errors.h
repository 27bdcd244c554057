#pragma once

#include <QString>

#include <stdexcept>
#include <string>

namespace mdv {

class Error : public std::runtime_error {
 public:
  explicit Error(const QString& message)
      : std::runtime_error(message.toStdString()) {}
};

// A single grid file could not be read (missing, malformed or empty).
class LoadError : public Error {
 public:
  LoadError(const QString& path, const QString& reason)
      : Error(QString("%1: %2").arg(path, reason)), path_(path) {}

  const QString& path() const { return path_; }

 private:
  QString path_;
};

// The folder holds no .vts file matching the request.
class NoFilesFound : public Error {
 public:
  explicit NoFilesFound(const QString& folder)
      : Error(QString("No .vts files found in %1").arg(folder)),
        folder_(folder) {}

  const QString& folder() const { return folder_; }

 private:
  QString folder_;
};

// .vts files exist but none of them yields a series prefix.
class NoValidSeries : public Error {
 public:
  explicit NoValidSeries(const QString& folder)
      : Error(QString("No valid file series found in %1").arg(folder)),
        folder_(folder) {}

  const QString& folder() const { return folder_; }

 private:
  QString folder_;
};

}  // namespace mdv
