#include "mdv/SessionFile.h"

#include <QMetaType>
#include <QSaveFile>
#include <QVariantList>

#include <climits>
#include <string>

#include <yaml-cpp/yaml.h>

#include "mdv/Log.h"

namespace mdv {

namespace {

void SetError(QString* error, const QString& message) {
  if (error) {
    *error = message;
  }
}

void EmitValue(YAML::Emitter& out, const QVariant& val) {
  switch (val.typeId()) {
    case QMetaType::Bool:
      out << val.toBool();
      break;
    case QMetaType::Int:
    case QMetaType::LongLong:
      out << val.toLongLong();
      break;
    case QMetaType::UInt:
    case QMetaType::ULongLong:
      out << val.toULongLong();
      break;
    case QMetaType::Double:
    case QMetaType::Float:
      out << val.toDouble();
      break;
    case QMetaType::QVariantList:
    case QMetaType::QStringList: {
      out << YAML::Flow << YAML::BeginSeq;
      for (const auto& item : val.toList()) {
        EmitValue(out, item);
      }
      out << YAML::EndSeq;
      break;
    }
    case QMetaType::QVariantMap: {
      const QVariantMap map = val.toMap();
      out << YAML::BeginMap;
      for (auto it = map.begin(); it != map.end(); ++it) {
        out << YAML::Key << it.key().toStdString() << YAML::Value;
        EmitValue(out, it.value());
      }
      out << YAML::EndMap;
      break;
    }
    default:
      out << YAML::DoubleQuoted << val.toString().toStdString();
      break;
  }
}

QVariant ScalarToVariant(const YAML::Node& node) {
  const QString raw = QString::fromStdString(node.Scalar());
  if (node.Tag() == "!") {
    return raw;
  }
  const QString lower = raw.toLower();
  if (lower == "true" || lower == "false") {
    return lower == "true";
  }
  bool ok_int = false;
  const qlonglong int_val = raw.toLongLong(&ok_int);
  if (ok_int && !raw.contains('.') &&
      !raw.contains('e', Qt::CaseInsensitive)) {
    if (int_val >= INT_MIN && int_val <= INT_MAX) {
      return static_cast<int>(int_val);
    }
    return int_val;
  }
  bool ok_double = false;
  const double dbl_val = raw.toDouble(&ok_double);
  if (ok_double) {
    return dbl_val;
  }
  return raw;
}

QVariant NodeToVariant(const YAML::Node& node) {
  if (node.IsScalar()) {
    return ScalarToVariant(node);
  }
  if (node.IsSequence()) {
    QVariantList list;
    for (const auto& item : node) {
      list << NodeToVariant(item);
    }
    return list;
  }
  if (node.IsMap()) {
    QVariantMap map;
    for (const auto& it : node) {
      map.insert(QString::fromStdString(it.first.as<std::string>()),
                 NodeToVariant(it.second));
    }
    return map;
  }
  return {};
}

}  // namespace

bool SaveSession(const QString& path, const QVariantMap& viewer,
                 QString* error) {
  try {
    YAML::Emitter out;
    out.SetDoublePrecision(17);
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << kSessionVersion;
    out << YAML::Key << "viewer" << YAML::Value;
    EmitValue(out, viewer);
    out << YAML::EndMap;
    if (!out.good()) {
      SetError(error, QString::fromStdString(out.GetLastError()));
      return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
      SetError(error, file.errorString());
      return false;
    }
    file.write(out.c_str());
    file.write("\n");
    if (!file.commit()) {
      SetError(error, file.errorString());
      return false;
    }
  } catch (const std::exception& e) {
    qCWarning(lcSession) << "save failed:" << e.what();
    SetError(error, QString::fromUtf8(e.what()));
    return false;
  }
  qCInfo(lcSession) << "session saved to" << path;
  return true;
}

std::optional<QVariantMap> LoadSession(const QString& path, QString* error) {
  try {
    const YAML::Node root = YAML::LoadFile(path.toStdString());
    const YAML::Node version = root["version"];
    if (version && version.as<int>(0) > kSessionVersion) {
      SetError(error, QString("Unsupported session version %1")
                          .arg(version.as<int>(0)));
      return std::nullopt;
    }
    const YAML::Node viewer = root["viewer"];
    if (!viewer || !viewer.IsMap()) {
      SetError(error, "Invalid session file (missing viewer).");
      return std::nullopt;
    }
    qCInfo(lcSession) << "session loaded from" << path;
    return NodeToVariant(viewer).toMap();
  } catch (const std::exception& e) {
    qCWarning(lcSession) << "load failed:" << e.what();
    SetError(error, QString::fromUtf8(e.what()));
  }
  return std::nullopt;
}

}  // namespace mdv
