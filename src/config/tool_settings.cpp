#include "config/tool_settings.h"

#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>

namespace {
constexpr char kSettingsKey[] = "mobyport/settingsJson";
constexpr int kSettingsVersion = 1;
}  // namespace

ToolSettings normalized_settings(ToolSettings settings) {
  settings.compression_level = std::clamp(settings.compression_level,
                                          ToolSettings::kMinCompressionLevel,
                                          ToolSettings::kMaxCompressionLevel);
  settings.digest_threshold_bytes = std::max(0, settings.digest_threshold_bytes);
  settings.export_dir = settings.export_dir.trimmed();
  settings.log_dir = settings.log_dir.trimmed();
  return settings;
}

ToolSettings load_tool_settings(QString* error) {
  QSettings settings;
  return load_tool_settings(settings, error);
}

ToolSettings load_tool_settings(QSettings& settings, QString* error) {
  if (error) {
    error->clear();
  }

  const QString raw = settings.value(kSettingsKey).toString().trimmed();
  if (raw.isEmpty()) {
    return {};
  }

  QJsonParseError parse_error;
  const QJsonDocument doc = QJsonDocument::fromJson(raw.toUtf8(), &parse_error);
  if (doc.isNull() || !doc.isObject()) {
    if (error) {
      *error = parse_error.errorString().isEmpty() ? "Invalid mobyport settings." : parse_error.errorString();
    }
    return {};
  }

  const QJsonObject root = doc.object();
  const int version = root.value("version").toInt(0);
  if (version != kSettingsVersion) {
    if (error) {
      *error = QString("Unsupported mobyport settings version: %1").arg(version);
    }
    return {};
  }

  const ToolSettings defaults;
  ToolSettings out;
  out.allow_overwrite = root.value("allowOverwrite").toBool(defaults.allow_overwrite);
  out.compression_level = root.value("compressionLevel").toInt(defaults.compression_level);
  out.digest_threshold_bytes = root.value("digestThresholdBytes").toInt(defaults.digest_threshold_bytes);
  out.export_dir = root.value("exportDir").toString();
  out.log_dir = root.value("logDir").toString();
  return normalized_settings(out);
}

bool save_tool_settings(const ToolSettings& value, QString* error) {
  QSettings settings;
  return save_tool_settings(settings, value, error);
}

bool save_tool_settings(QSettings& settings, const ToolSettings& value, QString* error) {
  if (error) {
    error->clear();
  }

  const ToolSettings normalized = normalized_settings(value);
  QJsonObject root;
  root.insert("version", kSettingsVersion);
  root.insert("allowOverwrite", normalized.allow_overwrite);
  root.insert("compressionLevel", normalized.compression_level);
  root.insert("digestThresholdBytes", normalized.digest_threshold_bytes);
  if (!normalized.export_dir.isEmpty()) {
    root.insert("exportDir", normalized.export_dir);
  }
  if (!normalized.log_dir.isEmpty()) {
    root.insert("logDir", normalized.log_dir);
  }

  settings.setValue(kSettingsKey, QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Compact)));
  settings.sync();

  if (settings.status() != QSettings::NoError) {
    if (error) {
      *error = "Failed to save mobyport settings.";
    }
    return false;
  }
  return true;
}
