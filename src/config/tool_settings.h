#pragma once

#include <QSettings>
#include <QString>

#include "dedup/content_pool.h"

struct ToolSettings {
  static constexpr int kMinCompressionLevel = 0;
  static constexpr int kMaxCompressionLevel = 10;

  bool allow_overwrite = false;
  int compression_level = kMaxCompressionLevel;
  int digest_threshold_bytes = ContentPool::kDefaultDigestThreshold;
  QString export_dir;
  QString log_dir;
};

// Clamps numeric fields into their valid ranges.
[[nodiscard]] ToolSettings normalized_settings(ToolSettings settings);

// Versioned JSON document stored under one QSettings key. A missing document yields
// defaults; a malformed or unsupported one yields defaults and an error.
[[nodiscard]] ToolSettings load_tool_settings(QString* error = nullptr);
[[nodiscard]] ToolSettings load_tool_settings(QSettings& settings, QString* error = nullptr);
[[nodiscard]] bool save_tool_settings(const ToolSettings& value, QString* error = nullptr);
[[nodiscard]] bool save_tool_settings(QSettings& settings, const ToolSettings& value, QString* error = nullptr);
