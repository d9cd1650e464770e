#pragma once

#include <QString>
#include <QVector>

#include "config/tool_settings.h"

class QCoreApplication;

struct CliOptions {
  QString export_collection;
  QString output_dir;
  QString import_path;
  QString into_collection;
  QString save_as;
  QString validate_collection;
  QString consolidate_collection;
  QString info_path;
  QString copy_from;
  QVector<int> model_ids;  // Empty copies every model.
  bool overwrite = false;
  int compression_level = -1;  // -1 keeps the configured level.
};

enum class CliParseResult {
  Ok,
  ExitOk,
  ExitError,
};

CliParseResult parse_cli(QCoreApplication& app, CliOptions& options, QString* output);
int run_cli(const CliOptions& options, const ToolSettings& settings);
