#include "cli.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

#include <memory>

#include "collection/snapshot_codec.h"
#include "exchange/collection_transfer.h"
#include "exchange/moby_exporter.h"
#include "exchange/moby_importer.h"
#include "exchange/pvar_consolidator.h"
#include "format/moby_codec.h"
#include "mobyport_config.h"
#include "validate/integrity_validator.h"

namespace {
QString normalize_output(const QString& text) {
  return text.endsWith('\n') ? text : text + '\n';
}

QString describe_error(const PortError& error) {
  return QString("[%1] %2").arg(port_error_kind_name(error.kind), error.message);
}

std::unique_ptr<AssetCollection> load_collection(const QString& path, int level, QTextStream& err) {
  PortError error;
  std::unique_ptr<CollectionCodec> codec = open_collection_codec(path, level, &error);
  if (!codec) {
    err << describe_error(error) << "\n";
    return nullptr;
  }
  std::unique_ptr<AssetCollection> collection = codec->load(path, &error);
  if (!collection) {
    err << describe_error(error) << "\n";
  }
  return collection;
}

bool save_collection(const AssetCollection& collection, const QString& path, int level, QTextStream& err) {
  PortError error;
  std::unique_ptr<CollectionCodec> codec = open_collection_codec(path, level, &error);
  if (!codec || !codec->save(collection, path, &error)) {
    err << describe_error(error) << "\n";
    return false;
  }
  return true;
}

void print_findings(const IntegrityReport& report, QTextStream& out) {
  for (const IntegrityFinding& f : report.findings) {
    out << "  " << f.message << "\n";
  }
}

QString default_export_dir(const QString& collection_path, const ToolSettings& settings) {
  if (!settings.export_dir.isEmpty()) {
    return settings.export_dir;
  }
  const QFileInfo info(collection_path);
  return info.dir().filePath(info.completeBaseName() + "_mobys");
}

int run_export(const CliOptions& options, const ToolSettings& settings, QTextStream& out, QTextStream& err) {
  const std::unique_ptr<AssetCollection> collection =
    load_collection(options.export_collection, settings.compression_level, err);
  if (!collection) {
    return 2;
  }
  const QString dir = options.output_dir.isEmpty() ? default_export_dir(options.export_collection, settings)
                                                   : options.output_dir;
  ExportOptions export_options;
  export_options.compression_level = settings.compression_level;
  const ExportReport report = export_collection_models(*collection, dir, export_options);
  for (const ExportOutcome& o : report.outcomes) {
    if (o.ok) {
      out << "exported " << QDir::toNativeSeparators(o.path) << "\n";
    } else {
      err << "model " << o.model_id << ": " << describe_error(o.error) << "\n";
    }
  }
  out << "Exported: " << report.succeeded << ", failed: " << report.failed << "\n";
  return report.ok() ? 0 : 2;
}

int run_import(const CliOptions& options, const ToolSettings& settings, QTextStream& out, QTextStream& err) {
  std::unique_ptr<AssetCollection> collection = load_collection(options.into_collection, settings.compression_level, err);
  if (!collection) {
    return 2;
  }

  QStringList files;
  if (QFileInfo(options.import_path).isDir()) {
    files = list_moby_files(options.import_path);
    if (files.isEmpty()) {
      err << "No " MOBYPORT_FILE_EXTENSION " files in " << QDir::toNativeSeparators(options.import_path) << "\n";
      return 2;
    }
  } else {
    files.push_back(options.import_path);
  }

  ImportOptions import_options;
  import_options.allow_overwrite = options.overwrite || settings.allow_overwrite;
  import_options.digest_threshold = settings.digest_threshold_bytes;
  const ImportReport report = import_moby_files(files, collection.get(), import_options);
  for (const ImportOutcome& o : report.outcomes) {
    if (o.ok) {
      out << "imported " << QFileInfo(o.path).fileName() << " as model " << o.model_id << "\n";
    } else {
      err << QFileInfo(o.path).fileName() << ": " << describe_error(o.error) << "\n";
    }
  }
  out << "Imported: " << report.succeeded << ", failed: " << report.failed << "\n";
  if (!report.ok()) {
    return 2;
  }

  const IntegrityReport integrity = validate_collection(*collection);
  if (!integrity.ok()) {
    out << "Integrity findings after import (" << integrity.findings.size() << "):\n";
    print_findings(integrity, out);
  }

  const QString target = options.save_as.isEmpty() ? options.into_collection : options.save_as;
  if (!save_collection(*collection, target, settings.compression_level, err)) {
    return 2;
  }
  out << "Saved " << QDir::toNativeSeparators(target) << "\n";
  return 0;
}

int run_validate(const CliOptions& options, const ToolSettings& settings, QTextStream& out, QTextStream& err) {
  const std::unique_ptr<AssetCollection> collection =
    load_collection(options.validate_collection, settings.compression_level, err);
  if (!collection) {
    return 2;
  }
  const IntegrityReport report = validate_collection(*collection);
  if (report.ok()) {
    out << "No integrity findings.\n";
    return 0;
  }
  out << "Integrity findings (" << report.findings.size() << "):\n";
  print_findings(report, out);
  return 2;
}

int run_consolidate(const CliOptions& options, const ToolSettings& settings, QTextStream& out, QTextStream& err) {
  std::unique_ptr<AssetCollection> collection =
    load_collection(options.consolidate_collection, settings.compression_level, err);
  if (!collection) {
    return 2;
  }
  PortError error;
  if (!consolidate_collection_pvars(collection.get(), settings.digest_threshold_bytes, &error) ||
      !check_pvar_contiguity(collection->placements, &error)) {
    err << describe_error(error) << "\n";
    return 2;
  }
  const QString target = options.save_as.isEmpty() ? options.consolidate_collection : options.save_as;
  if (!save_collection(*collection, target, settings.compression_level, err)) {
    return 2;
  }
  out << "pVar table: " << collection->pvars.size() << " block(s) for " << collection->placements.size()
      << " placement(s)\n";
  return 0;
}

int run_copy(const CliOptions& options, const ToolSettings& settings, QTextStream& out, QTextStream& err) {
  const std::unique_ptr<AssetCollection> source = load_collection(options.copy_from, settings.compression_level, err);
  if (!source) {
    return 2;
  }
  std::unique_ptr<AssetCollection> dest = load_collection(options.into_collection, settings.compression_level, err);
  if (!dest) {
    return 2;
  }

  TransferOptions transfer_options;
  transfer_options.allow_overwrite = options.overwrite || settings.allow_overwrite;
  transfer_options.digest_threshold = settings.digest_threshold_bytes;
  TransferReport report;
  PortError error;
  if (!copy_models_to_collection(*source, dest.get(), options.model_ids, transfer_options, &report, &error)) {
    err << describe_error(error) << "\n";
    return 2;
  }
  for (const int id : report.missing_model_ids) {
    err << "model " << id << ": not in " << QDir::toNativeSeparators(options.copy_from) << "\n";
  }
  out << "Copied: " << report.models_copied << " model(s), kept: " << report.models_kept
      << ", placements: " << report.placements_copied << ", textures added: " << report.textures_added << "\n";

  const QString target = options.save_as.isEmpty() ? options.into_collection : options.save_as;
  if (!save_collection(*dest, target, settings.compression_level, err)) {
    return 2;
  }
  out << "Saved " << QDir::toNativeSeparators(target) << "\n";
  return 0;
}

int run_info(const CliOptions& options, QTextStream& out, QTextStream& err) {
  PortError error;
  const std::optional<MobyRecord> record = read_moby_file(options.info_path, &error);
  if (!record) {
    err << describe_error(error) << "\n";
    return 2;
  }
  const MobyModel& m = record->model;
  out << "File: " << QDir::toNativeSeparators(options.info_path) << "\n";
  out << "Model: " << m.id << " (" << record->model_name << "), game " << record->game_num << "\n";
  out << "Vertices: " << m.vertex_count() << " (stride " << m.vertex_stride() << "), faces: " << m.face_count() << "\n";
  out << "Textures: " << record->textures.size() << ", configs: " << m.texture_configs.size() << " + "
      << m.other_texture_configs.size() << "\n";
  out << "Animations: " << m.animations.size() << ", bones: " << static_cast<int>(m.bone_count) << "\n";
  return 0;
}
}  // namespace

CliParseResult parse_cli(QCoreApplication& app, CliOptions& options, QString* output) {
  QCommandLineParser parser;
  parser.setApplicationDescription("Moby model export/import for level collections");
  parser.addHelpOption();
  parser.addVersionOption();

  const QCommandLineOption export_option("export", "Export every model of a collection.", "collection");
  const QCommandLineOption output_option({"o", "output"}, "Output directory for exports.", "dir");
  const QCommandLineOption import_option("import", "Import a " MOBYPORT_FILE_EXTENSION " file or a directory of them.", "path");
  const QCommandLineOption into_option("into", "Destination collection for --import and --copy-from.", "collection");
  const QCommandLineOption overwrite_option("overwrite", "Replace existing models with the same id.");
  const QCommandLineOption save_as_option("save-as", "Save the modified collection to another path.", "path");
  const QCommandLineOption validate_option("validate", "Check a collection's reference integrity.", "collection");
  const QCommandLineOption consolidate_option("consolidate-pvars", "Deduplicate and reindex placement pVars.", "collection");
  const QCommandLineOption info_option("info", "Summarize a " MOBYPORT_FILE_EXTENSION " file.", "file");
  const QCommandLineOption copy_option("copy-from", "Copy models and their placements from a collection.", "collection");
  const QCommandLineOption models_option("models", "Comma-separated model ids for --copy-from.", "ids");
  const QCommandLineOption level_option("level", "Compression level (0-10).", "level");

  parser.addOption(export_option);
  parser.addOption(output_option);
  parser.addOption(import_option);
  parser.addOption(into_option);
  parser.addOption(overwrite_option);
  parser.addOption(save_as_option);
  parser.addOption(validate_option);
  parser.addOption(consolidate_option);
  parser.addOption(info_option);
  parser.addOption(copy_option);
  parser.addOption(models_option);
  parser.addOption(level_option);

  if (!parser.parse(app.arguments())) {
    if (output) {
      *output = normalize_output(parser.errorText()) + '\n' + parser.helpText();
    }
    return CliParseResult::ExitError;
  }

  if (parser.isSet("help")) {
    if (output) {
      *output = parser.helpText();
    }
    return CliParseResult::ExitOk;
  }

  if (parser.isSet("version")) {
    if (output) {
      *output = normalize_output(app.applicationName() + ' ' + app.applicationVersion());
    }
    return CliParseResult::ExitOk;
  }

  options.export_collection = parser.value(export_option);
  options.output_dir = parser.value(output_option);
  options.import_path = parser.value(import_option);
  options.into_collection = parser.value(into_option);
  options.overwrite = parser.isSet(overwrite_option);
  options.save_as = parser.value(save_as_option);
  options.validate_collection = parser.value(validate_option);
  options.consolidate_collection = parser.value(consolidate_option);
  options.info_path = parser.value(info_option);
  options.copy_from = parser.value(copy_option);

  if (parser.isSet(models_option)) {
    for (const QString& part : parser.value(models_option).split(',', Qt::SkipEmptyParts)) {
      bool ok = false;
      const int id = part.trimmed().toInt(&ok);
      if (!ok) {
        if (output) {
          *output = normalize_output(QString("Invalid model id: %1").arg(part));
        }
        return CliParseResult::ExitError;
      }
      options.model_ids.push_back(id);
    }
  }

  if (parser.isSet(level_option)) {
    bool ok = false;
    const int level = parser.value(level_option).toInt(&ok);
    if (!ok || level < ToolSettings::kMinCompressionLevel || level > ToolSettings::kMaxCompressionLevel) {
      if (output) {
        *output = normalize_output("Compression level must be between 0 and 10.");
      }
      return CliParseResult::ExitError;
    }
    options.compression_level = level;
  }

  const int actions = (options.export_collection.isEmpty() ? 0 : 1) + (options.import_path.isEmpty() ? 0 : 1) +
                      (options.validate_collection.isEmpty() ? 0 : 1) +
                      (options.consolidate_collection.isEmpty() ? 0 : 1) + (options.info_path.isEmpty() ? 0 : 1) +
                      (options.copy_from.isEmpty() ? 0 : 1);
  if (actions == 0) {
    if (output) {
      *output = parser.helpText();
    }
    return CliParseResult::ExitOk;
  }
  if (actions > 1) {
    if (output) {
      *output = normalize_output("Choose one of --export, --import, --copy-from, --validate, --consolidate-pvars, --info.") + '\n' +
                parser.helpText();
    }
    return CliParseResult::ExitError;
  }

  if ((!options.import_path.isEmpty() || !options.copy_from.isEmpty()) && options.into_collection.isEmpty()) {
    if (output) {
      *output = normalize_output("--import and --copy-from need --into <collection>.") + '\n' + parser.helpText();
    }
    return CliParseResult::ExitError;
  }

  return CliParseResult::Ok;
}

int run_cli(const CliOptions& options, const ToolSettings& settings) {
  QTextStream out(stdout);
  QTextStream err(stderr);

  ToolSettings effective = settings;
  if (options.compression_level >= 0) {
    effective.compression_level = options.compression_level;
  }

  if (!options.export_collection.isEmpty()) {
    return run_export(options, effective, out, err);
  }
  if (!options.import_path.isEmpty()) {
    return run_import(options, effective, out, err);
  }
  if (!options.copy_from.isEmpty()) {
    return run_copy(options, effective, out, err);
  }
  if (!options.validate_collection.isEmpty()) {
    return run_validate(options, effective, out, err);
  }
  if (!options.consolidate_collection.isEmpty()) {
    return run_consolidate(options, effective, out, err);
  }
  if (!options.info_path.isEmpty()) {
    return run_info(options, out, err);
  }
  return 0;
}
