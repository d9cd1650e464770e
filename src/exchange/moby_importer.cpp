#include "exchange/moby_importer.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include <limits>
#include <memory>

#include "dedup/reference_remapper.h"
#include "exchange/skeleton.h"
#include "exchange/texture_merger.h"
#include "format/moby_codec.h"
#include "mobyport_config.h"

bool import_moby_file(const QString& path,
                      AssetCollection* collection,
                      const ImportOptions& options,
                      ImportOutcome* outcome) {
  ImportOutcome local;
  ImportOutcome& out = outcome ? *outcome : local;
  out = ImportOutcome{};
  out.path = path;

  const QString file_name = QFileInfo(path).fileName();
  const auto failed = [&](PortErrorKind kind, const QString& message) {
    fail(&out.error, kind, message);
    qWarning().noquote() << QString("Import: %1").arg(message);
    return false;
  };

  if (path.isEmpty() || !QFileInfo::exists(path)) {
    return failed(PortErrorKind::NotFound, QString("File not found: %1").arg(path));
  }
  if (!collection) {
    return failed(PortErrorKind::InvalidInput, QString("No destination collection for %1.").arg(file_name));
  }

  PortError read_error;
  std::optional<MobyRecord> record = read_moby_file(path, &read_error);
  if (!record) {
    return failed(read_error.kind, read_error.message);
  }

  const int model_id = record->model.id;
  out.model_id = model_id;
  if (model_id < 0 || model_id > std::numeric_limits<qint16>::max()) {
    return failed(PortErrorKind::FormatError, QString("%1: model id %2 is out of range.").arg(file_name).arg(model_id));
  }

  const bool exists = collection->find_model(model_id) != nullptr;
  if (exists && !options.allow_overwrite) {
    return failed(PortErrorKind::InvalidInput,
                  QString("%1: a model with id %2 already exists and overwrite is not allowed.").arg(file_name).arg(model_id));
  }

  // Stage everything before touching the collection.
  TextureMerger merger(collection->textures, options.digest_threshold);
  ReferenceRemapper texture_map(QStringLiteral("texture"));
  for (const MobyTexture& t : record->textures) {
    texture_map.record(t.id, merger.merge(t));
  }

  auto model = std::make_unique<MobyModel>(std::move(record->model));
  out.unmapped_texture_refs += remap_texture_configs(&model->texture_configs, texture_map, model_id, &out.reference_issues);
  out.unmapped_texture_refs += remap_texture_configs(&model->other_texture_configs, texture_map, model_id, &out.reference_issues);
  model->skeleton = build_skeleton(model->bone_matrices, model->bone_datas, model->bone_count);

  if (exists) {
    collection->remove_model(model_id);
    out.replaced_existing = true;
  }
  collection->textures += merger.appended();
  collection->add_model(std::move(model));
  update_model_bookkeeping(collection);

  out.ok = true;
  out.textures_added = static_cast<int>(merger.appended().size());
  out.textures_reused = merger.reused();
  qInfo().noquote() << QString("Import: %1 -> model %2 (%3)%4, %5 textures added, %6 reused.")
                           .arg(file_name)
                           .arg(model_id)
                           .arg(record->model_name.isEmpty() ? QString("unnamed") : record->model_name)
                           .arg(out.replaced_existing ? QString(", replaced existing") : QString())
                           .arg(out.textures_added)
                           .arg(out.textures_reused);
  return true;
}

ImportReport import_moby_files(const QStringList& paths, AssetCollection* collection, const ImportOptions& options) {
  ImportReport report;
  if (paths.isEmpty()) {
    qWarning() << "Import: no files to import.";
    return report;
  }

  for (const QString& path : paths) {
    ImportOutcome outcome;
    if (import_moby_file(path, collection, options, &outcome)) {
      ++report.succeeded;
    } else {
      ++report.failed;
    }
    report.outcomes.push_back(outcome);
  }

  qInfo().noquote() << QString("Import: %1 imported, %2 failed.").arg(report.succeeded).arg(report.failed);
  return report;
}

QStringList list_moby_files(const QString& directory) {
  QStringList out;
  if (directory.isEmpty()) {
    return out;
  }
  const QDir dir(directory);
  if (!dir.exists()) {
    return out;
  }
  const QStringList names = dir.entryList({QString("*%1").arg(QStringLiteral(MOBYPORT_FILE_EXTENSION))},
                                          QDir::Files | QDir::NoDotAndDotDot,
                                          QDir::Name);
  out.reserve(names.size());
  for (const QString& name : names) {
    out.push_back(dir.filePath(name));
  }
  return out;
}
