#include "exchange/moby_exporter.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSet>

#include "catalog/known_models.h"
#include "mobyport_config.h"

namespace {
void copy_referenced_textures(const QVector<TextureConfig>& configs,
                              const QVector<MobyTexture>& pool,
                              int model_id,
                              QSet<int>* copied,
                              QVector<MobyTexture>* out) {
  for (const TextureConfig& config : configs) {
    const int id = config.texture_id;
    if (copied->contains(id)) {
      continue;
    }
    if (id < 0 || id >= pool.size()) {
      qWarning().noquote() << QString("Export: model %1 references texture %2 outside the pool (%3 textures); "
                                      "the config is kept without texture data.")
                                  .arg(model_id)
                                  .arg(id)
                                  .arg(pool.size());
      continue;
    }
    MobyTexture texture = pool[id];
    texture.id = id;
    out->push_back(texture);
    copied->insert(id);
  }
}
}  // namespace

std::optional<MobyRecord> build_moby_record(const MobyModel* model,
                                            const QVector<MobyTexture>& textures,
                                            int game_num,
                                            PortError* error) {
  if (!model) {
    fail(error, PortErrorKind::InvalidInput, "No model to export.");
    return std::nullopt;
  }

  MobyRecord record;
  record.model = *model;
  record.model.skeleton.reset();
  record.model_name = friendly_model_name(model->id);
  record.game_num = game_num;

  QSet<int> copied;
  copy_referenced_textures(model->texture_configs, textures, model->id, &copied, &record.textures);
  copy_referenced_textures(model->other_texture_configs, textures, model->id, &copied, &record.textures);
  return record;
}

bool export_moby_model(const MobyModel* model,
                       const QVector<MobyTexture>& textures,
                       int game_num,
                       const QString& path,
                       const ExportOptions& options,
                       PortError* error) {
  const std::optional<MobyRecord> record = build_moby_record(model, textures, game_num, error);
  if (!record) {
    return false;
  }
  PortError inner;
  if (!write_moby_file(path, *record, options.compression_level, &inner)) {
    return fail(error, inner.kind, QString("Model %1: %2").arg(model->id).arg(inner.message));
  }
  return true;
}

QString export_file_name(int model_id, QHash<QString, int>* name_counts) {
  QString name = friendly_model_name(model_id);
  if (name_counts) {
    const int seen = name_counts->value(name, 0) + 1;
    name_counts->insert(name, seen);
    if (seen > 1) {
      name = QString("%1_%2").arg(name).arg(seen);
    }
  }
  return QString("%1_%2%3").arg(sanitize_file_name(name)).arg(model_id).arg(QStringLiteral(MOBYPORT_FILE_EXTENSION));
}

ExportReport export_collection_models(const AssetCollection& collection,
                                      const QString& output_dir,
                                      const ExportOptions& options) {
  ExportReport report;
  if (collection.models.empty()) {
    qWarning() << "Export: collection has no models.";
    return report;
  }

  QDir dir(output_dir);
  if (!dir.exists() && !dir.mkpath(".")) {
    qCritical().noquote() << QString("Export: unable to create output directory: %1").arg(output_dir);
    for (const std::unique_ptr<MobyModel>& m : collection.models) {
      ExportOutcome outcome;
      outcome.model_id = m ? m->id : -1;
      fail(&outcome.error,
           PortErrorKind::IoError,
           QString("Model %1: unable to create output directory: %2").arg(outcome.model_id).arg(output_dir));
      report.outcomes.push_back(outcome);
      ++report.failed;
    }
    return report;
  }

  QHash<QString, int> name_counts;
  for (const std::unique_ptr<MobyModel>& m : collection.models) {
    ExportOutcome outcome;
    if (!m) {
      outcome.model_id = -1;
      fail(&outcome.error, PortErrorKind::InvalidInput, "Null model entry in collection.");
    } else {
      outcome.model_id = m->id;
      outcome.path = dir.filePath(export_file_name(m->id, &name_counts));
      outcome.ok = export_moby_model(m.get(), collection.textures, collection.game_num, outcome.path, options, &outcome.error);
    }

    if (outcome.ok) {
      qInfo().noquote() << QString("Export: wrote %1").arg(QFileInfo(outcome.path).fileName());
      ++report.succeeded;
    } else {
      qWarning().noquote() << QString("Export: model %1 failed: %2").arg(outcome.model_id).arg(outcome.error.message);
      ++report.failed;
    }
    report.outcomes.push_back(outcome);
  }

  qInfo().noquote() << QString("Export: %1 exported, %2 failed, output %3")
                           .arg(report.succeeded)
                           .arg(report.failed)
                           .arg(QDir::toNativeSeparators(dir.absolutePath()));
  return report;
}
