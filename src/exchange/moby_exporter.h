#pragma once

#include <QHash>
#include <QString>
#include <QVector>

#include <optional>

#include "collection/asset_collection.h"
#include "format/moby_codec.h"
#include "model/port_error.h"

struct ExportOptions {
  int compression_level = 10;
};

// Snapshot of |model| plus a full copy of every pool texture its primary and secondary
// configs reference. Copied textures carry the pool index they were taken from as their
// id, so configs in the record still resolve against them. Each index is copied once.
[[nodiscard]] std::optional<MobyRecord> build_moby_record(const MobyModel* model,
                                                          const QVector<MobyTexture>& textures,
                                                          int game_num,
                                                          PortError* error = nullptr);

[[nodiscard]] bool export_moby_model(const MobyModel* model,
                                     const QVector<MobyTexture>& textures,
                                     int game_num,
                                     const QString& path,
                                     const ExportOptions& options = {},
                                     PortError* error = nullptr);

// "<SanitizedFriendlyName>_<id>.rmoby". Repeat friendly names within one batch get a
// "_<n>" suffix (n starting at 2) before the id; |name_counts| tracks the batch.
[[nodiscard]] QString export_file_name(int model_id, QHash<QString, int>* name_counts);

struct ExportOutcome {
  int model_id = 0;
  QString path;
  bool ok = false;
  PortError error;
};

struct ExportReport {
  QVector<ExportOutcome> outcomes;
  int succeeded = 0;
  int failed = 0;

  [[nodiscard]] bool ok() const { return succeeded > 0; }
};

// Exports every model of |collection| into |output_dir|, continuing past failures.
[[nodiscard]] ExportReport export_collection_models(const AssetCollection& collection,
                                                    const QString& output_dir,
                                                    const ExportOptions& options = {});
