#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "collection/asset_collection.h"
#include "dedup/content_pool.h"
#include "model/port_error.h"

struct ImportOptions {
  bool allow_overwrite = false;
  int digest_threshold = ContentPool::kDefaultDigestThreshold;
};

struct ImportOutcome {
  QString path;
  int model_id = -1;
  bool ok = false;
  bool replaced_existing = false;
  int textures_added = 0;
  int textures_reused = 0;
  int unmapped_texture_refs = 0;
  QVector<PortError> reference_issues;  // Non-fatal; the import still succeeds.
  PortError error;
};

// Imports one .rmoby file into |collection|. Embedded textures are matched against the
// destination pool by (width, height, mip count, bytes) and appended only when new; every
// texture config is rewritten through the resulting map. The skeleton is rebuilt from the
// bone records and bookkeeping is refreshed.
// Any failure leaves |collection| untouched.
[[nodiscard]] bool import_moby_file(const QString& path,
                                    AssetCollection* collection,
                                    const ImportOptions& options = {},
                                    ImportOutcome* outcome = nullptr);

struct ImportReport {
  QVector<ImportOutcome> outcomes;
  int succeeded = 0;
  int failed = 0;

  [[nodiscard]] bool ok() const { return succeeded > 0; }
};

// Imports each file independently; earlier successes are kept when a later file fails.
[[nodiscard]] ImportReport import_moby_files(const QStringList& paths,
                                             AssetCollection* collection,
                                             const ImportOptions& options = {});

// .rmoby files directly inside |directory|, sorted by name. Empty for a missing directory.
[[nodiscard]] QStringList list_moby_files(const QString& directory);
