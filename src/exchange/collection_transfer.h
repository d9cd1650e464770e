#pragma once

#include <QVector>

#include "collection/asset_collection.h"
#include "dedup/content_pool.h"
#include "model/port_error.h"

struct TransferOptions {
  // Replace destination models that share an id with a copied one. When false the
  // destination model is kept and the copied placements link to it.
  bool allow_overwrite = false;
  bool copy_placements = true;
  int digest_threshold = ContentPool::kDefaultDigestThreshold;
};

struct TransferReport {
  int models_copied = 0;
  int models_kept = 0;
  int placements_copied = 0;
  int textures_added = 0;
  int textures_reused = 0;
  int unmapped_texture_refs = 0;
  QVector<PortError> reference_issues;  // Non-fatal; the transfer still succeeds.
  QVector<int> missing_model_ids;  // Requested but absent from the source.
};

// Copies the models named by |model_ids| (every source model when empty) from |source| into
// |dest|. Models are deep-copied with their textures merged into the destination pool by
// content. With copy_placements, the source placements of those models are appended under
// fresh moby ids carrying their pvar bytes. The destination pvar table is then consolidated
// and bookkeeping refreshed, so calling this once per source merges many collections into one.
// Fails without touching |dest| when it is null, aliases |source|, or none of the requested
// models exist in |source|.
[[nodiscard]] bool copy_models_to_collection(const AssetCollection& source,
                                             AssetCollection* dest,
                                             const QVector<int>& model_ids = {},
                                             const TransferOptions& options = {},
                                             TransferReport* report = nullptr,
                                             PortError* error = nullptr);
