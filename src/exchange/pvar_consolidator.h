#pragma once

#include <QByteArray>
#include <QVector>

#include "collection/asset_collection.h"
#include "dedup/content_pool.h"
#include "model/port_error.h"

struct BlockConsolidation {
  QVector<int> indices;        // One per input block; -1 for empty blocks.
  QVector<QByteArray> table;   // Distinct non-empty blocks in first-occurrence order.
};

// Interns each non-empty block in input order against a pool private to this call.
// Identical blocks share an index and the assigned indices are exactly 0..table.size()-1.
[[nodiscard]] BlockConsolidation consolidate_blocks(const QVector<QByteArray>& blocks,
                                                    int digest_threshold = ContentPool::kDefaultDigestThreshold);

// Rewrites every placement's pvar_index from its pvars bytes and replaces the collection
// pvar table with the consolidated one.
[[nodiscard]] bool consolidate_collection_pvars(AssetCollection* collection,
                                                int digest_threshold = ContentPool::kDefaultDigestThreshold,
                                                PortError* error = nullptr);
