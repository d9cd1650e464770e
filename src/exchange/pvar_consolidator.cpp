#include "exchange/pvar_consolidator.h"

#include <QDebug>

BlockConsolidation consolidate_blocks(const QVector<QByteArray>& blocks, int digest_threshold) {
  BlockConsolidation out;
  out.indices.reserve(blocks.size());
  ContentPool pool(digest_threshold);
  for (const QByteArray& block : blocks) {
    // Null and zero-length blocks both mean "no pvars".
    out.indices.push_back(block.isEmpty() ? -1 : pool.intern(block));
  }
  out.table = pool.blocks();
  return out;
}

bool consolidate_collection_pvars(AssetCollection* collection, int digest_threshold, PortError* error) {
  if (!collection) {
    return fail(error, PortErrorKind::InvalidInput, "No collection to consolidate.");
  }

  QVector<QByteArray> blocks;
  blocks.reserve(collection->placements.size());
  for (const MobyPlacement& p : collection->placements) {
    blocks.push_back(p.pvars);
  }

  BlockConsolidation result = consolidate_blocks(blocks, digest_threshold);
  for (qsizetype i = 0; i < collection->placements.size(); ++i) {
    collection->placements[i].pvar_index = result.indices[i];
  }
  collection->pvars = std::move(result.table);

  qInfo().noquote() << QString("Consolidate: %1 placements share %2 distinct pvar blocks.")
                           .arg(collection->placements.size())
                           .arg(collection->pvars.size());
  return true;
}
