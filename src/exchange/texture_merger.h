#pragma once

#include <QByteArray>
#include <QVector>

#include "dedup/content_pool.h"
#include "dedup/reference_remapper.h"
#include "model/moby_model.h"
#include "model/port_error.h"

// Dedup identity of a texture: dimensions and mip count followed by the texel bytes.
// The id and the opaque format words do not take part.
[[nodiscard]] QByteArray texture_identity(const MobyTexture& texture);

// Destination texture pool as seen by one transfer: existing textures first, then the ones
// the transfer will append. Nothing is written to the destination until the caller commits
// appended() itself.
class TextureMerger {
public:
  TextureMerger(const QVector<MobyTexture>& existing, int digest_threshold);

  // Destination index for |texture|, staging an append when no identical texture exists.
  int merge(const MobyTexture& texture);

  [[nodiscard]] const QVector<MobyTexture>& appended() const { return appended_; }
  [[nodiscard]] int reused() const { return reused_; }

private:
  ContentPool pool_;
  QVector<int> pool_to_texture_;
  int base_count_ = 0;
  QVector<MobyTexture> appended_;
  int reused_ = 0;
};

// Rewrites each config's texture id through |remap|. Ids with no mapping are kept, logged and
// reported to |issues| as non-fatal ReferenceErrors; returns how many were kept.
int remap_texture_configs(QVector<TextureConfig>* configs,
                          const ReferenceRemapper& remap,
                          int model_id,
                          QVector<PortError>* issues = nullptr);
