#include "exchange/texture_merger.h"

#include <QDebug>

#include "format/byte_io.h"

QByteArray texture_identity(const MobyTexture& texture) {
  QByteArray key;
  key.reserve(8 + texture.data.size());
  append_u32_le(&key, static_cast<quint32>(static_cast<quint16>(texture.width)) |
                          (static_cast<quint32>(static_cast<quint16>(texture.height)) << 16));
  append_u32_le(&key, texture.mip_count);
  key.append(texture.data);
  return key;
}

TextureMerger::TextureMerger(const QVector<MobyTexture>& existing, int digest_threshold)
    : pool_(digest_threshold), base_count_(static_cast<int>(existing.size())) {
  for (int i = 0; i < existing.size(); ++i) {
    const int before = pool_.size();
    if (pool_.intern(texture_identity(existing[i])) == before) {
      pool_to_texture_.push_back(i);
    }
  }
}

int TextureMerger::merge(const MobyTexture& texture) {
  const QByteArray key = texture_identity(texture);
  const int hit = pool_.find(key);
  if (hit >= 0) {
    ++reused_;
    return pool_to_texture_[hit];
  }
  const int dest = base_count_ + static_cast<int>(appended_.size());
  pool_.intern(key);
  pool_to_texture_.push_back(dest);
  MobyTexture copy = texture;
  copy.id = dest;
  appended_.push_back(copy);
  return dest;
}

int remap_texture_configs(QVector<TextureConfig>* configs,
                          const ReferenceRemapper& remap,
                          int model_id,
                          QVector<PortError>* issues) {
  int unmapped = 0;
  for (TextureConfig& config : *configs) {
    const std::optional<int> dest = remap.resolve(config.texture_id);
    if (dest) {
      config.texture_id = *dest;
      continue;
    }
    // The container tolerates dangling ids at runtime, so the id is kept as-is.
    PortError issue;
    fail(&issue,
         PortErrorKind::ReferenceError,
         QString("Model %1: %2 id %3 has no embedded texture; kept unchanged.")
           .arg(model_id)
           .arg(remap.reference_namespace())
           .arg(config.texture_id));
    qWarning().noquote() << issue.message;
    if (issues) {
      issues->push_back(issue);
    }
    ++unmapped;
  }
  return unmapped;
}
