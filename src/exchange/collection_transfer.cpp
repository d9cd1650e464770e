#include "exchange/collection_transfer.h"

#include <QDebug>
#include <QFileInfo>
#include <QSet>

#include <algorithm>
#include <memory>
#include <vector>

#include "dedup/reference_remapper.h"
#include "exchange/pvar_consolidator.h"
#include "exchange/skeleton.h"
#include "exchange/texture_merger.h"

namespace {
constexpr int kFirstCopiedMobyId = 1000;

QString collection_label(const AssetCollection& collection) {
  return collection.path.isEmpty() ? QString("unnamed collection") : QFileInfo(collection.path).fileName();
}

int next_moby_id(const AssetCollection& collection) {
  if (collection.placements.isEmpty()) {
    return kFirstCopiedMobyId;
  }
  int highest = collection.placements.front().moby_id;
  for (const MobyPlacement& p : collection.placements) {
    highest = std::max(highest, p.moby_id);
  }
  return highest + 1;
}

// Placement pvar bytes, read from the collection table when the placement only carries an index.
QByteArray placement_pvars(const AssetCollection& collection, const MobyPlacement& placement) {
  if (!placement.pvars.isEmpty()) {
    return placement.pvars;
  }
  if (placement.pvar_index >= 0 && placement.pvar_index < collection.pvars.size()) {
    return collection.pvars[placement.pvar_index];
  }
  return {};
}
}  // namespace

bool copy_models_to_collection(const AssetCollection& source,
                               AssetCollection* dest,
                               const QVector<int>& model_ids,
                               const TransferOptions& options,
                               TransferReport* report,
                               PortError* error) {
  TransferReport local;
  TransferReport& out = report ? *report : local;
  out = TransferReport{};

  if (!dest) {
    return fail(error, PortErrorKind::InvalidInput, "No destination collection for the transfer.");
  }
  if (dest == &source) {
    return fail(error,
                PortErrorKind::InvalidInput,
                QString("Cannot copy models of %1 into itself.").arg(collection_label(source)));
  }

  QVector<int> wanted = model_ids;
  if (wanted.isEmpty()) {
    for (const std::unique_ptr<MobyModel>& m : source.models) {
      if (m) {
        wanted.push_back(m->id);
      }
    }
  }

  // Stage everything before touching the destination.
  TextureMerger merger(dest->textures, options.digest_threshold);
  ReferenceRemapper texture_map(QStringLiteral("texture"));
  const auto map_textures = [&](const QVector<TextureConfig>& configs) {
    for (const TextureConfig& config : configs) {
      const int id = config.texture_id;
      if (!texture_map.contains(id) && id >= 0 && id < source.textures.size()) {
        texture_map.record(id, merger.merge(source.textures[id]));
      }
    }
  };

  std::vector<std::unique_ptr<MobyModel>> staged;
  QVector<int> replaced;
  QSet<int> transferred;
  for (const int id : wanted) {
    if (transferred.contains(id)) {
      continue;
    }
    const MobyModel* model = source.find_model(id);
    if (!model) {
      qWarning().noquote() << QString("Transfer: model %1 is not in %2; skipped.").arg(id).arg(collection_label(source));
      out.missing_model_ids.push_back(id);
      continue;
    }
    transferred.insert(id);

    const bool exists = dest->find_model(id) != nullptr;
    if (exists && !options.allow_overwrite) {
      qInfo().noquote() << QString("Transfer: model %1 already in %2; keeping it.").arg(id).arg(collection_label(*dest));
      ++out.models_kept;
      continue;
    }

    auto copy = std::make_unique<MobyModel>(*model);
    map_textures(copy->texture_configs);
    map_textures(copy->other_texture_configs);
    out.unmapped_texture_refs += remap_texture_configs(&copy->texture_configs, texture_map, id, &out.reference_issues);
    out.unmapped_texture_refs += remap_texture_configs(&copy->other_texture_configs, texture_map, id, &out.reference_issues);
    copy->skeleton = build_skeleton(copy->bone_matrices, copy->bone_datas, copy->bone_count);
    if (exists) {
      replaced.push_back(id);
    }
    staged.push_back(std::move(copy));
  }

  if (transferred.isEmpty()) {
    return fail(error,
                PortErrorKind::NotFound,
                QString("None of the requested models exist in %1.").arg(collection_label(source)));
  }

  QVector<MobyPlacement> placements;
  if (options.copy_placements) {
    int moby_id = next_moby_id(*dest);
    for (const MobyPlacement& p : source.placements) {
      if (!transferred.contains(p.model_id)) {
        continue;
      }
      MobyPlacement copy = p;
      copy.moby_id = moby_id++;
      copy.pvars = placement_pvars(source, p);
      copy.pvar_index = -1;
      copy.model = nullptr;
      placements.push_back(copy);
    }
  }

  for (const int id : replaced) {
    dest->remove_model(id);
  }
  dest->textures += merger.appended();
  out.models_copied = static_cast<int>(staged.size());
  for (std::unique_ptr<MobyModel>& m : staged) {
    dest->add_model(std::move(m));
  }

  // Existing placements that only carry an index keep their block through consolidation.
  for (MobyPlacement& p : dest->placements) {
    p.pvars = placement_pvars(*dest, p);
  }
  dest->placements += placements;
  if (!consolidate_collection_pvars(dest, options.digest_threshold, error)) {
    return false;
  }
  update_model_bookkeeping(dest);

  out.placements_copied = static_cast<int>(placements.size());
  out.textures_added = static_cast<int>(merger.appended().size());
  out.textures_reused = merger.reused();
  qInfo().noquote() << QString("Transfer: %1 -> %2: %3 models copied, %4 kept, %5 placements, %6 textures added, %7 reused.")
                           .arg(collection_label(source))
                           .arg(collection_label(*dest))
                           .arg(out.models_copied)
                           .arg(out.models_kept)
                           .arg(out.placements_copied)
                           .arg(out.textures_added)
                           .arg(out.textures_reused);
  return true;
}
