#pragma once

#include <QVector>

#include <optional>

#include "model/moby_model.h"

// Rebuilds the bone tree from raw per-bone records. Bone 0 is the root; bone i hangs under
// BoneData[i].parent, which must be a lower index. Iteration stops early when either list
// runs out, so a short input yields a partial tree instead of a failure.
// |bone_count| <= 0 yields the root only. Returns nullopt when there is no bone at all.
[[nodiscard]] std::optional<Skeleton> build_skeleton(const QVector<BoneMatrix>& matrices,
                                                     const QVector<BoneData>& datas,
                                                     int bone_count);
