#include "exchange/skeleton.h"

#include <QDebug>

#include <algorithm>

std::optional<Skeleton> build_skeleton(const QVector<BoneMatrix>& matrices,
                                       const QVector<BoneData>& datas,
                                       int bone_count) {
  if (matrices.isEmpty() || datas.isEmpty()) {
    return std::nullopt;
  }

  // The root always exists; a zero bone count leaves it alone.
  const int wanted = std::max(bone_count, 1);
  const int available = static_cast<int>(std::min(matrices.size(), datas.size()));
  const int n = std::min(wanted, available);
  if (n < wanted) {
    qWarning() << "Skeleton: only" << n << "of" << wanted << "bones have matrix and data records.";
  }

  Skeleton skeleton;
  skeleton.nodes.reserve(n);
  SkeletonNode root;
  root.bone = 0;
  skeleton.nodes.push_back(root);

  for (int i = 1; i < n; ++i) {
    SkeletonNode node;
    node.bone = i;
    const int parent = datas[i].parent();
    if (parent < 0 || parent >= i) {
      qWarning() << "Skeleton: bone" << i << "has invalid parent" << parent << "and was left detached.";
      skeleton.detached.push_back(i);
    } else {
      node.parent = parent;
      skeleton.nodes[parent].children.push_back(i);
    }
    skeleton.nodes.push_back(node);
  }
  return skeleton;
}
