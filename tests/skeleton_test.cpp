#include <gtest/gtest.h>

#include "exchange/skeleton.h"
#include "test_support.h"

using test_support::add_bones;
using test_support::make_matrix;

TEST(SkeletonTest, TwoChildrenUnderRoot) {
  MobyModel model(1, 8);
  add_bones(&model, {123, 0, 0});
  const std::optional<Skeleton> s = build_skeleton(model.bone_matrices, model.bone_datas, model.bone_count);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->root(), 0);
  ASSERT_EQ(s->bone_count(), 3);
  EXPECT_EQ(s->nodes[0].children, (QVector<int>{1, 2}));
  EXPECT_EQ(s->nodes[1].parent, 0);
  EXPECT_EQ(s->nodes[2].parent, 0);
  EXPECT_TRUE(s->detached.isEmpty());
}

TEST(SkeletonTest, ChainFollowsParents) {
  MobyModel model(1, 8);
  add_bones(&model, {-1, 0, 1, 2});
  const std::optional<Skeleton> s = build_skeleton(model.bone_matrices, model.bone_datas, model.bone_count);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->nodes[0].children, (QVector<int>{1}));
  EXPECT_EQ(s->nodes[1].children, (QVector<int>{2}));
  EXPECT_EQ(s->nodes[2].children, (QVector<int>{3}));
  EXPECT_EQ(s->nodes[3].parent, 2);
}

TEST(SkeletonTest, StopsEarlyWhenDataRunsOut) {
  MobyModel model(1, 8);
  add_bones(&model, {0, 0, 0, 0});
  model.bone_datas.resize(2);
  const std::optional<Skeleton> s = build_skeleton(model.bone_matrices, model.bone_datas, model.bone_count);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->bone_count(), 2);
  EXPECT_EQ(s->nodes[0].children, (QVector<int>{1}));
}

TEST(SkeletonTest, BoneCountLimitsIteration) {
  MobyModel model(1, 8);
  add_bones(&model, {0, 0, 0, 0});
  const std::optional<Skeleton> s = build_skeleton(model.bone_matrices, model.bone_datas, 2);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->bone_count(), 2);
}

TEST(SkeletonTest, ZeroBoneCountBuildsOnlyTheRoot) {
  MobyModel model(1, 8);
  add_bones(&model, {0, 0, 0});
  const std::optional<Skeleton> s = build_skeleton(model.bone_matrices, model.bone_datas, 0);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->bone_count(), 1);
  EXPECT_TRUE(s->nodes[0].children.isEmpty());
  EXPECT_TRUE(s->detached.isEmpty());
}

TEST(SkeletonTest, ForwardParentIsDetached) {
  MobyModel model(1, 8);
  add_bones(&model, {0, 2, 0});
  const std::optional<Skeleton> s = build_skeleton(model.bone_matrices, model.bone_datas, model.bone_count);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->bone_count(), 3);
  EXPECT_EQ(s->detached, (QVector<int>{1}));
  EXPECT_EQ(s->nodes[1].parent, -1);
  EXPECT_EQ(s->nodes[0].children, (QVector<int>{2}));
}

TEST(SkeletonTest, NoBonesMeansNoSkeleton) {
  EXPECT_FALSE(build_skeleton({}, {}, 0).has_value());
  EXPECT_FALSE(build_skeleton({make_matrix(0)}, {}, 1).has_value());
}

TEST(SkeletonTest, BoneDataParentRoundTripsNegativeValues) {
  EXPECT_EQ(BoneData::make(0, 0, 0, -1).parent(), -1);
  EXPECT_EQ(BoneData::make(0, 0, 0, 300).parent(), 300);
  EXPECT_EQ(BoneData{QByteArray(4, '\0')}.parent(), -1);
}
