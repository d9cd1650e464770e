#include <gtest/gtest.h>

#include "exchange/collection_transfer.h"
#include "test_support.h"
#include "validate/integrity_validator.h"

using namespace test_support;

namespace {
// One model |model_id| using texture 0 of a single-texture pool, placed twice with the
// given pvar blocks.
AssetCollection level_with(int model_id, const QByteArray& texels, const QByteArray& pvars_a, const QByteArray& pvars_b) {
  AssetCollection c;
  c.textures = {make_texture(0, 8, 8, texels)};
  auto model = make_model(model_id);
  model->texture_configs = {make_config(0)};
  c.add_model(std::move(model));
  c.placements = {make_placement(1, model_id, pvars_a), make_placement(2, model_id, pvars_b)};
  update_model_bookkeeping(&c);
  return c;
}
}  // namespace

TEST(CollectionTransferTest, IdenticalPvarsFromTwoSourcesCollapseToOneEntry) {
  const QByteArray shared = patterned_bytes(24, 7);
  const QByteArray texels = patterned_bytes(64, 3);
  const AssetCollection first = level_with(10, texels, shared, patterned_bytes(24, 1));
  const AssetCollection second = level_with(11, texels, shared, QByteArray());

  AssetCollection dest;
  TransferReport report;
  PortError error;
  ASSERT_TRUE(copy_models_to_collection(first, &dest, {}, {}, &report, &error)) << error.message.toStdString();
  ASSERT_TRUE(copy_models_to_collection(second, &dest, {}, {}, &report, &error)) << error.message.toStdString();

  EXPECT_EQ(dest.model_count(), 2);
  EXPECT_EQ(dest.textures.size(), 1);
  EXPECT_EQ(report.textures_reused, 1);
  EXPECT_EQ(dest.find_model(11)->texture_configs[0].texture_id, 0);

  ASSERT_EQ(dest.placements.size(), 4);
  EXPECT_EQ(dest.pvars.size(), 2);
  EXPECT_EQ(dest.placements[0].pvar_index, 0);
  EXPECT_EQ(dest.placements[1].pvar_index, 1);
  EXPECT_EQ(dest.placements[2].pvar_index, 0);
  EXPECT_EQ(dest.placements[3].pvar_index, -1);
  EXPECT_TRUE(check_pvar_contiguity(dest.placements, &error)) << error.message.toStdString();
  EXPECT_TRUE(validate_collection(dest).ok());
}

TEST(CollectionTransferTest, CopiedPlacementsGetFreshMobyIdsAndLinks) {
  const AssetCollection source = level_with(10, patterned_bytes(16, 1), patterned_bytes(8, 1), patterned_bytes(8, 2));
  AssetCollection dest;
  dest.placements = {make_placement(1500, -1)};

  ASSERT_TRUE(copy_models_to_collection(source, &dest));
  ASSERT_EQ(dest.placements.size(), 3);
  EXPECT_EQ(dest.placements[1].moby_id, 1501);
  EXPECT_EQ(dest.placements[2].moby_id, 1502);
  EXPECT_EQ(dest.placements[1].model, dest.find_model(10));
  EXPECT_EQ(dest.moby_ids, (QVector<int>{1500, 1501, 1502}));
}

TEST(CollectionTransferTest, FirstCopiedPlacementStartsAt1000) {
  const AssetCollection source = level_with(10, patterned_bytes(16, 1), QByteArray(), QByteArray());
  AssetCollection dest;
  ASSERT_TRUE(copy_models_to_collection(source, &dest));
  EXPECT_EQ(dest.placements[0].moby_id, 1000);
  EXPECT_TRUE(dest.pvars.isEmpty());
}

TEST(CollectionTransferTest, ExistingModelIsKeptWithoutOverwrite) {
  const AssetCollection source = level_with(10, patterned_bytes(16, 1), QByteArray(), QByteArray());
  AssetCollection dest;
  auto existing = make_model(10);
  existing->unk6 = 0x1234;
  dest.add_model(std::move(existing));

  TransferReport report;
  ASSERT_TRUE(copy_models_to_collection(source, &dest, {10}, {}, &report));
  EXPECT_EQ(report.models_kept, 1);
  EXPECT_EQ(report.models_copied, 0);
  EXPECT_EQ(dest.find_model(10)->unk6, 0x1234u);
  EXPECT_TRUE(dest.textures.isEmpty());
  EXPECT_EQ(dest.placements.size(), 2);

  TransferOptions overwrite;
  overwrite.allow_overwrite = true;
  overwrite.copy_placements = false;
  ASSERT_TRUE(copy_models_to_collection(source, &dest, {10}, overwrite, &report));
  EXPECT_EQ(report.models_copied, 1);
  EXPECT_EQ(dest.model_count(), 1);
  EXPECT_EQ(dest.find_model(10)->unk6, source.find_model(10)->unk6);
  EXPECT_EQ(dest.placements.size(), 2);
  EXPECT_EQ(dest.placements[0].model, dest.find_model(10));
}

TEST(CollectionTransferTest, PlacementWithOnlyAnIndexKeepsItsBlock) {
  AssetCollection source = level_with(10, patterned_bytes(16, 1), QByteArray(), QByteArray());
  const QByteArray block = patterned_bytes(12, 9);
  source.pvars = {block};
  source.placements[0].pvar_index = 0;

  AssetCollection dest;
  dest.pvars = {patterned_bytes(12, 4)};
  dest.placements = {make_placement(5, -1)};
  dest.placements[0].pvar_index = 0;

  ASSERT_TRUE(copy_models_to_collection(source, &dest));
  ASSERT_EQ(dest.pvars.size(), 2);
  EXPECT_EQ(dest.pvars[dest.placements[0].pvar_index], patterned_bytes(12, 4));
  EXPECT_EQ(dest.pvars[dest.placements[1].pvar_index], block);
  EXPECT_EQ(dest.placements[2].pvar_index, -1);
}

TEST(CollectionTransferTest, DanglingTextureIdIsReportedAndKept) {
  AssetCollection source = level_with(10, patterned_bytes(16, 1), QByteArray(), QByteArray());
  source.find_model(10)->other_texture_configs = {make_config(9)};

  AssetCollection dest;
  TransferReport report;
  ASSERT_TRUE(copy_models_to_collection(source, &dest, {}, {}, &report));
  EXPECT_EQ(report.unmapped_texture_refs, 1);
  ASSERT_EQ(report.reference_issues.size(), 1);
  EXPECT_EQ(report.reference_issues[0].kind, PortErrorKind::ReferenceError);
  EXPECT_EQ(dest.find_model(10)->other_texture_configs[0].texture_id, 9);
  EXPECT_EQ(dest.find_model(10)->texture_configs[0].texture_id, 0);
}

TEST(CollectionTransferTest, FailuresLeaveDestinationUntouched) {
  const AssetCollection source = level_with(10, patterned_bytes(16, 1), patterned_bytes(8, 1), QByteArray());
  PortError error;
  EXPECT_FALSE(copy_models_to_collection(source, nullptr, {}, {}, nullptr, &error));
  EXPECT_EQ(error.kind, PortErrorKind::InvalidInput);

  AssetCollection dest;
  dest.textures = {make_texture(0, 2, 2, patterned_bytes(4, 0))};
  TransferReport report;
  error.clear();
  EXPECT_FALSE(copy_models_to_collection(source, &dest, {77, 78}, {}, &report, &error));
  EXPECT_EQ(error.kind, PortErrorKind::NotFound);
  EXPECT_EQ(report.missing_model_ids, (QVector<int>{77, 78}));
  EXPECT_EQ(dest.model_count(), 0);
  EXPECT_EQ(dest.textures.size(), 1);
  EXPECT_TRUE(dest.placements.isEmpty());

  AssetCollection self = level_with(12, patterned_bytes(16, 1), QByteArray(), QByteArray());
  error.clear();
  EXPECT_FALSE(copy_models_to_collection(self, &self, {}, {}, nullptr, &error));
  EXPECT_EQ(error.kind, PortErrorKind::InvalidInput);
}
