#include <gtest/gtest.h>

#include "exchange/pvar_consolidator.h"
#include "test_support.h"
#include "validate/integrity_validator.h"

using namespace test_support;

TEST(PvarConsolidatorTest, DistinctBlocksGetContiguousIndices) {
  QVector<QByteArray> blocks;
  for (int i = 0; i < 5; ++i) {
    blocks.push_back(patterned_bytes(16, i));
  }
  const BlockConsolidation result = consolidate_blocks(blocks);
  EXPECT_EQ(result.indices, (QVector<int>{0, 1, 2, 3, 4}));
  EXPECT_EQ(result.table, blocks);
}

TEST(PvarConsolidatorTest, EmptyBlocksGetSentinelAndStayOutOfTable) {
  const QByteArray a = patterned_bytes(8, 1);
  const QByteArray b = patterned_bytes(8, 2);
  const BlockConsolidation result = consolidate_blocks({QByteArray(), a, QByteArray(""), b, a, QByteArray()});
  EXPECT_EQ(result.indices, (QVector<int>{-1, 0, -1, 1, 0, -1}));
  ASSERT_EQ(result.table.size(), 2);
  EXPECT_EQ(result.table[0], a);
  EXPECT_EQ(result.table[1], b);
}

TEST(PvarConsolidatorTest, FirstOccurrenceOrderIsPreserved) {
  const QByteArray a = patterned_bytes(2048, 1);
  const QByteArray b = patterned_bytes(2048, 2);
  const BlockConsolidation result = consolidate_blocks({b, a, b, a});
  EXPECT_EQ(result.indices, (QVector<int>{0, 1, 0, 1}));
  EXPECT_EQ(result.table[0], b);
}

TEST(PvarConsolidatorTest, CollectionConsolidationRewritesPlacements) {
  AssetCollection c;
  const QByteArray shared = patterned_bytes(32, 3);
  c.placements = {make_placement(1, -1, shared),
                  make_placement(2, -1),
                  make_placement(3, -1, patterned_bytes(32, 4)),
                  make_placement(4, -1, shared)};
  c.placements[1].pvar_index = 17;
  c.pvars = {QByteArray("stale")};

  ASSERT_TRUE(consolidate_collection_pvars(&c));
  EXPECT_EQ(c.placements[0].pvar_index, 0);
  EXPECT_EQ(c.placements[1].pvar_index, -1);
  EXPECT_EQ(c.placements[2].pvar_index, 1);
  EXPECT_EQ(c.placements[3].pvar_index, 0);
  ASSERT_EQ(c.pvars.size(), 2);
  EXPECT_EQ(c.pvars[0], shared);

  EXPECT_TRUE(check_pvar_contiguity(c.placements));
  EXPECT_TRUE(check_reference_ranges(c).ok());
}

TEST(PvarConsolidatorTest, NullCollectionIsInvalidInput) {
  PortError error;
  EXPECT_FALSE(consolidate_collection_pvars(nullptr, ContentPool::kDefaultDigestThreshold, &error));
  EXPECT_EQ(error.kind, PortErrorKind::InvalidInput);
}
