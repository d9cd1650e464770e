#include <gtest/gtest.h>

#include "dedup/reference_remapper.h"
#include "test_support.h"

TEST(ReferenceRemapperTest, ResolvesRecordedIndices) {
  ReferenceRemapper remap("texture");
  remap.record(3, 0);
  remap.record(5, 1);
  EXPECT_EQ(remap.resolve(3), 0);
  EXPECT_EQ(remap.resolve(5), 1);
  EXPECT_EQ(remap.size(), 2);
  EXPECT_TRUE(remap.contains(5));
  EXPECT_FALSE(remap.contains(4));
}

TEST(ReferenceRemapperTest, UnrecordedIndexFailsWithNotFound) {
  ReferenceRemapper remap("texture");
  remap.record(1, 9);
  PortError error;
  EXPECT_FALSE(remap.resolve(2, &error).has_value());
  EXPECT_EQ(error.kind, PortErrorKind::NotFound);
  EXPECT_TRUE(error.message.contains("texture"));
  EXPECT_TRUE(error.message.contains("2"));
}

TEST(ReferenceRemapperTest, LaterRecordReplacesEarlierOne) {
  ReferenceRemapper remap("pvar");
  remap.record(0, 4);
  remap.record(0, 7);
  EXPECT_EQ(remap.resolve(0), 7);
  EXPECT_EQ(remap.size(), 1);
  EXPECT_EQ(remap.reference_namespace(), QString("pvar"));
}
