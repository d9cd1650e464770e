#include <gtest/gtest.h>

#include <QHash>

#include "catalog/known_models.h"
#include "exchange/moby_exporter.h"
#include "test_support.h"

TEST(KnownModelsTest, KnownIdsUseTableNames) {
  EXPECT_EQ(friendly_model_name(11), QString("Vendor"));
  EXPECT_EQ(friendly_model_name(1143), QString("VendorLogo"));
  EXPECT_EQ(friendly_model_name(500), QString("Crate"));
  EXPECT_EQ(friendly_model_name(511), QString("AmmoCrate"));
  EXPECT_EQ(friendly_model_name(512), QString("NanotechCrate"));
  EXPECT_EQ(friendly_model_name(501), QString("NanotechCrate"));
  EXPECT_EQ(friendly_model_name(803), QString("SwingshotNode"));
  EXPECT_EQ(friendly_model_name(758), QString("SwingshotPull"));
}

TEST(KnownModelsTest, UnknownIdsUseGenericName) {
  EXPECT_EQ(friendly_model_name(42), QString("Moby_42"));
}

TEST(KnownModelsTest, SanitizeReplacesUnportableCharacters) {
  EXPECT_EQ(sanitize_file_name("a/b\\c:d*e?"), QString("a_b_c_d_e_"));
  EXPECT_EQ(sanitize_file_name("  "), QString("_"));
  EXPECT_EQ(sanitize_file_name(".."), QString("_"));
}

TEST(KnownModelsTest, RepeatNamesGetCounterBeforeId) {
  QHash<QString, int> counts;
  EXPECT_EQ(export_file_name(512, &counts), QString("NanotechCrate_512.rmoby"));
  EXPECT_EQ(export_file_name(501, &counts), QString("NanotechCrate_2_501.rmoby"));
  EXPECT_EQ(export_file_name(42, &counts), QString("Moby_42_42.rmoby"));
  EXPECT_EQ(export_file_name(42, nullptr), QString("Moby_42_42.rmoby"));
}
