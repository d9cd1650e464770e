#include <gtest/gtest.h>

#include "test_support.h"
#include "validate/integrity_validator.h"

using namespace test_support;

namespace {
QVector<MobyPlacement> placements_with_pvar_indices(const QVector<int>& indices) {
  QVector<MobyPlacement> out;
  for (int i = 0; i < indices.size(); ++i) {
    MobyPlacement p = make_placement(100 + i, -1);
    p.pvar_index = indices[i];
    out.push_back(p);
  }
  return out;
}
}  // namespace

TEST(IntegrityValidatorTest, GapInPvarIndicesNamesTheMissingValue) {
  const QVector<MobyPlacement> placements = placements_with_pvar_indices({0, 1, 3});
  EXPECT_EQ(find_pvar_gap(placements), 2);

  PortError error;
  EXPECT_FALSE(check_pvar_contiguity(placements, &error));
  EXPECT_EQ(error.kind, PortErrorKind::IntegrityViolation);
  EXPECT_TRUE(error.message.contains("2"));
}

TEST(IntegrityValidatorTest, SequenceMustStartAtZero) {
  EXPECT_EQ(find_pvar_gap(placements_with_pvar_indices({1, 2})), 0);
}

TEST(IntegrityValidatorTest, SentinelsAndSharedIndicesAreContiguous) {
  EXPECT_FALSE(find_pvar_gap(placements_with_pvar_indices({-1, 1, 0, 0, -1, 2})).has_value());
  EXPECT_FALSE(find_pvar_gap(placements_with_pvar_indices({-1, -1})).has_value());
  EXPECT_TRUE(check_pvar_contiguity({}));
}

TEST(IntegrityValidatorTest, ReferenceViolationsAreReportedIndividually) {
  AssetCollection c;
  c.add_model(make_model(5));
  c.pvars = {QByteArray("a"), QByteArray("b")};
  c.placements = placements_with_pvar_indices({0, 2, -3, 1});
  c.placements[0].model_id = 5;
  c.placements[1].model_id = 6;
  c.placements[3].model_id = -2;

  const IntegrityReport report = check_reference_ranges(c);
  EXPECT_EQ(report.count(FindingKind::UnknownModel), 2);
  EXPECT_EQ(report.count(FindingKind::PvarIndexOutOfRange), 2);
  ASSERT_EQ(report.findings.size(), 4);

  EXPECT_EQ(report.findings[0].subject, 101);
  EXPECT_EQ(report.findings[0].field, QString("model_id"));
  EXPECT_EQ(report.findings[0].value, 6);
  EXPECT_EQ(report.findings[1].subject, 101);
  EXPECT_EQ(report.findings[1].value, 2);
  EXPECT_EQ(report.findings[2].subject, 102);
  EXPECT_EQ(report.findings[2].value, -3);
  EXPECT_EQ(report.findings[3].subject, 103);
  EXPECT_EQ(report.findings[3].value, -2);
}

TEST(IntegrityValidatorTest, TextureConfigsOutsideThePoolAreReported) {
  AssetCollection c;
  auto model = make_model(9);
  model->texture_configs = {make_config(0), make_config(3)};
  model->other_texture_configs = {make_config(-1)};
  c.add_model(std::move(model));
  c.textures = {make_texture(0, 2, 2, patterned_bytes(4, 1))};

  const IntegrityReport report = check_reference_ranges(c);
  EXPECT_EQ(report.count(FindingKind::TextureIdOutOfRange), 2);
  EXPECT_EQ(report.findings[0].value, 3);
  EXPECT_EQ(report.findings[1].field, QString("other_texture_configs"));
}

TEST(IntegrityValidatorTest, ValidateCollectionCombinesChecksWithoutFixingAnything) {
  AssetCollection c;
  c.pvars = {QByteArray("a"), QByteArray("b"), QByteArray("c"), QByteArray("d")};
  c.placements = placements_with_pvar_indices({0, 1, 3});
  const IntegrityReport report = validate_collection(c);
  EXPECT_FALSE(report.ok());
  EXPECT_EQ(report.count(FindingKind::PvarGap), 1);
  EXPECT_EQ(report.findings[0].value, 2);
  EXPECT_EQ(c.placements[2].pvar_index, 3);
}

TEST(IntegrityValidatorTest, CleanCollectionHasNoFindings) {
  AssetCollection c;
  c.add_model(make_model(1));
  c.pvars = {QByteArray("a")};
  c.placements = placements_with_pvar_indices({0, -1});
  c.placements[0].model_id = 1;
  EXPECT_TRUE(validate_collection(c).ok());
}
