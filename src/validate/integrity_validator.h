#pragma once

#include <QString>
#include <QVector>

#include <optional>

#include "collection/asset_collection.h"
#include "model/port_error.h"

enum class FindingKind {
  PvarGap = 0,
  UnknownModel,
  PvarIndexOutOfRange,
  TextureIdOutOfRange,
};

// One violation. |subject| is the placement's moby_id, or the model id for texture configs.
struct IntegrityFinding {
  FindingKind kind = FindingKind::PvarGap;
  int subject = -1;
  QString field;
  int value = 0;
  QString message;
};

struct IntegrityReport {
  QVector<IntegrityFinding> findings;

  [[nodiscard]] bool ok() const { return findings.isEmpty(); }
  [[nodiscard]] int count(FindingKind kind) const;
};

// Smallest missing value of the distinct non-negative pvar indices, or nullopt when they
// are exactly 0..k-1. The -1 sentinel is ignored.
[[nodiscard]] std::optional<int> find_pvar_gap(const QVector<MobyPlacement>& placements);

// IntegrityViolation naming the missing index when find_pvar_gap() finds one.
[[nodiscard]] bool check_pvar_contiguity(const QVector<MobyPlacement>& placements, PortError* error = nullptr);

// Placement model ids and pvar indices, plus model texture config ids. Every offending
// value is reported on its own.
[[nodiscard]] IntegrityReport check_reference_ranges(const AssetCollection& collection);

// Contiguity and reference ranges together. Findings are diagnostic; nothing is fixed.
[[nodiscard]] IntegrityReport validate_collection(const AssetCollection& collection);
