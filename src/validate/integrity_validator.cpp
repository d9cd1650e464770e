#include "validate/integrity_validator.h"

#include <algorithm>

namespace {
void add_finding(IntegrityReport* report,
                 FindingKind kind,
                 int subject,
                 const QString& field,
                 int value,
                 const QString& message) {
  IntegrityFinding f;
  f.kind = kind;
  f.subject = subject;
  f.field = field;
  f.value = value;
  f.message = message;
  report->findings.push_back(f);
}

void check_configs(const QVector<TextureConfig>& configs,
                   const char* field,
                   int model_id,
                   int texture_count,
                   IntegrityReport* report) {
  for (const TextureConfig& config : configs) {
    if (config.texture_id < 0 || config.texture_id >= texture_count) {
      add_finding(report,
                  FindingKind::TextureIdOutOfRange,
                  model_id,
                  QString::fromLatin1(field),
                  config.texture_id,
                  QString("Model %1 %2 references texture %3 (pool has %4).")
                      .arg(model_id)
                      .arg(QString::fromLatin1(field))
                      .arg(config.texture_id)
                      .arg(texture_count));
    }
  }
}
}  // namespace

int IntegrityReport::count(FindingKind kind) const {
  return static_cast<int>(std::count_if(findings.cbegin(), findings.cend(), [kind](const IntegrityFinding& f) {
    return f.kind == kind;
  }));
}

std::optional<int> find_pvar_gap(const QVector<MobyPlacement>& placements) {
  QVector<int> ids;
  ids.reserve(placements.size());
  for (const MobyPlacement& p : placements) {
    if (p.pvar_index >= 0) {
      ids.push_back(p.pvar_index);
    }
  }
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  for (int i = 0; i < ids.size(); ++i) {
    if (ids[i] != i) {
      return i;
    }
  }
  return std::nullopt;
}

bool check_pvar_contiguity(const QVector<MobyPlacement>& placements, PortError* error) {
  const std::optional<int> gap = find_pvar_gap(placements);
  if (gap) {
    return fail(error, PortErrorKind::IntegrityViolation, QString("pVar hole at %1.").arg(*gap));
  }
  return true;
}

IntegrityReport check_reference_ranges(const AssetCollection& collection) {
  IntegrityReport report;
  const int pvar_count = static_cast<int>(collection.pvars.size());

  for (const MobyPlacement& p : collection.placements) {
    if (p.model_id < -1 || (p.model_id > -1 && !collection.find_model(p.model_id))) {
      add_finding(&report,
                  FindingKind::UnknownModel,
                  p.moby_id,
                  "model_id",
                  p.model_id,
                  QString("Placement %1 references model %2, which is not in the collection.")
                      .arg(p.moby_id)
                      .arg(p.model_id));
    }
    if (p.pvar_index < -1 || p.pvar_index >= pvar_count) {
      add_finding(&report,
                  FindingKind::PvarIndexOutOfRange,
                  p.moby_id,
                  "pvar_index",
                  p.pvar_index,
                  QString("Placement %1 pvar index %2 is outside [-1, %3).")
                      .arg(p.moby_id)
                      .arg(p.pvar_index)
                      .arg(pvar_count));
    }
  }

  const int texture_count = static_cast<int>(collection.textures.size());
  for (const std::unique_ptr<MobyModel>& m : collection.models) {
    if (!m) {
      continue;
    }
    check_configs(m->texture_configs, "texture_configs", m->id, texture_count, &report);
    check_configs(m->other_texture_configs, "other_texture_configs", m->id, texture_count, &report);
  }
  return report;
}

IntegrityReport validate_collection(const AssetCollection& collection) {
  IntegrityReport report;
  const std::optional<int> gap = find_pvar_gap(collection.placements);
  if (gap) {
    add_finding(&report, FindingKind::PvarGap, -1, "pvar_index", *gap, QString("pVar hole at %1.").arg(*gap));
  }
  report.findings += check_reference_ranges(collection).findings;
  return report;
}
