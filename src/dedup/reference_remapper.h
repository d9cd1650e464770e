#pragma once

#include <QHash>
#include <QString>

#include <optional>

#include "model/port_error.h"

// Old-index -> new-index table for one reference namespace ("texture", "pvar", ...)
// during a single import. Unrecorded lookups fail; the caller decides any fallback.
class ReferenceRemapper {
public:
  explicit ReferenceRemapper(QString reference_namespace);

  // Records src -> dst. A later record for the same src replaces the earlier one.
  void record(int source_index, int destination_index);

  // Destination index for |source_index|, or nullopt with a NotFound error.
  [[nodiscard]] std::optional<int> resolve(int source_index, PortError* error = nullptr) const;

  [[nodiscard]] bool contains(int source_index) const { return map_.contains(source_index); }
  [[nodiscard]] int size() const { return static_cast<int>(map_.size()); }
  [[nodiscard]] const QString& reference_namespace() const { return namespace_; }

private:
  QString namespace_;
  QHash<int, int> map_;
};
