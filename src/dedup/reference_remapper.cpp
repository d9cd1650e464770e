#include "dedup/reference_remapper.h"

#include <utility>

ReferenceRemapper::ReferenceRemapper(QString reference_namespace) : namespace_(std::move(reference_namespace)) {}

void ReferenceRemapper::record(int source_index, int destination_index) {
  map_.insert(source_index, destination_index);
}

std::optional<int> ReferenceRemapper::resolve(int source_index, PortError* error) const {
  const auto it = map_.constFind(source_index);
  if (it == map_.constEnd()) {
    fail(error,
         PortErrorKind::NotFound,
         QString("No %1 mapping recorded for index %2.").arg(namespace_).arg(source_index));
    return std::nullopt;
  }
  return it.value();
}
