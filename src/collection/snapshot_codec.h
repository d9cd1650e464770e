#pragma once

#include <QString>

#include <memory>

#include "collection/asset_collection.h"

constexpr int kSnapshotVersion = 1;
constexpr char kSnapshotMagic[] = "MCOL";

// Whole-collection snapshot: compressed CBOR with the same model/texture encoding as
// .rmoby records, plus placements and the pvar table.
class SnapshotCodec final : public CollectionCodec {
public:
  explicit SnapshotCodec(int compression_level = 10) : compression_level_(compression_level) {}

  [[nodiscard]] QString format_name() const override { return "snapshot"; }
  [[nodiscard]] bool can_handle(const QString& path) const override;

  [[nodiscard]] std::unique_ptr<AssetCollection> load(const QString& path, PortError* error = nullptr) override;
  bool save(const AssetCollection& collection, const QString& path, PortError* error = nullptr) override;

private:
  int compression_level_ = 10;
};

// Codec able to handle |path|, or nullptr with an InvalidInput error.
[[nodiscard]] std::unique_ptr<CollectionCodec> open_collection_codec(const QString& path,
                                                                     int compression_level = 10,
                                                                     PortError* error = nullptr);
