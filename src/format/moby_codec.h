#pragma once

#include <QByteArray>
#include <QCborMap>
#include <QString>
#include <QVector>

#include <optional>

#include "model/moby_model.h"
#include "model/port_error.h"

constexpr int kMobyRecordVersion = 1;
constexpr char kMobyFileMagic[] = "RMBY";

// Self-contained export of one model: the model itself plus full copies of every texture
// its configs reference. Texture configs keep their source texture ids.
struct MobyRecord {
  QString model_name;
  int game_num = 0;
  MobyModel model{0, 0};
  QVector<MobyTexture> textures;
};

// Field-tagged CBOR encoding. Missing fields decode to defaults.
[[nodiscard]] QCborMap encode_moby_record(const MobyRecord& record);
[[nodiscard]] std::optional<MobyRecord> decode_moby_record(const QCborMap& map, PortError* error = nullptr);

[[nodiscard]] QByteArray serialize_moby_record(const MobyRecord& record);
[[nodiscard]] std::optional<MobyRecord> parse_moby_record(const QByteArray& cbor, PortError* error = nullptr);

[[nodiscard]] bool write_moby_file(const QString& path, const MobyRecord& record, int level, PortError* error = nullptr);
[[nodiscard]] std::optional<MobyRecord> read_moby_file(const QString& path, PortError* error = nullptr);

// Building blocks shared with the collection snapshot codec.
[[nodiscard]] QCborMap encode_model_fields(const MobyModel& model);
[[nodiscard]] std::optional<MobyModel> decode_model_fields(const QCborMap& map, PortError* error = nullptr);
[[nodiscard]] QCborMap encode_texture(const MobyTexture& texture);
[[nodiscard]] std::optional<MobyTexture> decode_texture(const QCborMap& map, PortError* error = nullptr);
