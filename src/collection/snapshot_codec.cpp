#include "collection/snapshot_codec.h"

#include <QCborArray>
#include <QCborMap>
#include <QCborValue>
#include <QDebug>
#include <QFileInfo>

#include "format/compressed_file.h"
#include "format/moby_codec.h"
#include "mobyport_config.h"

namespace {
QCborValue field(const QCborMap& map, const char* key) {
  return map.value(QString::fromLatin1(key));
}

QCborMap encode_placement(const MobyPlacement& p) {
  QCborMap map;
  map.insert(QStringLiteral("moby_id"), p.moby_id);
  map.insert(QStringLiteral("model_id"), p.model_id);
  map.insert(QStringLiteral("pvar_index"), p.pvar_index);
  map.insert(QStringLiteral("pvars"), QCborValue(p.pvars));
  map.insert(QStringLiteral("group_index"), p.group_index);
  map.insert(QStringLiteral("mission_id"), p.mission_id);
  map.insert(QStringLiteral("spawn_type"), p.spawn_type);
  return map;
}

MobyPlacement decode_placement(const QCborMap& map) {
  MobyPlacement p;
  p.moby_id = static_cast<int>(field(map, "moby_id").toInteger());
  p.model_id = static_cast<int>(field(map, "model_id").toInteger(-1));
  p.pvar_index = static_cast<int>(field(map, "pvar_index").toInteger(-1));
  p.pvars = field(map, "pvars").toByteArray();
  p.group_index = static_cast<int>(field(map, "group_index").toInteger(-1));
  p.mission_id = static_cast<int>(field(map, "mission_id").toInteger());
  p.spawn_type = static_cast<int>(field(map, "spawn_type").toInteger());
  return p;
}
}  // namespace

bool SnapshotCodec::can_handle(const QString& path) const {
  return path.endsWith(QStringLiteral(MOBYPORT_SNAPSHOT_EXTENSION), Qt::CaseInsensitive);
}

std::unique_ptr<AssetCollection> SnapshotCodec::load(const QString& path, PortError* error) {
  const std::optional<QByteArray> payload = read_compressed_file(path, QByteArray(kSnapshotMagic), error);
  if (!payload) {
    return nullptr;
  }

  QCborParserError parse_error;
  const QCborValue root = QCborValue::fromCbor(*payload, &parse_error);
  if (parse_error.error != QCborError::NoError || !root.isMap()) {
    fail(error, PortErrorKind::FormatError, QString("%1: malformed snapshot.").arg(QFileInfo(path).fileName()));
    return nullptr;
  }
  const QCborMap map = root.toMap();
  const qint64 version = field(map, "version").toInteger(0);
  if (version != kSnapshotVersion) {
    fail(error,
         PortErrorKind::FormatError,
         QString("%1: unsupported snapshot version %2.").arg(QFileInfo(path).fileName()).arg(version));
    return nullptr;
  }

  auto collection = std::make_unique<AssetCollection>();
  collection->path = path;
  collection->game_num = static_cast<int>(field(map, "game_num").toInteger());

  const QCborArray models = field(map, "models").toArray();
  for (qsizetype i = 0; i < models.size(); ++i) {
    PortError inner;
    std::optional<MobyModel> model = decode_model_fields(models.at(i).toMap(), &inner);
    if (!model) {
      fail(error,
           PortErrorKind::FormatError,
           QString("%1: model %2: %3").arg(QFileInfo(path).fileName()).arg(i).arg(inner.message));
      return nullptr;
    }
    collection->add_model(std::make_unique<MobyModel>(std::move(*model)));
  }

  for (const QCborValue& v : field(map, "textures").toArray()) {
    PortError inner;
    std::optional<MobyTexture> texture = decode_texture(v.toMap(), &inner);
    if (!texture) {
      fail(error,
           PortErrorKind::FormatError,
           QString("%1: texture %2: %3").arg(QFileInfo(path).fileName()).arg(collection->textures.size()).arg(inner.message));
      return nullptr;
    }
    collection->textures.push_back(std::move(*texture));
  }
  for (const QCborValue& v : field(map, "placements").toArray()) {
    collection->placements.push_back(decode_placement(v.toMap()));
  }
  for (const QCborValue& v : field(map, "pvars").toArray()) {
    collection->pvars.push_back(v.toByteArray());
  }

  update_model_bookkeeping(collection.get());
  qInfo().noquote() << QString("%1: loaded %2 (%3 models, %4 textures, %5 placements).")
                           .arg(format_name())
                           .arg(QFileInfo(path).fileName())
                           .arg(collection->model_count())
                           .arg(collection->textures.size())
                           .arg(collection->placements.size());
  return collection;
}

bool SnapshotCodec::save(const AssetCollection& collection, const QString& path, PortError* error) {
  QCborMap map;
  map.insert(QStringLiteral("version"), kSnapshotVersion);
  map.insert(QStringLiteral("game_num"), collection.game_num);

  QCborArray models;
  for (const std::unique_ptr<MobyModel>& m : collection.models) {
    if (m) {
      models.append(encode_model_fields(*m));
    }
  }
  map.insert(QStringLiteral("models"), models);

  QCborArray textures;
  for (const MobyTexture& t : collection.textures) {
    textures.append(encode_texture(t));
  }
  map.insert(QStringLiteral("textures"), textures);

  QCborArray placements;
  for (const MobyPlacement& p : collection.placements) {
    placements.append(encode_placement(p));
  }
  map.insert(QStringLiteral("placements"), placements);

  QCborArray pvars;
  for (const QByteArray& block : collection.pvars) {
    pvars.append(QCborValue(block));
  }
  map.insert(QStringLiteral("pvars"), pvars);

  return write_compressed_file(path, QByteArray(kSnapshotMagic), QCborValue(map).toCbor(), compression_level_, error);
}

std::unique_ptr<CollectionCodec> open_collection_codec(const QString& path, int compression_level, PortError* error) {
  auto snapshot = std::make_unique<SnapshotCodec>(compression_level);
  if (snapshot->can_handle(path)) {
    return snapshot;
  }
  fail(error, PortErrorKind::InvalidInput, QString("No collection codec handles %1.").arg(path));
  return nullptr;
}
