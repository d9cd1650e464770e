#include "format/moby_codec.h"

#include <QCborArray>
#include <QCborValue>

#include <limits>
#include <utility>

#include "format/byte_io.h"
#include "format/compressed_file.h"

namespace {
void put(QCborMap& map, const char* key, const QCborValue& value) {
  map.insert(QString::fromLatin1(key), value);
}

QCborValue get(const QCborMap& map, const char* key) {
  return map.value(QString::fromLatin1(key));
}

qint64 get_int(const QCborMap& map, const char* key, qint64 fallback = 0) {
  return get(map, key).toInteger(fallback);
}

float get_float(const QCborMap& map, const char* key, float fallback = 0.0f) {
  return static_cast<float>(get(map, key).toDouble(static_cast<double>(fallback)));
}

// Reads an integer field that must fit [min, max] before it is narrowed. Missing fields read as 0.
bool get_bounded_int(const QCborMap& map, const char* key, qint64 min, qint64 max, qint64* out, PortError* error) {
  const qint64 value = get_int(map, key);
  if (value < min || value > max) {
    return fail(error, PortErrorKind::FormatError, QString("Field %1 value %2 is out of range.").arg(QString::fromLatin1(key)).arg(value));
  }
  *out = value;
  return true;
}

QByteArray get_bytes(const QCborMap& map, const char* key) {
  return get(map, key).toByteArray();
}

QCborArray blocks_to_cbor(const QVector<QByteArray>& blocks) {
  QCborArray out;
  for (const QByteArray& b : blocks) {
    out.append(QCborValue(b));
  }
  return out;
}

QVector<QByteArray> blocks_from_cbor(const QCborValue& value) {
  QVector<QByteArray> out;
  const QCborArray arr = value.toArray();
  out.reserve(arr.size());
  for (const QCborValue& v : arr) {
    out.push_back(v.toByteArray());
  }
  return out;
}

QCborArray configs_to_cbor(const QVector<TextureConfig>& configs) {
  QCborArray out;
  for (const TextureConfig& c : configs) {
    QCborMap entry;
    put(entry, "id", c.texture_id);
    put(entry, "config", QCborValue(c.to_bytes()));
    out.append(entry);
  }
  return out;
}

// The entry id is authoritative for the texture reference; the config bytes carry the rest.
QVector<TextureConfig> configs_from_cbor(const QCborValue& value) {
  QVector<TextureConfig> out;
  const QCborArray arr = value.toArray();
  out.reserve(arr.size());
  for (const QCborValue& v : arr) {
    const QCborMap entry = v.toMap();
    TextureConfig config = TextureConfig::from_bytes(get_bytes(entry, "config"));
    config.texture_id = static_cast<int>(get_int(entry, "id", config.texture_id));
    out.push_back(config);
  }
  return out;
}

QCborMap animation_to_cbor(const MobyAnimation& anim) {
  QCborMap map;
  put(map, "unk1", static_cast<double>(anim.unk1));
  put(map, "unk2", static_cast<double>(anim.unk2));
  put(map, "unk3", static_cast<double>(anim.unk3));
  put(map, "unk4", static_cast<double>(anim.unk4));
  put(map, "unk5", anim.unk5);
  put(map, "unk7", anim.unk7);
  put(map, "null1", static_cast<qint64>(anim.null1));
  put(map, "speed", static_cast<double>(anim.speed));
  put(map, "frames", blocks_to_cbor(anim.frames));
  QCborArray sounds;
  for (int s : anim.sounds) {
    sounds.append(s);
  }
  put(map, "sounds", sounds);
  put(map, "unknown_bytes", QCborValue(anim.unknown_bytes));
  return map;
}

MobyAnimation animation_from_cbor(const QCborMap& map) {
  MobyAnimation anim;
  anim.unk1 = get_float(map, "unk1");
  anim.unk2 = get_float(map, "unk2");
  anim.unk3 = get_float(map, "unk3");
  anim.unk4 = get_float(map, "unk4");
  anim.unk5 = static_cast<quint8>(get_int(map, "unk5"));
  anim.unk7 = static_cast<quint8>(get_int(map, "unk7"));
  anim.null1 = static_cast<quint32>(get_int(map, "null1"));
  anim.speed = get_float(map, "speed");
  anim.frames = blocks_from_cbor(get(map, "frames"));
  const QCborArray sounds = get(map, "sounds").toArray();
  anim.sounds.reserve(sounds.size());
  for (const QCborValue& v : sounds) {
    anim.sounds.push_back(static_cast<int>(v.toInteger()));
  }
  anim.unknown_bytes = get_bytes(map, "unknown_bytes");
  return anim;
}
}  // namespace

QCborMap encode_texture(const MobyTexture& texture) {
  QCborMap map;
  put(map, "id", texture.id);
  put(map, "width", texture.width);
  put(map, "height", texture.height);
  put(map, "mip_count", texture.mip_count);
  put(map, "off06", texture.off06);
  put(map, "off08", texture.off08);
  put(map, "off0c", texture.off0c);
  put(map, "off10", texture.off10);
  put(map, "off14", texture.off14);
  put(map, "off1c", texture.off1c);
  put(map, "off20", texture.off20);
  put(map, "vram_pointer", texture.vram_pointer);
  put(map, "data", QCborValue(texture.data));
  return map;
}

std::optional<MobyTexture> decode_texture(const QCborMap& map, PortError* error) {
  qint64 id = 0;
  qint64 width = 0;
  qint64 height = 0;
  qint64 mip_count = 0;
  if (!get_bounded_int(map, "id", std::numeric_limits<int>::min(), std::numeric_limits<int>::max(), &id, error) ||
      !get_bounded_int(map, "width", 0, std::numeric_limits<qint16>::max(), &width, error) ||
      !get_bounded_int(map, "height", 0, std::numeric_limits<qint16>::max(), &height, error) ||
      !get_bounded_int(map, "mip_count", 0, std::numeric_limits<quint8>::max(), &mip_count, error)) {
    return std::nullopt;
  }

  MobyTexture texture;
  texture.id = static_cast<int>(id);
  texture.width = static_cast<qint16>(width);
  texture.height = static_cast<qint16>(height);
  texture.mip_count = static_cast<quint8>(mip_count);
  texture.off06 = static_cast<quint16>(get_int(map, "off06"));
  texture.off08 = static_cast<qint32>(get_int(map, "off08"));
  texture.off0c = static_cast<qint32>(get_int(map, "off0c"));
  texture.off10 = static_cast<qint32>(get_int(map, "off10"));
  texture.off14 = static_cast<qint32>(get_int(map, "off14"));
  texture.off1c = static_cast<qint32>(get_int(map, "off1c"));
  texture.off20 = static_cast<qint32>(get_int(map, "off20"));
  texture.vram_pointer = static_cast<qint32>(get_int(map, "vram_pointer"));
  texture.data = get_bytes(map, "data");
  return texture;
}

QCborMap encode_model_fields(const MobyModel& model) {
  QCborMap map;
  put(map, "model_id", model.id);
  put(map, "vertex_stride", model.vertex_stride());
  put(map, "vertex_count", model.vertex_count());
  put(map, "face_count", model.face_count());
  put(map, "vertex_buffer", QCborValue(raw_bytes_of<float>(model.vertex_buffer)));
  put(map, "index_buffer", QCborValue(raw_bytes_of<quint16>(model.index_buffer)));

  put(map, "bone_count", model.bone_count);
  put(map, "lp_bone_count", model.lp_bone_count);
  put(map, "texture_configs", configs_to_cbor(model.texture_configs));
  put(map, "other_texture_configs", configs_to_cbor(model.other_texture_configs));

  QCborArray animations;
  for (const MobyAnimation& anim : model.animations) {
    animations.append(animation_to_cbor(anim));
  }
  put(map, "animations", animations);

  QVector<QByteArray> matrices;
  matrices.reserve(model.bone_matrices.size());
  for (const BoneMatrix& m : model.bone_matrices) {
    matrices.push_back(m.raw);
  }
  put(map, "bone_matrices", blocks_to_cbor(matrices));

  QVector<QByteArray> datas;
  datas.reserve(model.bone_datas.size());
  for (const BoneData& d : model.bone_datas) {
    datas.push_back(d.raw);
  }
  put(map, "bone_datas", blocks_to_cbor(datas));

  put(map, "attachments", blocks_to_cbor(model.attachments));
  put(map, "model_sounds", blocks_to_cbor(model.model_sounds));
  put(map, "index_attachments", QCborValue(model.index_attachments));
  put(map, "other_buffer", QCborValue(model.other_buffer));
  put(map, "other_index_buffer", QCborValue(raw_bytes_of<quint16>(model.other_index_buffer)));
  put(map, "weights", QCborValue(raw_bytes_of<quint32>(model.weights)));
  put(map, "bone_ids", QCborValue(raw_bytes_of<quint32>(model.bone_ids)));
  put(map, "type10_block", QCborValue(model.type10_block));

  put(map, "null1", model.null1);
  put(map, "count3", model.count3);
  put(map, "count4", model.count4);
  put(map, "lp_render_dist", model.lp_render_dist);
  put(map, "count8", model.count8);
  put(map, "null2", model.null2);
  put(map, "null3", model.null3);
  put(map, "unk1", static_cast<double>(model.unk1));
  put(map, "unk2", static_cast<double>(model.unk2));
  put(map, "unk3", static_cast<double>(model.unk3));
  put(map, "unk4", static_cast<double>(model.unk4));
  put(map, "color2", static_cast<qint64>(model.color2));
  put(map, "unk6", static_cast<qint64>(model.unk6));
  put(map, "vertex_count2", model.vertex_count2);
  put(map, "size", static_cast<double>(model.size));
  return map;
}

std::optional<MobyModel> decode_model_fields(const QCborMap& map, PortError* error) {
  const QCborValue id = get(map, "model_id");
  if (!id.isInteger()) {
    fail(error, PortErrorKind::FormatError, "Record has no model_id.");
    return std::nullopt;
  }

  const qint64 raw_id = id.toInteger();
  if (raw_id < std::numeric_limits<int>::min() || raw_id > std::numeric_limits<int>::max()) {
    fail(error, PortErrorKind::FormatError, QString("Record model_id %1 is out of range.").arg(raw_id));
    return std::nullopt;
  }
  qint64 stride = 0;
  if (!get_bounded_int(map, "vertex_stride", 0, std::numeric_limits<int>::max(), &stride, error)) {
    return std::nullopt;
  }

  MobyModel model(static_cast<int>(raw_id), static_cast<int>(stride));
  model.vertex_buffer = values_from_raw<float, QVector<float>>(get_bytes(map, "vertex_buffer"));
  model.index_buffer = values_from_raw<quint16, QVector<quint16>>(get_bytes(map, "index_buffer"));

  model.bone_count = static_cast<quint8>(get_int(map, "bone_count"));
  model.lp_bone_count = static_cast<quint8>(get_int(map, "lp_bone_count"));
  model.texture_configs = configs_from_cbor(get(map, "texture_configs"));
  model.other_texture_configs = configs_from_cbor(get(map, "other_texture_configs"));

  const QCborArray animations = get(map, "animations").toArray();
  model.animations.reserve(animations.size());
  for (const QCborValue& v : animations) {
    model.animations.push_back(animation_from_cbor(v.toMap()));
  }

  for (const QByteArray& raw : blocks_from_cbor(get(map, "bone_matrices"))) {
    model.bone_matrices.push_back(BoneMatrix{raw});
  }
  for (const QByteArray& raw : blocks_from_cbor(get(map, "bone_datas"))) {
    model.bone_datas.push_back(BoneData{raw});
  }

  model.attachments = blocks_from_cbor(get(map, "attachments"));
  model.model_sounds = blocks_from_cbor(get(map, "model_sounds"));
  model.index_attachments = get_bytes(map, "index_attachments");
  model.other_buffer = get_bytes(map, "other_buffer");
  model.other_index_buffer = values_from_raw<quint16, QVector<quint16>>(get_bytes(map, "other_index_buffer"));
  model.weights = values_from_raw<quint32, QVector<quint32>>(get_bytes(map, "weights"));
  model.bone_ids = values_from_raw<quint32, QVector<quint32>>(get_bytes(map, "bone_ids"));
  model.type10_block = get_bytes(map, "type10_block");

  model.null1 = static_cast<qint32>(get_int(map, "null1"));
  model.count3 = static_cast<quint8>(get_int(map, "count3"));
  model.count4 = static_cast<quint8>(get_int(map, "count4"));
  model.lp_render_dist = static_cast<quint8>(get_int(map, "lp_render_dist"));
  model.count8 = static_cast<quint8>(get_int(map, "count8"));
  model.null2 = static_cast<qint32>(get_int(map, "null2"));
  model.null3 = static_cast<qint32>(get_int(map, "null3"));
  model.unk1 = get_float(map, "unk1");
  model.unk2 = get_float(map, "unk2");
  model.unk3 = get_float(map, "unk3");
  model.unk4 = get_float(map, "unk4");
  model.color2 = static_cast<quint32>(get_int(map, "color2"));
  model.unk6 = static_cast<quint32>(get_int(map, "unk6"));
  model.vertex_count2 = static_cast<quint16>(get_int(map, "vertex_count2"));
  model.size = get_float(map, "size", 1.0f);
  return model;
}

QCborMap encode_moby_record(const MobyRecord& record) {
  QCborMap map = encode_model_fields(record.model);
  put(map, "version", kMobyRecordVersion);
  put(map, "model_name", record.model_name);
  put(map, "game_num", record.game_num);
  QCborArray textures;
  for (const MobyTexture& t : record.textures) {
    textures.append(encode_texture(t));
  }
  put(map, "textures", textures);
  return map;
}

std::optional<MobyRecord> decode_moby_record(const QCborMap& map, PortError* error) {
  const qint64 version = get_int(map, "version", kMobyRecordVersion);
  if (version < 1 || version > kMobyRecordVersion) {
    fail(error, PortErrorKind::FormatError, QString("Unsupported record version: %1").arg(version));
    return std::nullopt;
  }

  std::optional<MobyModel> model = decode_model_fields(map, error);
  if (!model) {
    return std::nullopt;
  }

  MobyRecord record;
  record.model = std::move(*model);
  record.model_name = get(map, "model_name").toString();
  record.game_num = static_cast<int>(get_int(map, "game_num"));
  const QCborArray textures = get(map, "textures").toArray();
  record.textures.reserve(textures.size());
  for (const QCborValue& v : textures) {
    std::optional<MobyTexture> texture = decode_texture(v.toMap(), error);
    if (!texture) {
      return std::nullopt;
    }
    record.textures.push_back(std::move(*texture));
  }
  return record;
}

QByteArray serialize_moby_record(const MobyRecord& record) {
  return QCborValue(encode_moby_record(record)).toCbor();
}

std::optional<MobyRecord> parse_moby_record(const QByteArray& cbor, PortError* error) {
  QCborParserError parse_error;
  const QCborValue root = QCborValue::fromCbor(cbor, &parse_error);
  if (parse_error.error != QCborError::NoError) {
    fail(error, PortErrorKind::FormatError, QString("Malformed record: %1").arg(parse_error.errorString()));
    return std::nullopt;
  }
  if (!root.isMap()) {
    fail(error, PortErrorKind::FormatError, "Record is not a field map.");
    return std::nullopt;
  }
  return decode_moby_record(root.toMap(), error);
}

bool write_moby_file(const QString& path, const MobyRecord& record, int level, PortError* error) {
  return write_compressed_file(path, QByteArray(kMobyFileMagic), serialize_moby_record(record), level, error);
}

std::optional<MobyRecord> read_moby_file(const QString& path, PortError* error) {
  const std::optional<QByteArray> payload = read_compressed_file(path, QByteArray(kMobyFileMagic), error);
  if (!payload) {
    return std::nullopt;
  }
  PortError inner;
  std::optional<MobyRecord> record = parse_moby_record(*payload, &inner);
  if (!record) {
    fail(error, inner.kind, QString("%1: %2").arg(path, inner.message));
    return std::nullopt;
  }
  return record;
}
