#include "model/moby_model.h"

#include "format/byte_io.h"

namespace {
qint32 read_i32_or(const QByteArray& bytes, int offset, qint32 fallback) {
  quint32 v = 0;
  if (!read_u32_le(bytes, offset, &v)) {
    return fallback;
  }
  return static_cast<qint32>(v);
}
}  // namespace

QByteArray TextureConfig::to_bytes() const {
  QByteArray out;
  out.reserve(kEncodedSize);
  append_u32_le(&out, static_cast<quint32>(texture_id));
  append_u32_le(&out, static_cast<quint32>(start));
  append_u32_le(&out, static_cast<quint32>(size));
  append_u32_le(&out, static_cast<quint32>(mode));
  append_u32_le(&out, static_cast<quint32>(wrap_s));
  append_u32_le(&out, static_cast<quint32>(wrap_t));
  return out;
}

TextureConfig TextureConfig::from_bytes(const QByteArray& bytes) {
  TextureConfig config;
  if (bytes.size() < kEncodedSizeNoWrap) {
    return config;
  }
  config.texture_id = read_i32_or(bytes, 0, 0);
  config.start = read_i32_or(bytes, 4, 0);
  config.size = read_i32_or(bytes, 8, 0);
  config.mode = read_i32_or(bytes, 12, 0);
  if (bytes.size() >= kEncodedSize) {
    config.wrap_s = static_cast<WrapMode>(read_i32_or(bytes, 16, 0));
    config.wrap_t = static_cast<WrapMode>(read_i32_or(bytes, 20, 0));
  }
  return config;
}

int BoneData::parent() const {
  quint16 v = 0;
  if (!read_u16_be(raw, kParentOffset, &v)) {
    return -1;
  }
  return static_cast<qint16>(v);
}

BoneData BoneData::make(float x, float y, float z, int parent, quint16 flags) {
  BoneData out;
  out.raw = QByteArray(kSize, '\0');
  write_f32_be(&out.raw, 0x00, x);
  write_f32_be(&out.raw, 0x04, y);
  write_f32_be(&out.raw, 0x08, z);
  write_u16_be(&out.raw, 0x0C, flags);
  write_u16_be(&out.raw, kParentOffset, static_cast<quint16>(static_cast<qint16>(parent)));
  return out;
}

int MobyModel::vertex_count() const {
  if (vertex_stride_ <= 0) {
    return 0;
  }
  return static_cast<int>(vertex_buffer.size() / vertex_stride_);
}

int MobyModel::face_count() const {
  return static_cast<int>(index_buffer.size() / 3);
}
