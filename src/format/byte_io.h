#pragma once

#include <QByteArray>
#include <QtGlobal>

#include <cstring>

// Bounds-checked fixed-width reads/writes over QByteArray.

[[nodiscard]] inline bool read_u32_le(const QByteArray& bytes, int offset, quint32* out) {
  if (!out || offset < 0 || offset + 4 > bytes.size()) {
    return false;
  }
  const auto b0 = static_cast<quint8>(bytes[offset + 0]);
  const auto b1 = static_cast<quint8>(bytes[offset + 1]);
  const auto b2 = static_cast<quint8>(bytes[offset + 2]);
  const auto b3 = static_cast<quint8>(bytes[offset + 3]);
  *out = (static_cast<quint32>(b0)) |
         (static_cast<quint32>(b1) << 8) |
         (static_cast<quint32>(b2) << 16) |
         (static_cast<quint32>(b3) << 24);
  return true;
}

[[nodiscard]] inline bool read_u64_le(const QByteArray& bytes, int offset, quint64* out) {
  quint32 lo = 0;
  quint32 hi = 0;
  if (!out || !read_u32_le(bytes, offset, &lo) || !read_u32_le(bytes, offset + 4, &hi)) {
    return false;
  }
  *out = static_cast<quint64>(lo) | (static_cast<quint64>(hi) << 32);
  return true;
}

inline void append_u32_le(QByteArray* bytes, quint32 value) {
  if (!bytes) {
    return;
  }
  bytes->append(static_cast<char>(value & 0xFF));
  bytes->append(static_cast<char>((value >> 8) & 0xFF));
  bytes->append(static_cast<char>((value >> 16) & 0xFF));
  bytes->append(static_cast<char>((value >> 24) & 0xFF));
}

inline void append_u64_le(QByteArray* bytes, quint64 value) {
  append_u32_le(bytes, static_cast<quint32>(value & 0xFFFFFFFFu));
  append_u32_le(bytes, static_cast<quint32>(value >> 32));
}

[[nodiscard]] inline bool read_u16_be(const QByteArray& bytes, int offset, quint16* out) {
  if (!out || offset < 0 || offset + 2 > bytes.size()) {
    return false;
  }
  *out = static_cast<quint16>((static_cast<quint8>(bytes[offset]) << 8) | static_cast<quint8>(bytes[offset + 1]));
  return true;
}

inline void write_u16_be(QByteArray* bytes, int offset, quint16 value) {
  if (!bytes || offset < 0 || offset + 2 > bytes->size()) {
    return;
  }
  (*bytes)[offset + 0] = static_cast<char>((value >> 8) & 0xFF);
  (*bytes)[offset + 1] = static_cast<char>(value & 0xFF);
}

inline void write_f32_be(QByteArray* bytes, int offset, float value) {
  if (!bytes || offset < 0 || offset + 4 > bytes->size()) {
    return;
  }
  quint32 bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  (*bytes)[offset + 0] = static_cast<char>((bits >> 24) & 0xFF);
  (*bytes)[offset + 1] = static_cast<char>((bits >> 16) & 0xFF);
  (*bytes)[offset + 2] = static_cast<char>((bits >> 8) & 0xFF);
  (*bytes)[offset + 3] = static_cast<char>(bits & 0xFF);
}

// Raw in-memory view of a numeric vector, and the reverse. Trailing bytes that do not
// fill a whole element are dropped on the way back.
template <typename T, typename Container>
[[nodiscard]] QByteArray raw_bytes_of(const Container& values) {
  if (values.isEmpty()) {
    return {};
  }
  return QByteArray(reinterpret_cast<const char*>(values.constData()),
                    static_cast<qsizetype>(values.size() * sizeof(T)));
}

template <typename T, typename Container>
[[nodiscard]] Container values_from_raw(const QByteArray& bytes) {
  Container out;
  const qsizetype count = bytes.size() / static_cast<qsizetype>(sizeof(T));
  if (count <= 0) {
    return out;
  }
  out.resize(count);
  std::memcpy(out.data(), bytes.constData(), static_cast<size_t>(count) * sizeof(T));
  return out;
}
