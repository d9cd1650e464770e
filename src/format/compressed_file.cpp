#include "format/compressed_file.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <algorithm>

#include <miniz.h>

#include "format/byte_io.h"

namespace {
QString magic_label(const QByteArray& magic) {
  return QString::fromLatin1(magic);
}
}  // namespace

std::optional<QByteArray> compress_payload(const QByteArray& magic,
                                           const QByteArray& payload,
                                           int level,
                                           PortError* error) {
  if (magic.size() != 4) {
    fail(error, PortErrorKind::InvalidInput, "Container magic must be 4 bytes.");
    return std::nullopt;
  }
  if (static_cast<quint64>(payload.size()) > kMaxCompressedPayload) {
    fail(error, PortErrorKind::InvalidInput, QString("Payload exceeds %1 bytes.").arg(kMaxCompressedPayload));
    return std::nullopt;
  }

  level = std::clamp(level, 0, static_cast<int>(MZ_UBER_COMPRESSION));

  mz_ulong packed_len = mz_compressBound(static_cast<mz_ulong>(payload.size()));
  QByteArray out;
  out.reserve(kCompressedHeaderSize + static_cast<qsizetype>(packed_len));
  out.append(magic);
  append_u32_le(&out, kCompressedContainerVersion);
  append_u64_le(&out, static_cast<quint64>(payload.size()));
  out.resize(kCompressedHeaderSize + static_cast<qsizetype>(packed_len));

  const int rc = mz_compress2(reinterpret_cast<unsigned char*>(out.data() + kCompressedHeaderSize),
                              &packed_len,
                              reinterpret_cast<const unsigned char*>(payload.constData()),
                              static_cast<mz_ulong>(payload.size()),
                              level);
  if (rc != MZ_OK) {
    fail(error, PortErrorKind::FormatError, QString("Compression failed: %1").arg(QString::fromLatin1(mz_error(rc))));
    return std::nullopt;
  }
  out.resize(kCompressedHeaderSize + static_cast<qsizetype>(packed_len));
  return out;
}

std::optional<QByteArray> decompress_payload(const QByteArray& magic,
                                             const QByteArray& container,
                                             PortError* error) {
  if (container.size() < kCompressedHeaderSize) {
    fail(error, PortErrorKind::FormatError, "File is too small to be a compressed container.");
    return std::nullopt;
  }
  if (container.left(4) != magic) {
    fail(error, PortErrorKind::FormatError, QString("Missing %1 header.").arg(magic_label(magic)));
    return std::nullopt;
  }

  quint32 version = 0;
  quint64 declared = 0;
  if (!read_u32_le(container, 4, &version) || !read_u64_le(container, 8, &declared)) {
    fail(error, PortErrorKind::FormatError, "Unable to read container header.");
    return std::nullopt;
  }
  if (version != kCompressedContainerVersion) {
    fail(error, PortErrorKind::FormatError, QString("Unsupported container version: %1").arg(version));
    return std::nullopt;
  }
  if (declared > kMaxCompressedPayload) {
    fail(error, PortErrorKind::FormatError, QString("Declared payload size is too large: %1").arg(declared));
    return std::nullopt;
  }

  QByteArray out;
  // miniz needs a non-null destination even for an empty payload.
  out.resize(std::max<qsizetype>(1, static_cast<qsizetype>(declared)));
  mz_ulong out_len = static_cast<mz_ulong>(out.size());
  const int rc = mz_uncompress(reinterpret_cast<unsigned char*>(out.data()),
                               &out_len,
                               reinterpret_cast<const unsigned char*>(container.constData() + kCompressedHeaderSize),
                               static_cast<mz_ulong>(container.size() - kCompressedHeaderSize));
  if (rc != MZ_OK) {
    fail(error, PortErrorKind::FormatError, QString("Decompression failed: %1").arg(QString::fromLatin1(mz_error(rc))));
    return std::nullopt;
  }
  if (static_cast<quint64>(out_len) != declared) {
    fail(error,
         PortErrorKind::FormatError,
         QString("Decompressed size mismatch (expected %1, got %2).").arg(declared).arg(static_cast<quint64>(out_len)));
    return std::nullopt;
  }
  out.resize(static_cast<qsizetype>(out_len));
  return out;
}

bool write_compressed_file(const QString& path,
                           const QByteArray& magic,
                           const QByteArray& payload,
                           int level,
                           PortError* error) {
  const std::optional<QByteArray> packed = compress_payload(magic, payload, level, error);
  if (!packed) {
    return false;
  }

  const QFileInfo out_info(path);
  if (!out_info.dir().exists()) {
    QDir d(out_info.dir().absolutePath());
    if (!d.mkpath(".")) {
      return fail(error,
                  PortErrorKind::IoError,
                  QString("Unable to create output directory: %1").arg(out_info.dir().absolutePath()));
    }
  }

  QSaveFile out(path);
  if (!out.open(QIODevice::WriteOnly)) {
    return fail(error, PortErrorKind::IoError, QString("Unable to create output file: %1").arg(path));
  }
  if (out.write(*packed) != packed->size()) {
    out.cancelWriting();
    return fail(error, PortErrorKind::IoError, QString("Unable to write output file: %1").arg(path));
  }
  if (!out.commit()) {
    return fail(error, PortErrorKind::IoError, QString("Unable to finalize output file: %1").arg(path));
  }
  return true;
}

std::optional<QByteArray> read_compressed_file(const QString& path, const QByteArray& magic, PortError* error) {
  const QFileInfo info(path);
  if (path.isEmpty() || !info.exists() || !info.isFile()) {
    fail(error, PortErrorKind::NotFound, QString("File not found: %1").arg(path));
    return std::nullopt;
  }

  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) {
    fail(error, PortErrorKind::IoError, QString("Unable to open file: %1").arg(path));
    return std::nullopt;
  }
  if (file.size() > static_cast<qint64>(kMaxCompressedPayload)) {
    fail(error, PortErrorKind::FormatError, QString("File is too large: %1").arg(path));
    return std::nullopt;
  }
  const QByteArray bytes = file.readAll();
  file.close();

  PortError inner;
  std::optional<QByteArray> payload = decompress_payload(magic, bytes, &inner);
  if (!payload) {
    fail(error, inner.kind, QString("%1: %2").arg(QFileInfo(path).fileName(), inner.message));
    return std::nullopt;
  }
  return payload;
}
