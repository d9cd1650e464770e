#pragma once

#include <QByteArray>
#include <QString>

#include <optional>

#include "model/port_error.h"

// Whole-payload compressed container shared by .rmoby exports and .mcol snapshots:
//   magic[4] | u32 LE version | u64 LE payload size | zlib stream (miniz)
constexpr int kCompressedHeaderSize = 16;
constexpr quint32 kCompressedContainerVersion = 1;
constexpr quint64 kMaxCompressedPayload = 1ull << 30;

[[nodiscard]] std::optional<QByteArray> compress_payload(const QByteArray& magic,
                                                         const QByteArray& payload,
                                                         int level,
                                                         PortError* error = nullptr);
[[nodiscard]] std::optional<QByteArray> decompress_payload(const QByteArray& magic,
                                                           const QByteArray& container,
                                                           PortError* error = nullptr);

// Atomic write (QSaveFile); the destination is untouched on failure.
[[nodiscard]] bool write_compressed_file(const QString& path,
                                         const QByteArray& magic,
                                         const QByteArray& payload,
                                         int level,
                                         PortError* error = nullptr);
[[nodiscard]] std::optional<QByteArray> read_compressed_file(const QString& path,
                                                             const QByteArray& magic,
                                                             PortError* error = nullptr);
