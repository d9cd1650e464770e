#pragma once

#include <QByteArray>
#include <QHash>
#include <QVector>

// Content-addressed pool: maps byte blocks to dense indices in first-occurrence order.
// Blocks shorter than the digest threshold are keyed by their bytes; longer blocks are
// keyed by their SHA-256 digest (equal digests are treated as equal content).
// One pool per export or consolidation pass; pools are never shared across calls.
class ContentPool {
public:
  static constexpr int kDefaultDigestThreshold = 1024;

  explicit ContentPool(int digest_threshold = kDefaultDigestThreshold);

  // Index of the first byte-identical block, or a newly appended index.
  // An empty block is ordinary content.
  int intern(const QByteArray& bytes);

  // Index of a byte-identical block, or -1. Never inserts.
  [[nodiscard]] int find(const QByteArray& bytes) const;

  [[nodiscard]] int size() const { return static_cast<int>(blocks_.size()); }
  [[nodiscard]] bool isEmpty() const { return blocks_.isEmpty(); }
  [[nodiscard]] const QVector<QByteArray>& blocks() const { return blocks_; }

private:
  [[nodiscard]] bool uses_digest(const QByteArray& bytes) const;
  [[nodiscard]] static QByteArray digest_of(const QByteArray& bytes);

  int digest_threshold_ = kDefaultDigestThreshold;
  QVector<QByteArray> blocks_;
  QHash<QByteArray, int> index_by_bytes_;
  QHash<QByteArray, int> index_by_digest_;
};
