#include "dedup/content_pool.h"

#include <QCryptographicHash>

ContentPool::ContentPool(int digest_threshold)
    : digest_threshold_(digest_threshold < 0 ? 0 : digest_threshold) {}

bool ContentPool::uses_digest(const QByteArray& bytes) const {
  return bytes.size() >= digest_threshold_;
}

QByteArray ContentPool::digest_of(const QByteArray& bytes) {
  return QCryptographicHash::hash(bytes, QCryptographicHash::Sha256);
}

int ContentPool::find(const QByteArray& bytes) const {
  if (uses_digest(bytes)) {
    return index_by_digest_.value(digest_of(bytes), -1);
  }
  return index_by_bytes_.value(bytes, -1);
}

int ContentPool::intern(const QByteArray& bytes) {
  const bool digest = uses_digest(bytes);
  const QByteArray key = digest ? digest_of(bytes) : bytes;
  QHash<QByteArray, int>& index = digest ? index_by_digest_ : index_by_bytes_;

  const auto it = index.constFind(key);
  if (it != index.constEnd()) {
    return it.value();
  }

  const int next = static_cast<int>(blocks_.size());
  blocks_.push_back(bytes);
  index.insert(key, next);
  return next;
}
