#pragma once

#include <QString>
#include <QVector>

struct KnownModel {
  QString name;
  QVector<int> ids;
};

// Read-only table of well-known moby model ids. Used for output naming only.
[[nodiscard]] const QVector<KnownModel>& known_models();

// Table name for |model_id|, or "Moby_<id>".
[[nodiscard]] QString friendly_model_name(int model_id);

// Replaces characters that are not portable in file names with '_'.
[[nodiscard]] QString sanitize_file_name(QString name);
