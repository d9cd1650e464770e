#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>

#include <memory>
#include <vector>

#include "model/moby_model.h"
#include "model/port_error.h"

// Destination (or source) container contents. The container's own binary codec lives
// outside this project; it hands over a populated collection and takes it back to save.
struct AssetCollection {
  QString path;
  int game_num = 0;

  std::vector<std::unique_ptr<MobyModel>> models;
  QVector<MobyTexture> textures;
  QVector<MobyPlacement> placements;
  QVector<QByteArray> pvars;  // Consolidated table addressed by MobyPlacement::pvar_index.

  // Derived by update_model_bookkeeping().
  QVector<int> model_ids;
  QVector<int> moby_ids;

  [[nodiscard]] MobyModel* find_model(int id);
  [[nodiscard]] const MobyModel* find_model(int id) const;
  [[nodiscard]] int model_count() const { return static_cast<int>(models.size()); }

  // Appends and takes ownership. Bookkeeping is left to the caller.
  MobyModel* add_model(std::unique_ptr<MobyModel> model);
  // Removes the model with |id|; returns false if there was none.
  bool remove_model(int id);
};

// Rebuilds model_ids and moby_ids, then relinks every placement with model_id > -1 to the
// model of that id (nullptr when the collection has none).
void update_model_bookkeeping(AssetCollection* collection);

// Load/save for a whole collection. Implementations are picked by file path.
class CollectionCodec {
public:
  virtual ~CollectionCodec() = default;

  [[nodiscard]] virtual QString format_name() const = 0;
  [[nodiscard]] virtual bool can_handle(const QString& path) const = 0;

  [[nodiscard]] virtual std::unique_ptr<AssetCollection> load(const QString& path, PortError* error = nullptr) = 0;
  virtual bool save(const AssetCollection& collection, const QString& path, PortError* error = nullptr) = 0;
};
