#include "collection/asset_collection.h"

#include <algorithm>

MobyModel* AssetCollection::find_model(int id) {
  for (const std::unique_ptr<MobyModel>& m : models) {
    if (m && m->id == id) {
      return m.get();
    }
  }
  return nullptr;
}

const MobyModel* AssetCollection::find_model(int id) const {
  for (const std::unique_ptr<MobyModel>& m : models) {
    if (m && m->id == id) {
      return m.get();
    }
  }
  return nullptr;
}

MobyModel* AssetCollection::add_model(std::unique_ptr<MobyModel> model) {
  if (!model) {
    return nullptr;
  }
  models.push_back(std::move(model));
  return models.back().get();
}

bool AssetCollection::remove_model(int id) {
  const auto it = std::find_if(models.begin(), models.end(), [id](const std::unique_ptr<MobyModel>& m) {
    return m && m->id == id;
  });
  if (it == models.end()) {
    return false;
  }
  // Placements still point at the old instance until bookkeeping runs again.
  for (MobyPlacement& p : placements) {
    if (p.model == it->get()) {
      p.model = nullptr;
    }
  }
  models.erase(it);
  return true;
}

void update_model_bookkeeping(AssetCollection* collection) {
  if (!collection) {
    return;
  }

  collection->model_ids.clear();
  collection->model_ids.reserve(static_cast<qsizetype>(collection->models.size()));
  for (const std::unique_ptr<MobyModel>& m : collection->models) {
    if (m) {
      collection->model_ids.push_back(m->id);
    }
  }

  collection->moby_ids.clear();
  collection->moby_ids.reserve(collection->placements.size());
  for (MobyPlacement& p : collection->placements) {
    collection->moby_ids.push_back(p.moby_id);
    if (p.model_id > -1) {
      p.model = collection->find_model(p.model_id);
    }
  }
}
