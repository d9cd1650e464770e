#pragma once

#include <QByteArray>
#include <QString>

#include <memory>
#include <ostream>

#include "collection/asset_collection.h"
#include "model/moby_model.h"

// Readable gtest output for Qt strings.
void PrintTo(const QString& value, std::ostream* os);
void PrintTo(const QByteArray& value, std::ostream* os);

namespace test_support {

// Deterministic, non-repeating bytes; different seeds give different content.
QByteArray patterned_bytes(int size, int seed);

MobyTexture make_texture(int id, int width, int height, const QByteArray& data, quint8 mip_count = 1);
TextureConfig make_config(int texture_id, int start = 0, int size = 0);
BoneMatrix make_matrix(int seed);
MobyAnimation make_animation(int frame_count, int seed);

// Small model with a vertex stride of 8 and two triangles. No textures, bones or animations.
std::unique_ptr<MobyModel> make_model(int id);

// Adds root + |parents.size() - 1| bones; parents[0] is written but never read.
void add_bones(MobyModel* model, const QVector<int>& parents);

// Single placement with the given model and pvar bytes.
MobyPlacement make_placement(int moby_id, int model_id, const QByteArray& pvars = {});

}  // namespace test_support
