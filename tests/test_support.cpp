#include "test_support.h"

void PrintTo(const QString& value, std::ostream* os) {
  *os << '"' << value.toStdString() << '"';
}

void PrintTo(const QByteArray& value, std::ostream* os) {
  *os << "0x" << value.left(32).toHex().toStdString() << (value.size() > 32 ? "..." : "") << " (" << value.size()
      << " bytes)";
}

namespace test_support {

QByteArray patterned_bytes(int size, int seed) {
  QByteArray out(size, '\0');
  quint32 state = 0x9E3779B9u ^ static_cast<quint32>(seed * 7919 + 1);
  for (int i = 0; i < size; ++i) {
    state = state * 1664525u + 1013904223u;
    out[i] = static_cast<char>(state >> 24);
  }
  return out;
}

MobyTexture make_texture(int id, int width, int height, const QByteArray& data, quint8 mip_count) {
  MobyTexture t;
  t.id = id;
  t.width = static_cast<qint16>(width);
  t.height = static_cast<qint16>(height);
  t.mip_count = mip_count;
  t.off06 = 0x0102;
  t.off08 = 8;
  t.vram_pointer = 0x1000 + id;
  t.data = data;
  return t;
}

TextureConfig make_config(int texture_id, int start, int size) {
  TextureConfig c;
  c.texture_id = texture_id;
  c.start = start;
  c.size = size;
  c.mode = 2;
  c.wrap_s = WrapMode::Clamp;
  return c;
}

BoneMatrix make_matrix(int seed) {
  return BoneMatrix{patterned_bytes(BoneMatrix::kSize, 1000 + seed)};
}

MobyAnimation make_animation(int frame_count, int seed) {
  MobyAnimation a;
  a.unk1 = 1.5f;
  a.unk2 = -2.25f;
  a.unk5 = 3;
  a.unk7 = 4;
  a.null1 = 0xABCDu;
  a.speed = 0.5f;
  for (int i = 0; i < frame_count; ++i) {
    a.frames.push_back(patterned_bytes(24 + i, seed * 100 + i));
  }
  a.sounds = {seed, -1, seed + 2};
  a.unknown_bytes = patterned_bytes(6, seed + 50);
  return a;
}

std::unique_ptr<MobyModel> make_model(int id) {
  auto m = std::make_unique<MobyModel>(id, 8);
  for (int i = 0; i < 4 * 8; ++i) {
    m->vertex_buffer.push_back(static_cast<float>(i) * 0.25f - 1.0f);
  }
  m->index_buffer = {0, 1, 2, 2, 1, 3};
  m->weights = {0x01020304u, 0xFFFFFFFFu, 0u, 7u};
  m->bone_ids = {0u, 1u, 2u, 3u};
  m->attachments = {patterned_bytes(12, id)};
  m->model_sounds = {patterned_bytes(8, id + 1), patterned_bytes(8, id + 2)};
  m->index_attachments = patterned_bytes(5, id + 3);
  m->other_buffer = patterned_bytes(9, id + 4);
  m->other_index_buffer = {4, 5, 6};
  m->type10_block = patterned_bytes(16, id + 5);
  m->null1 = 1;
  m->count3 = 3;
  m->count4 = 4;
  m->lp_render_dist = 200;
  m->count8 = 8;
  m->unk1 = 0.125f;
  m->unk4 = -9.5f;
  m->color2 = 0x80808080u;
  m->unk6 = 0xDEADu;
  m->vertex_count2 = 4;
  m->size = 2.5f;
  return m;
}

void add_bones(MobyModel* model, const QVector<int>& parents) {
  model->bone_count = static_cast<quint8>(parents.size());
  model->lp_bone_count = static_cast<quint8>(parents.size());
  for (int i = 0; i < parents.size(); ++i) {
    model->bone_matrices.push_back(make_matrix(i));
    model->bone_datas.push_back(BoneData::make(static_cast<float>(i), 0.0f, 1.0f, parents[i]));
  }
}

MobyPlacement make_placement(int moby_id, int model_id, const QByteArray& pvars) {
  MobyPlacement p;
  p.moby_id = moby_id;
  p.model_id = model_id;
  p.pvars = pvars;
  return p;
}

}  // namespace test_support
