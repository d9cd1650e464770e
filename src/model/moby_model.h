#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <QtGlobal>

#include <optional>

// In-memory form of a moby model and the sub-resources it owns, as handed over by the
// container loader. Numeric buffers are already decoded; everything the container format
// owns is kept as opaque bytes.

struct MobyTexture {
  int id = 0;
  qint16 width = 0;
  qint16 height = 0;
  quint8 mip_count = 0;
  // Opaque format words preserved for byte fidelity.
  quint16 off06 = 0;
  qint32 off08 = 0;
  qint32 off0c = 0;
  qint32 off10 = 0;
  qint32 off14 = 0;
  qint32 off1c = 0;
  qint32 off20 = 0;
  qint32 vram_pointer = 0;
  QByteArray data;
};

enum class WrapMode : qint32 {
  Repeat = 0,
  Clamp = 1,
};

struct TextureConfig {
  static constexpr int kEncodedSize = 24;
  static constexpr int kEncodedSizeNoWrap = 16;

  int texture_id = 0;
  int start = 0;
  int size = 0;
  int mode = 0;
  WrapMode wrap_s = WrapMode::Repeat;
  WrapMode wrap_t = WrapMode::Repeat;

  [[nodiscard]] QByteArray to_bytes() const;
  // Accepts the 24-byte form and the older 16-byte form without wrap modes.
  // Anything shorter decodes to a default config.
  [[nodiscard]] static TextureConfig from_bytes(const QByteArray& bytes);

  bool operator==(const TextureConfig& other) const = default;
};

struct MobyAnimation {
  float unk1 = 0.0f;
  float unk2 = 0.0f;
  float unk3 = 0.0f;
  float unk4 = 0.0f;
  quint8 unk5 = 0;
  quint8 unk7 = 0;
  quint32 null1 = 0;
  float speed = 0.0f;
  QVector<QByteArray> frames;  // Playback order.
  QVector<int> sounds;
  QByteArray unknown_bytes;
};

struct BoneMatrix {
  static constexpr int kSize = 0x40;
  QByteArray raw;
};

// 0x10 bytes, big-endian: float offset[3], u16 flags, s16 parent.
struct BoneData {
  static constexpr int kSize = 0x10;
  static constexpr int kParentOffset = 0x0E;
  QByteArray raw;

  // Parent bone index, or -1 when the block is too short to carry one.
  [[nodiscard]] int parent() const;
  [[nodiscard]] static BoneData make(float x, float y, float z, int parent, quint16 flags = 0);
};

struct SkeletonNode {
  int bone = 0;
  int parent = -1;
  QVector<int> children;
};

// Bone tree rebuilt from BoneData parents; node i describes bone i. Bones that could not
// be attached keep parent == -1 and are listed in |detached|.
struct Skeleton {
  QVector<SkeletonNode> nodes;
  QVector<int> detached;

  [[nodiscard]] int root() const { return nodes.isEmpty() ? -1 : 0; }
  [[nodiscard]] int bone_count() const { return static_cast<int>(nodes.size()); }
};

class MobyModel {
public:
  MobyModel(int id, int vertex_stride) : id(id), vertex_stride_(vertex_stride) {}

  [[nodiscard]] int vertex_stride() const { return vertex_stride_; }
  [[nodiscard]] int vertex_count() const;
  [[nodiscard]] int face_count() const;

  int id = 0;

  QVector<float> vertex_buffer;
  QVector<quint16> index_buffer;

  quint8 bone_count = 0;
  quint8 lp_bone_count = 0;

  QVector<TextureConfig> texture_configs;
  QVector<TextureConfig> other_texture_configs;
  QVector<MobyAnimation> animations;
  QVector<BoneMatrix> bone_matrices;
  QVector<BoneData> bone_datas;
  QVector<QByteArray> attachments;
  QVector<QByteArray> model_sounds;

  QByteArray index_attachments;
  QByteArray other_buffer;
  QVector<quint16> other_index_buffer;
  QVector<quint32> weights;
  QVector<quint32> bone_ids;
  QByteArray type10_block;

  qint32 null1 = 0;
  quint8 count3 = 0;
  quint8 count4 = 0;
  quint8 lp_render_dist = 0;
  quint8 count8 = 0;
  qint32 null2 = 0;
  qint32 null3 = 0;
  float unk1 = 0.0f;
  float unk2 = 0.0f;
  float unk3 = 0.0f;
  float unk4 = 0.0f;
  quint32 color2 = 0;
  quint32 unk6 = 0;
  quint16 vertex_count2 = 0;
  float size = 1.0f;

  std::optional<Skeleton> skeleton;

private:
  int vertex_stride_ = 0;
};

// A scene instance of a model. |pvars| is the instance's AuxiliaryBlock; |pvar_index|
// points into the collection pvar table (-1 when the instance has none).
struct MobyPlacement {
  int moby_id = 0;
  int model_id = -1;
  int pvar_index = -1;
  QByteArray pvars;
  int group_index = -1;
  int mission_id = 0;
  int spawn_type = 0;

  // Resolved by bookkeeping; not owned.
  const MobyModel* model = nullptr;
};
