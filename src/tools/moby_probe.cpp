#include <QCoreApplication>
#include <QFileInfo>
#include <QTextStream>

#include "exchange/skeleton.h"
#include "format/moby_codec.h"

namespace {
void print_configs(QTextStream& out, const char* label, const QVector<TextureConfig>& configs) {
  for (int i = 0; i < configs.size(); ++i) {
    const TextureConfig& c = configs[i];
    out << label << " " << i << ": texture=" << c.texture_id << " start=" << c.start << " size=" << c.size
        << " mode=" << c.mode << " wrap=" << static_cast<int>(c.wrap_s) << "/" << static_cast<int>(c.wrap_t) << "\n";
  }
}
}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  QTextStream out(stdout);
  QTextStream err(stderr);

  const QStringList args = app.arguments();
  if (args.size() < 2) {
    err << "Usage: moby_probe <file.rmoby>\n";
    return 2;
  }

  const QString file_path = QFileInfo(args[1]).absoluteFilePath();
  PortError error;
  const std::optional<MobyRecord> record = read_moby_file(file_path, &error);
  if (!record) {
    err << port_error_kind_name(error.kind) << ": " << error.message << "\n";
    return 2;
  }

  const MobyModel& m = record->model;
  out << "Model: " << m.id << " (" << record->model_name << ")\n";
  out << "Game: " << record->game_num << "\n";
  out << "Vertices: " << m.vertex_count() << " stride=" << m.vertex_stride() << " floats=" << m.vertex_buffer.size()
      << "\n";
  out << "Indices: " << m.index_buffer.size() << " faces=" << m.face_count() << "\n";
  out << "Weights: " << m.weights.size() << " bone ids=" << m.bone_ids.size() << "\n";
  out << "Size: " << m.size << "\n";

  for (const MobyTexture& t : record->textures) {
    out << "Texture " << t.id << ": " << t.width << "x" << t.height << " mips=" << static_cast<int>(t.mip_count)
        << " bytes=" << t.data.size() << "\n";
  }
  print_configs(out, "Config", m.texture_configs);
  print_configs(out, "Other config", m.other_texture_configs);

  for (int i = 0; i < m.animations.size(); ++i) {
    const MobyAnimation& a = m.animations[i];
    out << "Animation " << i << ": frames=" << a.frames.size() << " sounds=" << a.sounds.size() << " speed=" << a.speed
        << "\n";
  }

  out << "Bones: " << static_cast<int>(m.bone_count) << " (lp " << static_cast<int>(m.lp_bone_count)
      << ") matrices=" << m.bone_matrices.size() << " datas=" << m.bone_datas.size() << "\n";
  const std::optional<Skeleton> skeleton = build_skeleton(m.bone_matrices, m.bone_datas, m.bone_count);
  if (skeleton) {
    const int max_bones = 32;
    for (int i = 0; i < skeleton->nodes.size() && i < max_bones; ++i) {
      const SkeletonNode& n = skeleton->nodes[i];
      out << "  bone " << n.bone << " parent=" << n.parent << " children=" << n.children.size() << "\n";
    }
    if (!skeleton->detached.isEmpty()) {
      out << "  detached: " << skeleton->detached.size() << "\n";
    }
  }
  out << "Attachments: " << m.attachments.size() << " sounds=" << m.model_sounds.size() << "\n";
  return 0;
}
