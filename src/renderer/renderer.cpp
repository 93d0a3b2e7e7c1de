/**
 * @file renderer.cpp
 * @brief Implementation of the Raylib-based terrain renderer.
 */

#include <skycarpet/renderer/renderer.hpp>
#include <skycarpet/renderer/color_maps.hpp>
#include <skycarpet/core/constants.hpp>
#include "entt/entt.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace skycarpet {
namespace renderer {

namespace {

// Raylib meshes index with unsigned short
constexpr size_t MAX_INDEXED_VERTICES = std::numeric_limits<unsigned short>::max();

const core::Vec3 SUN_DIR{0.42, 0.82, 0.39};

float lambert(const core::Vec3 &n) {
  double len = SUN_DIR.length();
  double d = n.dot(SUN_DIR) / len;
  return static_cast<float>(0.45 + 0.55 * std::max(0.0, d));
}

float slope_from_normal(const core::Vec3 &n) {
  double ny = std::clamp(n.y, 0.05, 1.0);
  return static_cast<float>(std::sqrt(std::max(0.0, 1.0 - ny * ny)) / ny);
}

} // namespace

void Renderer::init(const RendererConfig &config) {
  config_ = config;

  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_VSYNC_HINT | FLAG_MSAA_4X_HINT);
  InitWindow(config_.window_width, config_.window_height, config_.title.c_str());
  SetTargetFPS(config_.target_fps);

  camera_.position = {0.0f, 60.0f, -40.0f};
  camera_.target = {0.0f, 40.0f, 0.0f};
  camera_.up = {0.0f, 1.0f, 0.0f};
  camera_.fovy = 60.0f;
  camera_.projection = CAMERA_PERSPECTIVE;

  initialized_ = true;
}

void Renderer::shutdown() {
  release_all_chunks();
  if (initialized_) {
    CloseWindow();
    initialized_ = false;
  }
}

void Renderer::update_input(bool mouse_captured) {
  // Wheel belongs to the sidebar while it has the mouse
  if (!mouse_captured)
    handle_camera_input();
  handle_overlay_input();

  if (IsKeyPressed(KEY_P))
    paused_ = !paused_;
}

void Renderer::handle_camera_input() {
  float wheel = GetMouseWheelMove();
  if (wheel != 0) {
    zoom_ -= wheel * 0.1f * zoom_;
    zoom_ = std::clamp(zoom_, 0.3f, 6.0f);
  }
}

void Renderer::handle_overlay_input() {
  OverlayType previous = active_overlay_;
  if (IsKeyPressed(KEY_ONE))
    active_overlay_ = OverlayType::HEIGHT;
  if (IsKeyPressed(KEY_TWO))
    active_overlay_ = OverlayType::SLOPE;
  if (IsKeyPressed(KEY_ZERO) || IsKeyPressed(KEY_GRAVE))
    active_overlay_ = OverlayType::BIOME;

  if (active_overlay_ != previous)
    recolor_chunks();
}

entities::CarpetInput Renderer::read_carpet_input() const {
  entities::CarpetInput input;
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_UP))
    input.thrust += 1.0f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_DOWN))
    input.thrust -= 1.0f;
  if (IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT))
    input.turn += 1.0f;
  if (IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT))
    input.turn -= 1.0f;
  if (IsKeyDown(KEY_SPACE))
    input.climb += 1.0f;
  if (IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_C))
    input.climb -= 1.0f;
  input.boost = IsKeyDown(KEY_LEFT_SHIFT);
  return input;
}

void Renderer::upload_chunk(const world::ChunkMesh &mesh) {
  release_chunk(mesh.coord);
  if (mesh.vertices.empty() || mesh.indices.empty())
    return;

  // Small meshes keep their index buffer; large ones are expanded per corner
  bool indexed = mesh.vertices.size() <= MAX_INDEXED_VERTICES;
  std::vector<uint32_t> source;
  if (indexed) {
    source.resize(mesh.vertices.size());
    for (size_t i = 0; i < source.size(); ++i)
      source[i] = static_cast<uint32_t>(i);
  } else {
    source = mesh.indices;
  }

  ChunkModel chunk;
  chunk.origin = {static_cast<float>(mesh.origin_x), 0.0f,
                  static_cast<float>(mesh.origin_z)};
  chunk.heights.reserve(source.size());
  chunk.slopes.reserve(source.size());
  chunk.light.reserve(source.size());
  chunk.biome_colors.reserve(source.size() * 4);

  Mesh gpu_mesh{};
  gpu_mesh.vertexCount = static_cast<int>(source.size());
  gpu_mesh.triangleCount = static_cast<int>(mesh.triangle_count());
  gpu_mesh.vertices = static_cast<float *>(MemAlloc(static_cast<unsigned int>(source.size() * 3 * sizeof(float))));
  gpu_mesh.normals = static_cast<float *>(MemAlloc(static_cast<unsigned int>(source.size() * 3 * sizeof(float))));
  gpu_mesh.colors = static_cast<unsigned char *>(MemAlloc(static_cast<unsigned int>(source.size() * 4)));

  for (size_t k = 0; k < source.size(); ++k) {
    const world::Vertex &v = mesh.vertices[source[k]];
    gpu_mesh.vertices[k * 3 + 0] = static_cast<float>(v.position.x);
    gpu_mesh.vertices[k * 3 + 1] = static_cast<float>(v.position.y);
    gpu_mesh.vertices[k * 3 + 2] = static_cast<float>(v.position.z);
    gpu_mesh.normals[k * 3 + 0] = static_cast<float>(v.normal.x);
    gpu_mesh.normals[k * 3 + 1] = static_cast<float>(v.normal.y);
    gpu_mesh.normals[k * 3 + 2] = static_cast<float>(v.normal.z);

    float light = lambert(v.normal);
    Color c = to_color(v.color, light);
    chunk.biome_colors.insert(chunk.biome_colors.end(), {c.r, c.g, c.b, c.a});
    chunk.heights.push_back(static_cast<float>(v.position.y));
    chunk.slopes.push_back(slope_from_normal(v.normal));
    chunk.light.push_back(light);
  }
  fill_overlay_colors(chunk, gpu_mesh.colors);

  if (indexed) {
    gpu_mesh.indices = static_cast<unsigned short *>(
        MemAlloc(static_cast<unsigned int>(mesh.indices.size() * sizeof(unsigned short))));
    for (size_t i = 0; i < mesh.indices.size(); ++i)
      gpu_mesh.indices[i] = static_cast<unsigned short>(mesh.indices[i]);
  }

  UploadMesh(&gpu_mesh, true);
  chunk.model = LoadModelFromMesh(gpu_mesh);
  chunks_.emplace(mesh.coord, std::move(chunk));
}

void Renderer::release_chunk(world::ChunkCoord coord) {
  auto it = chunks_.find(coord);
  if (it == chunks_.end())
    return;
  UnloadModel(it->second.model);
  chunks_.erase(it);
}

void Renderer::release_all_chunks() {
  for (auto &entry : chunks_)
    UnloadModel(entry.second.model);
  chunks_.clear();
}

void Renderer::fill_overlay_colors(const ChunkModel &chunk, unsigned char *out) const {
  const size_t count = chunk.heights.size();
  if (active_overlay_ == OverlayType::BIOME) {
    std::memcpy(out, chunk.biome_colors.data(), count * 4);
    return;
  }
  for (size_t k = 0; k < count; ++k) {
    Color c = active_overlay_ == OverlayType::HEIGHT ? height_to_color(chunk.heights[k])
                                                     : slope_to_color(chunk.slopes[k]);
    out[k * 4 + 0] = static_cast<unsigned char>(c.r * chunk.light[k]);
    out[k * 4 + 1] = static_cast<unsigned char>(c.g * chunk.light[k]);
    out[k * 4 + 2] = static_cast<unsigned char>(c.b * chunk.light[k]);
    out[k * 4 + 3] = 255;
  }
}

void Renderer::recolor_chunks() {
  for (auto &entry : chunks_) {
    Mesh &mesh = entry.second.model.meshes[0];
    fill_overlay_colors(entry.second, mesh.colors);
    // Buffer slot 3 holds vertex colors
    UpdateMeshBuffer(mesh, 3, mesh.colors, mesh.vertexCount * 4, 0);
  }
}

void Renderer::follow(const entities::Position &pos, const entities::Heading &heading) {
  float dist = config_.camera_distance * zoom_;
  float height = config_.camera_height * zoom_;
  Vector3 target = {pos.x, pos.y, pos.z};

  camera_.target = target;
  camera_.position = {target.x - std::sin(heading.yaw) * dist,
                      target.y + height,
                      target.z - std::cos(heading.yaw) * dist};
}

void Renderer::begin_frame() {
  BeginDrawing();
  ClearBackground({135, 190, 235, 255});
  BeginMode3D(camera_);
}

void Renderer::draw_terrain() {
  for (const auto &entry : chunks_) {
    DrawModel(entry.second.model, entry.second.origin, 1.0f, WHITE);
  }

  Vector3 water_center = {camera_.target.x, static_cast<float>(constants::SEA_LEVEL),
                          camera_.target.z};
  DrawPlane(water_center, {config_.water_extent, config_.water_extent},
            {30, 90, 160, 170});
}

void Renderer::draw_entities(const entt::registry &registry) {
  auto carpets = registry.view<const entities::Position, const entities::Heading,
                               const entities::Carpet, const entities::Renderable>();
  carpets.each([](const entities::Position &pos, const entities::Heading &heading,
                  const entities::Carpet &, const entities::Renderable &r) {
    Vector3 center = {pos.x, pos.y, pos.z};
    Vector3 forward = {std::sin(heading.yaw) * r.size, 0.0f, std::cos(heading.yaw) * r.size};
    Vector3 tail = {center.x - forward.x, center.y, center.z - forward.z};
    Vector3 nose = {center.x + forward.x, center.y, center.z + forward.z};
    DrawCylinderEx(tail, nose, r.size * 0.6f, r.size * 0.6f, 4, to_color(r.color));
  });

  auto nodes = registry.view<const entities::Position, const entities::ManaNode,
                             const entities::Renderable>();
  nodes.each([](const entities::Position &pos, const entities::ManaNode &node,
                const entities::Renderable &r) {
    if (node.collected)
      return;
    DrawSphere({pos.x, pos.y, pos.z}, r.size, to_color(r.color));
  });
}

void Renderer::draw_hud() {
  EndMode3D();

  const char *overlay = active_overlay_ == OverlayType::HEIGHT  ? "HEIGHT"
                        : active_overlay_ == OverlayType::SLOPE ? "SLOPE"
                                                                : "BIOME";
  int x = GetScreenWidth() - 220;
  DrawText(TextFormat("Overlay: %s", overlay), x, 10, 18, RAYWHITE);
  DrawText(TextFormat("Chunks: %d", static_cast<int>(uploaded_count())), x, 32, 18, RAYWHITE);
  if (paused_)
    DrawText("PAUSED", x, 54, 18, YELLOW);
}

void Renderer::end_frame() { EndDrawing(); }

} // namespace renderer
} // namespace skycarpet
