#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tile_weave::config {

namespace fs = std::filesystem;

struct TilingConfig {
  int tile_width = 256;
  int tile_height = 256;
  int overlap_width = 16;
  int overlap_height = 16;
  std::string padding = "mirror"; // fill mode | discard
  std::vector<float> color;       // 8-bit scale, used by padding: color
  int max_tiles_per_frame = 1024;
};

struct WindowingConfig {
  int length = 20;
  int overlap = 5;
  std::string padding = "mirror"; // mirror | loop | repeat | black | color | discard | none
  std::vector<float> color;
};

struct ReconstructionConfig {
  std::string mode = "crop"; // crop | fade
  int scale_tolerance_samples = 1;
};

struct DataConfig {
  float sample_peak = 1.0f;
  std::string pattern = "*.fit*";
};

struct OutputConfig {
  std::string tile_prefix = "tile_";
  std::string window_prefix = "window_";
  std::string frame_prefix = "frame_";
  bool write_events_log = true;
};

struct Config {
  TilingConfig tiling;
  WindowingConfig windowing;
  ReconstructionConfig reconstruction;
  DataConfig data;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace tile_weave::config
