#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace tile_weave::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_frames(const fs::path& input_dir, const std::string& pattern = "*.fit*");
std::vector<fs::path> discover_subdirs(const fs::path& input_dir, const std::string& pattern = "*");
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
std::string numbered_name(const std::string& prefix, int index, const std::string& ext, int width = 6);

// Integer geometry
int ceil_div(int num, int den);
// Round-half-up of value * factor
int scale_round(int value, double factor);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace tile_weave::core
