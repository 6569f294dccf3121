#include "tile_weave/config/configuration.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/core/types.hpp"
#include "tile_weave/partition/axis_plan.hpp"

#include <fstream>

namespace tile_weave::config {

static void read_float_list(const YAML::Node& n, std::vector<float>& out) {
    if (!n) return;
    out.clear();
    if (n.IsSequence()) {
        for (const auto& v : n) {
            out.push_back(v.as<float>());
        }
    } else if (n.IsScalar()) {
        out.push_back(n.as<float>());
    }
}

static YAML::Node float_list(const std::vector<float>& values) {
    YAML::Node n(YAML::NodeType::Sequence);
    for (float v : values) {
        n.push_back(v);
    }
    return n;
}

static void validate_padding(const std::string& key, const std::string& padding,
                             const std::vector<float>& color, bool temporal) {
    partition::BoundaryPolicy policy;
    try {
        policy = partition::make_boundary_policy(padding, color);
    } catch (const InvalidParameterError& e) {
        throw ValidationError(key + ": " + e.what());
    }
    if (!temporal && policy.kind == BoundaryKind::NONE) {
        throw ValidationError(key + " 'none' is only valid for windowing");
    }
    if (temporal && policy.kind == BoundaryKind::PAD && is_spatial_only(policy.fill.mode)) {
        throw ValidationError(key + " '" + padding + "' is not available for windowing");
    }
    for (float v : policy.fill.color) {
        if (v < 0.0f || v > 255.0f) {
            throw ValidationError(key + " colour values must be in [0,255]");
        }
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["tiling"]) {
            auto t = node["tiling"];
            if (t["tile_width"]) cfg.tiling.tile_width = t["tile_width"].as<int>();
            if (t["tile_height"]) cfg.tiling.tile_height = t["tile_height"].as<int>();
            if (t["overlap"]) {
                // scalar or [width, height]
                auto o = t["overlap"];
                if (o.IsSequence() && o.size() == 2) {
                    cfg.tiling.overlap_width = o[0].as<int>();
                    cfg.tiling.overlap_height = o[1].as<int>();
                } else {
                    cfg.tiling.overlap_width = o.as<int>();
                    cfg.tiling.overlap_height = o.as<int>();
                }
            }
            if (t["overlap_width"]) cfg.tiling.overlap_width = t["overlap_width"].as<int>();
            if (t["overlap_height"]) cfg.tiling.overlap_height = t["overlap_height"].as<int>();
            if (t["padding"]) cfg.tiling.padding = t["padding"].as<std::string>();
            read_float_list(t["color"], cfg.tiling.color);
            if (t["max_tiles_per_frame"]) cfg.tiling.max_tiles_per_frame = t["max_tiles_per_frame"].as<int>();
        }

        if (node["windowing"]) {
            auto w = node["windowing"];
            if (w["length"]) cfg.windowing.length = w["length"].as<int>();
            if (w["overlap"]) cfg.windowing.overlap = w["overlap"].as<int>();
            if (w["padding"]) cfg.windowing.padding = w["padding"].as<std::string>();
            read_float_list(w["color"], cfg.windowing.color);
        }

        if (node["reconstruction"]) {
            auto r = node["reconstruction"];
            if (r["mode"]) cfg.reconstruction.mode = r["mode"].as<std::string>();
            if (r["scale_tolerance_samples"]) {
                cfg.reconstruction.scale_tolerance_samples = r["scale_tolerance_samples"].as<int>();
            }
        }

        if (node["data"]) {
            auto d = node["data"];
            if (d["sample_peak"]) cfg.data.sample_peak = d["sample_peak"].as<float>();
            if (d["pattern"]) cfg.data.pattern = d["pattern"].as<std::string>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["tile_prefix"]) cfg.output.tile_prefix = o["tile_prefix"].as<std::string>();
            if (o["window_prefix"]) cfg.output.window_prefix = o["window_prefix"].as<std::string>();
            if (o["frame_prefix"]) cfg.output.frame_prefix = o["frame_prefix"].as<std::string>();
            if (o["write_events_log"]) cfg.output.write_events_log = o["write_events_log"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["tiling"]["tile_width"] = tiling.tile_width;
    node["tiling"]["tile_height"] = tiling.tile_height;
    node["tiling"]["overlap_width"] = tiling.overlap_width;
    node["tiling"]["overlap_height"] = tiling.overlap_height;
    node["tiling"]["padding"] = tiling.padding;
    node["tiling"]["color"] = float_list(tiling.color);
    node["tiling"]["max_tiles_per_frame"] = tiling.max_tiles_per_frame;

    node["windowing"]["length"] = windowing.length;
    node["windowing"]["overlap"] = windowing.overlap;
    node["windowing"]["padding"] = windowing.padding;
    node["windowing"]["color"] = float_list(windowing.color);

    node["reconstruction"]["mode"] = reconstruction.mode;
    node["reconstruction"]["scale_tolerance_samples"] = reconstruction.scale_tolerance_samples;

    node["data"]["sample_peak"] = data.sample_peak;
    node["data"]["pattern"] = data.pattern;

    node["output"]["tile_prefix"] = output.tile_prefix;
    node["output"]["window_prefix"] = output.window_prefix;
    node["output"]["frame_prefix"] = output.frame_prefix;
    node["output"]["write_events_log"] = output.write_events_log;

    return node;
}

void Config::validate() const {
    if (tiling.tile_width < 1 || tiling.tile_height < 1) {
        throw ValidationError("tiling.tile_width and tiling.tile_height must be >= 1");
    }
    if (tiling.overlap_width < 0 || tiling.overlap_width >= tiling.tile_width) {
        throw ValidationError("tiling.overlap_width must be in [0, tile_width)");
    }
    if (tiling.overlap_height < 0 || tiling.overlap_height >= tiling.tile_height) {
        throw ValidationError("tiling.overlap_height must be in [0, tile_height)");
    }
    validate_padding("tiling.padding", tiling.padding, tiling.color, false);
    if (tiling.max_tiles_per_frame < 1) {
        throw ValidationError("tiling.max_tiles_per_frame must be >= 1");
    }

    if (windowing.length < 1) {
        throw ValidationError("windowing.length must be >= 1");
    }
    if (windowing.overlap < 0 || windowing.overlap >= windowing.length) {
        throw ValidationError("windowing.overlap must be in [0, length)");
    }
    validate_padding("windowing.padding", windowing.padding, windowing.color, true);

    if (reconstruction.mode != "crop" && reconstruction.mode != "fade") {
        throw ValidationError("reconstruction.mode must be 'crop' or 'fade'");
    }
    if (reconstruction.scale_tolerance_samples < 0) {
        throw ValidationError("reconstruction.scale_tolerance_samples must be >= 0");
    }

    if (!(data.sample_peak > 0.0f)) {
        throw ValidationError("data.sample_peak must be > 0");
    }
    if (data.pattern.empty()) {
        throw ValidationError("data.pattern must not be empty");
    }

    if (output.tile_prefix.empty() || output.window_prefix.empty() || output.frame_prefix.empty()) {
        throw ValidationError("output prefixes must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "https://json-schema.org/draft/2020-12/schema",
  "title": "tile_weave configuration",
  "type": "object",
  "properties": {
    "tiling": {
      "type": "object",
      "properties": {
        "tile_width": {"type": "integer", "minimum": 1},
        "tile_height": {"type": "integer", "minimum": 1},
        "overlap": {
          "oneOf": [
            {"type": "integer", "minimum": 0},
            {"type": "array", "items": {"type": "integer", "minimum": 0}, "minItems": 2, "maxItems": 2}
          ]
        },
        "overlap_width": {"type": "integer", "minimum": 0},
        "overlap_height": {"type": "integer", "minimum": 0},
        "padding": {"type": "string", "enum": ["mirror", "wrap", "repeat", "blur", "black", "color", "telea", "ns", "discard"]},
        "color": {"type": "array", "items": {"type": "number", "minimum": 0, "maximum": 255}},
        "max_tiles_per_frame": {"type": "integer", "minimum": 1}
      }
    },
    "windowing": {
      "type": "object",
      "properties": {
        "length": {"type": "integer", "minimum": 1},
        "overlap": {"type": "integer", "minimum": 0},
        "padding": {"type": "string", "enum": ["mirror", "loop", "wrap", "repeat", "black", "color", "discard", "none"]},
        "color": {"type": "array", "items": {"type": "number", "minimum": 0, "maximum": 255}}
      }
    },
    "reconstruction": {
      "type": "object",
      "properties": {
        "mode": {"type": "string", "enum": ["crop", "fade"]},
        "scale_tolerance_samples": {"type": "integer", "minimum": 0}
      }
    },
    "data": {
      "type": "object",
      "properties": {
        "sample_peak": {"type": "number", "exclusiveMinimum": 0},
        "pattern": {"type": "string"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "tile_prefix": {"type": "string"},
        "window_prefix": {"type": "string"},
        "frame_prefix": {"type": "string"},
        "write_events_log": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace tile_weave::config
