#include "tile_weave/config/configuration.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/partition/tiler.hpp"
#include "tile_weave/partition/windower.hpp"
#include "tile_weave/reconstruction/resolver.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace tile_weave;

TEST_CASE("config_defaults_are_valid") {
    config::Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.tiling.tile_width == 256);
    REQUIRE(cfg.tiling.overlap_width == 16);
    REQUIRE(cfg.windowing.length == 20);
    REQUIRE(cfg.windowing.overlap == 5);
    REQUIRE(cfg.reconstruction.mode == "crop");
}

TEST_CASE("config_yaml_round_trip") {
    auto cfg = config::Config::from_yaml(YAML::Load(R"(
tiling:
  tile_width: 128
  tile_height: 64
  overlap: [8, 4]
  padding: color
  color: [12, 34, 56]
windowing:
  length: 10
  overlap: 3
  padding: loop
reconstruction:
  mode: fade
data:
  sample_peak: 65535
)"));

    REQUIRE(cfg.tiling.tile_height == 64);
    REQUIRE(cfg.tiling.overlap_width == 8);
    REQUIRE(cfg.tiling.overlap_height == 4);
    REQUIRE(cfg.tiling.color.size() == 3);
    REQUIRE_NOTHROW(cfg.validate());

    auto again = config::Config::from_yaml(cfg.to_yaml());
    REQUIRE(again.tiling.tile_width == 128);
    REQUIRE(again.tiling.overlap_height == 4);
    REQUIRE(again.tiling.padding == "color");
    REQUIRE(again.tiling.color == cfg.tiling.color);
    REQUIRE(again.windowing.padding == "loop");
    REQUIRE(again.reconstruction.mode == "fade");
    REQUIRE(again.data.sample_peak == 65535.0f);
}

TEST_CASE("config_save_and_load") {
    config::Config cfg;
    cfg.windowing.length = 12;
    cfg.output.frame_prefix = "f_";
    const auto path = fs::temp_directory_path() / "tile_weave_config_test.yaml";
    cfg.save(path);

    auto loaded = config::Config::load(path);
    fs::remove(path);
    REQUIRE(loaded.windowing.length == 12);
    REQUIRE(loaded.output.frame_prefix == "f_");
}

TEST_CASE("config_scalar_overlap_sets_both_axes") {
    auto cfg = config::Config::from_yaml(YAML::Load("tiling: {overlap: 6}"));
    REQUIRE(cfg.tiling.overlap_width == 6);
    REQUIRE(cfg.tiling.overlap_height == 6);
}

TEST_CASE("config_validate_names_offending_key") {
    config::Config cfg;
    cfg.tiling.overlap_width = cfg.tiling.tile_width;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.windowing.padding = "blur";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.tiling.padding = "none";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.tiling.padding = "color";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.reconstruction.mode = "average";
    try {
        cfg.validate();
        FAIL("expected a validation error");
    } catch (const ValidationError& e) {
        REQUIRE(std::string(e.what()).find("reconstruction.mode") != std::string::npos);
    }
}

TEST_CASE("config_bad_value_type_is_config_error") {
    REQUIRE_THROWS_AS(config::Config::from_yaml(YAML::Load("tiling: {tile_width: wide}")),
                      ConfigError);
    REQUIRE_THROWS_AS(config::Config::load("/nonexistent/tile_weave.yaml"), ConfigError);
}

TEST_CASE("config_feeds_partition_and_resolver_params") {
    auto cfg = config::Config::from_yaml(YAML::Load(R"(
tiling: {tile_width: 32, tile_height: 16, overlap: 4, padding: discard}
windowing: {length: 8, overlap: 2, padding: none}
reconstruction: {mode: fade, scale_tolerance_samples: 2}
)"));

    auto tiling = partition::TilingParams::from_config(cfg);
    REQUIRE(tiling.tile_height == 16);
    REQUIRE(tiling.boundary.kind == BoundaryKind::DISCARD);

    auto windowing = partition::WindowingParams::from_config(cfg);
    REQUIRE(windowing.boundary.kind == BoundaryKind::NONE);

    auto resolve = reconstruction::ResolveOptions::from_config(cfg);
    REQUIRE(resolve.mode == ReconstructionMode::FADE);
    REQUIRE(resolve.scale_tolerance == 2);
}

TEST_CASE("config_schema_is_json") {
    auto schema = nlohmann::json::parse(config::get_schema_json());
    REQUIRE(schema["properties"].contains("tiling"));
    REQUIRE(schema["properties"].contains("windowing"));
}
