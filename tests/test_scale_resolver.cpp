#include "tile_weave/core/errors.hpp"
#include "tile_weave/image/processing.hpp"
#include "tile_weave/io/sequence.hpp"
#include "tile_weave/partition/tiler.hpp"
#include "tile_weave/partition/windower.hpp"
#include "tile_weave/reconstruction/resolver.hpp"
#include "tile_weave/reconstruction/scale.hpp"

#include <memory>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tile_weave;
using namespace tile_weave::reconstruction;

namespace {

io::TileVector make_tiles(int width, int height, int frames) {
    std::vector<Frame> seq;
    for (int i = 0; i < frames; ++i) {
        seq.push_back(image::solid_frame(FrameShape{width, height, 1}, {0.1f * static_cast<float>(i)}));
    }
    partition::TilingParams params;
    params.tile_width = 8;
    params.tile_height = 8;
    params.overlap_width = 2;
    params.overlap_height = 2;
    partition::TileSource source(std::make_shared<io::FrameSequence>(seq), params);
    return io::collect(source);
}

io::WindowVector make_windows(int frames) {
    std::vector<Frame> seq;
    for (int i = 0; i < frames; ++i) {
        seq.push_back(image::solid_frame(FrameShape{3, 2, 1}, {static_cast<float>(i)}));
    }
    partition::WindowingParams params;
    params.length = 5;
    params.overlap = 2;
    partition::WindowSource source(std::make_shared<io::FrameSequence>(seq), params);
    return io::collect(source);
}

} // namespace

TEST_CASE("detect_scale_ratio_and_errors") {
    REQUIRE(detect_scale(512, 256) == Catch::Approx(2.0));
    REQUIRE(detect_scale(128, 256) == Catch::Approx(0.5));
    REQUIRE_THROWS_AS(detect_scale(10, 0), InvalidParameterError);
    REQUIRE_THROWS_AS(detect_scale(0, 10), ShapeMismatchError);
}

TEST_CASE("scale_detector_accepts_rounding_within_tolerance") {
    ScaleDetector detector(1);
    REQUIRE_FALSE(detector.has_factor());

    REQUIRE(detector.observe("width", 512, 256) == Catch::Approx(2.0));
    REQUIRE(detector.has_factor());
    REQUIRE_NOTHROW(detector.observe("last width", 81, 40));
    REQUIRE(detector.consistent(80, 40));
    REQUIRE_FALSE(detector.consistent(60, 40));
    REQUIRE_THROWS_AS(detector.observe("height", 60, 40), InconsistentScaleError);
}

TEST_CASE("resolve_tiles_from_metadata") {
    auto tiles = make_tiles(20, 12, 2);
    auto plan = resolve_tiles(tiles, {}, {}, ResolveOptions{});

    REQUIRE(plan.units_per_output == 6);
    REQUIRE(plan.output_count == 2);
    REQUIRE(plan.axis(Axis::WIDTH).output_extent == 20);
    REQUIRE(plan.axis(Axis::HEIGHT).output_extent == 12);
    REQUIRE(plan.axis(Axis::HEIGHT).scale == Catch::Approx(1.0));
    REQUIRE_FALSE(plan.axis(Axis::WIDTH).manual);
}

TEST_CASE("resolve_tiles_without_metadata_is_ambiguous") {
    auto tiles = make_tiles(20, 12, 1);
    for (auto& t : tiles.tiles()) t.meta = partition::UnitMetadata{};

    REQUIRE_THROWS_AS(resolve_tiles(tiles, {}, {}, ResolveOptions{}), AmbiguousAxisError);

    AxisOverride width;
    width.full_extent = 20;
    AxisOverride height;
    height.full_extent = 12;
    REQUIRE_THROWS_AS(resolve_tiles(tiles, width, height, ResolveOptions{}), MissingParameterError);

    width.overlap = 2;
    height.overlap = 2;
    auto plan = resolve_tiles(tiles, width, height, ResolveOptions{});
    REQUIRE(plan.axis(Axis::WIDTH).unit_size == 8);
    REQUIRE(plan.axis(Axis::WIDTH).unit_count == 3);
    REQUIRE(plan.axis(Axis::HEIGHT).unit_count == 2);
    REQUIRE(plan.output_count == 1);
}

TEST_CASE("resolve_tiles_rejects_partial_frames") {
    auto tiles = make_tiles(20, 12, 2);
    tiles.tiles().pop_back();
    REQUIRE_THROWS_AS(resolve_tiles(tiles, {}, {}, ResolveOptions{}), ShapeMismatchError);
}

TEST_CASE("resolve_tiles_rejects_anisotropic_scaling") {
    auto tiles = io::map_tiles(make_tiles(20, 12, 1), [](const Frame& f) {
        return image::resize_frame(f, f.width() * 2, f.height(), image::Interpolation::NEAREST);
    });
    REQUIRE_THROWS_AS(resolve_tiles(tiles, {}, {}, ResolveOptions{}), InconsistentScaleError);
}

TEST_CASE("resolve_tiles_applies_tile_limit") {
    auto tiles = make_tiles(20, 12, 1);
    ResolveOptions options;
    options.max_tiles_per_frame = 4;
    REQUIRE_THROWS_AS(resolve_tiles(tiles, {}, {}, options), InvalidParameterError);
}

TEST_CASE("resolve_windows_detects_removed_window") {
    auto windows = make_windows(12);
    auto plan = resolve_windows(windows, {}, ResolveOptions{});
    REQUIRE(plan.axes[0].unit_count == 4);
    REQUIRE(plan.output_count == 12);

    windows.windows().pop_back();
    REQUIRE_THROWS_AS(resolve_windows(windows, {}, ResolveOptions{}), ShapeMismatchError);
}

TEST_CASE("check_unit_reports_foreign_and_misplaced_units") {
    auto windows = make_windows(12);
    auto plan = resolve_windows(windows, {}, ResolveOptions{});

    auto w1 = windows.get(1);
    REQUIRE_NOTHROW(check_unit(plan, w1.meta, {1}, {5}, "window 1"));
    REQUIRE_THROWS_AS(check_unit(plan, w1.meta, {2}, {5}, "window 2"), ShapeMismatchError);
    REQUIRE_THROWS_AS(check_unit(plan, w1.meta, {1}, {4}, "window 1"), ShapeMismatchError);
    REQUIRE_THROWS_AS(check_unit(plan, partition::UnitMetadata{}, {1}, {5}, "window 1"),
                      MissingParameterError);

    auto foreign = make_windows(13).get(1);
    REQUIRE_THROWS_AS(check_unit(plan, foreign.meta, {1}, {5}, "window 1"), ShapeMismatchError);
}
