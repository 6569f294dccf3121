#include "tile_weave/core/errors.hpp"
#include "tile_weave/partition/axis_plan.hpp"
#include "tile_weave/partition/tiler.hpp"
#include "tile_weave/partition/windower.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace tile_weave;
using namespace tile_weave::partition;

TEST_CASE("plan_axis_default_tile_geometry") {
    auto plan = plan_axis(Axis::WIDTH, 1000, 256, 16, BoundaryPolicy::pad());

    REQUIRE(plan.stride == 240);
    REQUIRE(plan.unit_count == 5);
    REQUIRE(plan.deficit == 216);
    REQUIRE(plan.unit_origin(4) == 960);
    REQUIRE(plan.source_length(4) == 40);
    REQUIRE(plan.fill_length(4) == 216);
    REQUIRE(plan.output_extent() == 1000);
}

TEST_CASE("plan_axis_exact_fit_has_no_deficit") {
    auto plan = plan_axis(Axis::HEIGHT, 496, 256, 16, BoundaryPolicy::pad());

    REQUIRE(plan.unit_count == 2);
    REQUIRE(plan.deficit == 0);
    REQUIRE(plan.fill_length(1) == 0);
}

TEST_CASE("plan_axis_discard_drops_short_last_unit") {
    auto pad = plan_axis(Axis::WIDTH, 100, 30, 0, BoundaryPolicy::pad());
    auto discard = plan_axis(Axis::WIDTH, 100, 30, 0, BoundaryPolicy::discard());

    REQUIRE(pad.unit_count == 4);
    REQUIRE(discard.unit_count == 3);
    REQUIRE(discard.covered_extent() == 90);
    REQUIRE(discard.output_extent() == 90);
}

TEST_CASE("plan_axis_pad_count_never_below_discard_count") {
    for (int extent = 20; extent <= 200; extent += 7) {
        auto pad = plan_axis(Axis::TIME, extent, 20, 5, BoundaryPolicy::pad());
        auto discard = plan_axis(Axis::TIME, extent, 20, 5, BoundaryPolicy::discard());
        REQUIRE(pad.unit_count >= discard.unit_count);
        REQUIRE(discard.unit_count >= 1);
        REQUIRE(pad.covered_extent() >= extent);
        REQUIRE(discard.covered_extent() <= extent);
    }
}

TEST_CASE("plan_axis_extent_smaller_than_unit") {
    auto plan = plan_axis(Axis::WIDTH, 10, 64, 8, BoundaryPolicy::pad());

    REQUIRE(plan.unit_count == 1);
    REQUIRE(plan.source_length(0) == 10);
    REQUIRE(plan.fill_length(0) == 54);

    REQUIRE_THROWS_AS(plan_axis(Axis::WIDTH, 10, 64, 8, BoundaryPolicy::discard()),
                      InvalidParameterError);
}

TEST_CASE("plan_axis_none_keeps_short_last_window") {
    auto plan = plan_axis(Axis::TIME, 45, 20, 5, BoundaryPolicy::none());

    REQUIRE(plan.unit_count == 3);
    REQUIRE(plan.deficit == 5);
    REQUIRE(plan.unit_length(0) == 20);
    REQUIRE(plan.unit_length(2) == 15);
    REQUIRE(plan.fill_length(2) == 0);
    REQUIRE(plan.covered_extent() == 45);
}

TEST_CASE("plan_axis_rejects_invalid_parameters") {
    REQUIRE_THROWS_AS(plan_axis(Axis::WIDTH, 10, 5, 5, BoundaryPolicy::pad()), InvalidParameterError);
    REQUIRE_THROWS_AS(plan_axis(Axis::WIDTH, 10, 0, 0, BoundaryPolicy::pad()), InvalidParameterError);
    REQUIRE_THROWS_AS(plan_axis(Axis::WIDTH, 10, 5, -1, BoundaryPolicy::pad()), InvalidParameterError);
    REQUIRE_THROWS_AS(plan_axis(Axis::WIDTH, 0, 5, 1, BoundaryPolicy::pad()), InvalidParameterError);
    REQUIRE_THROWS_AS(plan_axis(Axis::HEIGHT, 100, 20, 5, BoundaryPolicy::none()),
                      InvalidParameterError);
}

TEST_CASE("plan_axis_spatial_fill_rejected_on_time") {
    auto blur = BoundaryPolicy::pad(FillSpec::of(FillMode::BLUR));
    REQUIRE_THROWS_AS(plan_axis(Axis::TIME, 50, 20, 5, blur), UnsupportedModeError);
    REQUIRE_NOTHROW(plan_axis(Axis::WIDTH, 50, 20, 5, blur));
}

TEST_CASE("parse_boundary_policy_names") {
    REQUIRE(parse_boundary_policy("discard").kind == BoundaryKind::DISCARD);
    REQUIRE(parse_boundary_policy(" None ").kind == BoundaryKind::NONE);

    auto loop = parse_boundary_policy("loop");
    REQUIRE(loop.kind == BoundaryKind::PAD);
    REQUIRE(loop.fill.mode == FillMode::WRAP);

    auto grey = parse_boundary_policy("128,64");
    REQUIRE(grey.fill.mode == FillMode::COLOR);
    REQUIRE(grey.fill.color.size() == 2);

    REQUIRE_THROWS_AS(make_boundary_policy("color", {}), InvalidParameterError);
    REQUIRE(make_boundary_policy("color", {255.0f}).fill.mode == FillMode::COLOR);
}

TEST_CASE("plan_tiles_enforces_tile_limit") {
    TilingParams params;
    params.tile_width = 8;
    params.tile_height = 8;
    params.overlap_width = 0;
    params.overlap_height = 0;
    params.max_tiles_per_frame = 16;

    REQUIRE(plan_tiles(32, 32, params).tiles_per_frame() == 16);
    REQUIRE_THROWS_AS(plan_tiles(40, 32, params), InvalidParameterError);
}

TEST_CASE("plan_windows_uses_window_defaults") {
    WindowingParams params;
    auto plan = plan_windows(100, params);

    REQUIRE(plan.axis == Axis::TIME);
    REQUIRE(plan.stride == 15);
    REQUIRE(plan.unit_count == 7);
    REQUIRE(plan.deficit == 10);
}
