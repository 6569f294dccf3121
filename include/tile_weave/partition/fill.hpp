#pragma once

#include "tile_weave/core/types.hpp"

#include <string>
#include <vector>

namespace tile_weave::partition {

// A named fill strategy plus its optional colour (8-bit scale, 0..255)
struct FillSpec {
    FillMode mode = FillMode::MIRROR;
    std::vector<float> color;

    static FillSpec of(FillMode mode) { return FillSpec{mode, {}}; }
    static FillSpec solid(std::vector<float> color_8bit) {
        return FillSpec{FillMode::COLOR, std::move(color_8bit)};
    }
};

// Parses "mirror", "wrap", ..., or a colour list "128,128,128"
FillSpec parse_fill_spec(const std::string& text);

std::string fill_spec_to_string(const FillSpec& spec);

// Per-plane fill values in sample range; BLACK yields zeros.
// Fails with InvalidParameterError for values outside 0..255 or more values than planes.
std::vector<float> resolve_fill_color(const FillSpec& spec, int channels, float sample_peak);

// Extends a spatial boundary region by `right` columns and `bottom` rows.
// Interior samples are never modified.
Frame extend_frame(const Frame& region, int right, int bottom, const FillSpec& spec,
                   float sample_peak);

// Extends a short temporal boundary region by `deficit` frames at its end.
// Spatial-only modes fail with UnsupportedModeError.
std::vector<Frame> extend_frames(const std::vector<Frame>& region, int deficit,
                                 const FillSpec& spec, float sample_peak);

} // namespace tile_weave::partition
