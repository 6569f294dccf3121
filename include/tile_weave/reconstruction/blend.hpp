#pragma once

#include "tile_weave/core/types.hpp"
#include "tile_weave/reconstruction/resolver.hpp"

#include <vector>

namespace tile_weave::reconstruction {

// Part of one unit that lands in the output along one axis
struct Span {
    int unit = 0;
    int dst_begin = 0;
    int src_begin = 0;
    int length = 0;
    std::vector<float> weights;  // empty: weight 1 throughout

    bool contains(int pos) const { return pos >= dst_begin && pos < dst_begin + length; }
    float weight_at(int pos) const;
};

struct AxisLayout {
    int output_extent = 0;
    std::vector<Span> spans;  // one per unit, in index order
};

// Weights of the earlier unit across a seam of `length` samples: 1 down to 0
std::vector<float> fade_ramp(int length);

// Non-overlapping cores; the overlap is split floor(O/2) before / rest after each seam
AxisLayout crop_layout(const AxisResolution& axis);

// Full units with complementary ramps over each seam
AxisLayout fade_layout(const AxisResolution& axis);

AxisLayout build_layout(const AxisResolution& axis, ReconstructionMode mode);

// Writes (crop) or accumulates (fade) one tile into `out` using the separable weight product
void place_tile(Frame& out, const Frame& tile, const Span& sx, const Span& sy);

} // namespace tile_weave::reconstruction
