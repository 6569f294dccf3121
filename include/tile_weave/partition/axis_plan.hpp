#pragma once

#include "tile_weave/core/types.hpp"
#include "tile_weave/partition/fill.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tile_weave::partition {

struct BoundaryPolicy {
    BoundaryKind kind = BoundaryKind::PAD;
    FillSpec fill;

    static BoundaryPolicy pad(FillSpec spec = FillSpec{}) {
        return BoundaryPolicy{BoundaryKind::PAD, std::move(spec)};
    }
    static BoundaryPolicy discard() { return BoundaryPolicy{BoundaryKind::DISCARD, FillSpec{}}; }
    static BoundaryPolicy none() { return BoundaryPolicy{BoundaryKind::NONE, FillSpec{}}; }
};

// "discard", "none", a fill mode name, or a colour list
BoundaryPolicy parse_boundary_policy(const std::string& text);

// Config form: padding name plus a separate colour list used by "color"
BoundaryPolicy make_boundary_policy(const std::string& padding, const std::vector<float>& color);

std::string boundary_policy_to_string(const BoundaryPolicy& policy);

/**
 * Partition plan for one axis.
 * Units start at i * stride; deficit is the overshoot of the last unit
 * before the boundary policy was applied.
 */
struct AxisPlan {
    Axis axis = Axis::WIDTH;
    int extent = 0;
    int unit_size = 0;
    int overlap = 0;
    int stride = 0;
    int unit_count = 0;
    int deficit = 0;
    BoundaryPolicy policy;

    int unit_origin(int index) const { return index * stride; }

    // Length of unit `index` as produced (short last unit only under NONE)
    int unit_length(int index) const;

    // Samples taken from the source for unit `index`
    int source_length(int index) const;

    // Samples the fill strategy has to synthesize for unit `index`
    int fill_length(int index) const { return unit_length(index) - source_length(index); }

    // Span covered by all produced units
    int covered_extent() const;

    // Extent a lossless inverse reproduces
    int output_extent() const;
};

AxisPlan plan_axis(Axis axis, int extent, int unit_size, int overlap,
                   const BoundaryPolicy& policy);

nlohmann::json axis_plan_to_json(const AxisPlan& plan);

} // namespace tile_weave::partition
