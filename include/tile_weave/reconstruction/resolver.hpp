#pragma once

#include "tile_weave/config/configuration.hpp"
#include "tile_weave/core/types.hpp"
#include "tile_weave/io/sequence.hpp"
#include "tile_weave/partition/metadata.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tile_weave::reconstruction {

// Manual inverse parameters for one axis, in the units' current sample scale
struct AxisOverride {
    std::optional<int> full_extent;
    std::optional<int> unit_size;
    std::optional<int> overlap;

    bool any() const { return full_extent || unit_size || overlap; }
};

/**
 * Resolved inverse parameters for one axis.
 * All sizes are in the scale of the units as they arrive.
 */
struct AxisResolution {
    Axis axis = Axis::WIDTH;
    bool manual = false;
    double scale = 1.0;
    int full_extent = 0;
    int unit_size = 0;
    int overlap = 0;
    int stride = 0;
    int unit_count = 0;
    int last_length = 0;
    int output_extent = 0;
    BoundaryKind boundary = BoundaryKind::PAD;
    std::optional<partition::AxisTag> tag;  // forward tag of the first unit

    int unit_length(int index) const {
        return index == unit_count - 1 ? last_length : unit_size;
    }
};

struct ResolveOptions {
    ReconstructionMode mode = ReconstructionMode::CROP;
    int scale_tolerance = 1;
    int max_tiles_per_frame = 1024;

    static ResolveOptions from_config(const config::Config& cfg);
};

struct ReconstructionPlan {
    ReconstructionMode mode = ReconstructionMode::CROP;
    int scale_tolerance = 1;
    std::vector<AxisResolution> axes;  // width, height for tiles; time for windows
    int units_per_output = 1;
    int output_count = 0;

    const AxisResolution& axis(Axis a) const;
};

nlohmann::json reconstruction_plan_to_json(const ReconstructionPlan& plan);

ReconstructionPlan resolve_tiles(const io::TileProvider& tiles, const AxisOverride& width,
                                 const AxisOverride& height, const ResolveOptions& options);

ReconstructionPlan resolve_windows(const io::WindowProvider& windows, const AxisOverride& time,
                                   const ResolveOptions& options);

// Checks one fetched unit against the plan; `index` and `observed` follow plan.axes
void check_unit(const ReconstructionPlan& plan, const partition::UnitMetadata& meta,
                const std::vector<int>& index, const std::vector<int>& observed,
                const std::string& what);

} // namespace tile_weave::reconstruction
