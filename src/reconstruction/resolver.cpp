#include "tile_weave/reconstruction/resolver.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/core/utils.hpp"
#include "tile_weave/partition/axis_plan.hpp"
#include "tile_weave/reconstruction/scale.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>

namespace tile_weave::reconstruction {

namespace {

std::string override_hint(Axis axis) {
    switch (axis) {
        case Axis::WIDTH: return "full width, tile width and overlap";
        case Axis::HEIGHT: return "full height, tile height and overlap";
        case Axis::TIME: return "full length, window length and overlap";
    }
    return "manual parameters";
}

// Resolves one axis from the first unit's tag (if any) and the override.
// `last_observed` yields the length of the final available unit.
AxisResolution resolve_axis(Axis axis, int observed0, const partition::AxisTag* tag,
                            const AxisOverride& ov, ScaleDetector& detector,
                            const std::function<int()>& last_observed) {
    const std::string name = axis_to_string(axis);
    AxisResolution r;
    r.axis = axis;
    r.manual = ov.any();

    if (!tag && !r.manual) {
        throw AmbiguousAxisError(name + ": units carry no partition metadata; supply " +
                                 override_hint(axis));
    }

    std::optional<partition::AxisPlan> forward;
    int scaled_extent = 0;
    int scaled_unit = 0;
    int scaled_overlap = 0;
    if (tag) {
        r.tag = *tag;
        forward = partition::plan_from_tag(*tag);
        if (!r.manual && tag->index != 0) {
            throw ShapeMismatchError(name + ": first unit has index " + std::to_string(tag->index) +
                                     ", expected 0");
        }
        r.scale = detector.observe(name + " of unit 0", observed0, forward->unit_length(0));
        scaled_extent = core::scale_round(forward->extent, r.scale);
        scaled_unit = core::scale_round(forward->unit_size, r.scale);
        scaled_overlap = core::scale_round(forward->overlap, r.scale);
    }

    if (r.manual) {
        if (ov.full_extent) {
            r.full_extent = *ov.full_extent;
        } else if (forward) {
            r.full_extent = scaled_extent;
        } else {
            throw MissingParameterError(name + " full extent (no metadata to derive it from)");
        }
        r.unit_size = ov.unit_size ? *ov.unit_size : (forward ? scaled_unit : observed0);
        if (ov.overlap) {
            r.overlap = *ov.overlap;
        } else if (forward) {
            r.overlap = scaled_overlap;
        } else {
            throw MissingParameterError(name + " overlap (no metadata to derive it from)");
        }

        // Pad-formula grid over the overridden extent
        const partition::AxisPlan grid = partition::plan_axis(
            axis, r.full_extent, r.unit_size, r.overlap, partition::BoundaryPolicy::pad());
        r.stride = grid.stride;
        r.unit_count = grid.unit_count;
        r.boundary = BoundaryKind::PAD;
        r.scale = static_cast<double>(observed0) / static_cast<double>(r.unit_size);
        r.last_length = r.unit_size;
        if (axis == Axis::TIME) {
            const int last = last_observed();
            if (last <= 0 || last > r.unit_size) {
                throw ShapeMismatchError(name + ": last unit has " + std::to_string(last) +
                                         " samples, unit size is " + std::to_string(r.unit_size));
            }
            r.last_length = last;
        }
        const int covered = (r.unit_count - 1) * r.stride + r.last_length;
        if (covered < r.full_extent) {
            throw ShapeMismatchError(name + ": units cover " + std::to_string(covered) +
                                     " samples but full extent is " + std::to_string(r.full_extent));
        }
        r.output_extent = r.full_extent;
        return r;
    }

    r.full_extent = scaled_extent;
    r.unit_size = scaled_unit;
    r.overlap = scaled_overlap;
    if (r.overlap >= r.unit_size) {
        throw ShapeMismatchError(name + ": scaled overlap " + std::to_string(r.overlap) +
                                 " is not smaller than scaled unit size " +
                                 std::to_string(r.unit_size));
    }
    r.stride = r.unit_size - r.overlap;
    r.unit_count = tag->unit_count;
    r.boundary = tag->boundary;
    r.last_length = r.unit_size;

    if (r.boundary == BoundaryKind::NONE && r.unit_count > 1) {
        const int natural_last = forward->unit_length(r.unit_count - 1);
        const int last = last_observed();
        if (!detector.consistent(last, natural_last)) {
            throw InconsistentScaleError(name + ": last unit has " + std::to_string(last) +
                                         " samples, expected about " +
                                         std::to_string(core::scale_round(natural_last, r.scale)));
        }
        if (last <= 0 || last > r.unit_size) {
            throw ShapeMismatchError(name + ": last unit has " + std::to_string(last) +
                                     " samples, unit size is " + std::to_string(r.unit_size));
        }
        r.last_length = last;
    } else if (r.boundary == BoundaryKind::NONE) {
        r.last_length = observed0;
    }

    const int covered = (r.unit_count - 1) * r.stride + r.last_length;
    if (r.boundary == BoundaryKind::DISCARD) {
        r.output_extent = covered;
    } else {
        r.output_extent = std::min(r.full_extent, covered);
    }
    return r;
}

void check_axis(const AxisResolution& r, const partition::UnitMetadata& meta, int index,
                int observed, int tolerance, const std::string& what) {
    const std::string name = axis_to_string(r.axis);
    const partition::AxisTag* tag = meta.find(r.axis);

    if (!r.manual) {
        if (!tag) {
            throw MissingParameterError(what + " carries no " + name + " metadata");
        }
        if (!tag->same_partition(*r.tag)) {
            throw ShapeMismatchError(what + " comes from a different " + name + " partition (" +
                                     "unit size " + std::to_string(tag->unit_size) + ", overlap " +
                                     std::to_string(tag->overlap) + ", extent " +
                                     std::to_string(tag->original_extent) + " vs unit size " +
                                     std::to_string(r.tag->unit_size) + ", overlap " +
                                     std::to_string(r.tag->overlap) + ", extent " +
                                     std::to_string(r.tag->original_extent) + ")");
        }
        if (tag->index != index) {
            throw ShapeMismatchError(what + " has " + name + " index " + std::to_string(tag->index) +
                                     ", expected " + std::to_string(index));
        }
    }

    const int expected = r.unit_length(index);
    if (observed == expected) {
        return;
    }
    if (r.tag && index < r.tag->unit_count) {
        const partition::AxisPlan forward = partition::plan_from_tag(*r.tag);
        const int natural = forward.unit_length(index);
        if (std::abs(observed - core::scale_round(natural, r.scale)) > tolerance) {
            throw InconsistentScaleError(what + " is " + std::to_string(observed) + " samples along " +
                                         name + " (tagged " + std::to_string(natural) +
                                         "), which does not match scale " +
                                         std::to_string(r.scale));
        }
    }
    throw ShapeMismatchError(what + " is " + std::to_string(observed) + " samples along " + name +
                             ", expected " + std::to_string(expected));
}

} // namespace

ResolveOptions ResolveOptions::from_config(const config::Config& cfg) {
    ResolveOptions o;
    o.mode = string_to_reconstruction_mode(cfg.reconstruction.mode);
    o.scale_tolerance = cfg.reconstruction.scale_tolerance_samples;
    o.max_tiles_per_frame = cfg.tiling.max_tiles_per_frame;
    return o;
}

const AxisResolution& ReconstructionPlan::axis(Axis a) const {
    for (const auto& r : axes) {
        if (r.axis == a) return r;
    }
    throw InvalidParameterError("plan has no " + axis_to_string(a) + " axis");
}

nlohmann::json reconstruction_plan_to_json(const ReconstructionPlan& plan) {
    nlohmann::json axes = nlohmann::json::array();
    for (const auto& r : plan.axes) {
        axes.push_back({
            {"axis", axis_to_string(r.axis)},
            {"manual", r.manual},
            {"scale", r.scale},
            {"full_extent", r.full_extent},
            {"unit_size", r.unit_size},
            {"overlap", r.overlap},
            {"stride", r.stride},
            {"unit_count", r.unit_count},
            {"last_length", r.last_length},
            {"output_extent", r.output_extent},
            {"boundary", boundary_kind_to_string(r.boundary)}
        });
    }
    return {
        {"mode", reconstruction_mode_to_string(plan.mode)},
        {"units_per_output", plan.units_per_output},
        {"output_count", plan.output_count},
        {"axes", axes}
    };
}

ReconstructionPlan resolve_tiles(const io::TileProvider& tiles, const AxisOverride& width,
                                 const AxisOverride& height, const ResolveOptions& options) {
    const int available = tiles.length();
    if (available <= 0) {
        throw ShapeMismatchError("no tiles to reconstruct from");
    }

    const io::Tile first = tiles.get(0);
    if (first.frame.empty()) {
        throw ShapeMismatchError("tile 0 has no samples");
    }
    const partition::AxisTag* tx = first.meta.find(Axis::WIDTH);
    const partition::AxisTag* ty = first.meta.find(Axis::HEIGHT);

    ScaleDetector detector(options.scale_tolerance);
    const auto no_last = []() -> int { return 0; };

    ReconstructionPlan plan;
    plan.mode = options.mode;
    plan.scale_tolerance = options.scale_tolerance;
    plan.axes.push_back(resolve_axis(Axis::WIDTH, first.frame.width(), tx, width, detector, no_last));
    plan.axes.push_back(resolve_axis(Axis::HEIGHT, first.frame.height(), ty, height, detector, no_last));

    const int cols = plan.axes[0].unit_count;
    const int rows = plan.axes[1].unit_count;
    plan.units_per_output = cols * rows;
    if (options.max_tiles_per_frame > 0 && plan.units_per_output > options.max_tiles_per_frame) {
        throw InvalidParameterError("grid of " + std::to_string(cols) + "x" + std::to_string(rows) +
                                    " tiles exceeds the limit of " +
                                    std::to_string(options.max_tiles_per_frame) + " per frame");
    }
    if (available % plan.units_per_output != 0) {
        throw ShapeMismatchError(std::to_string(available) + " tiles do not fill whole frames of " +
                                 std::to_string(cols) + "x" + std::to_string(rows) +
                                 " tiles; if tiles were removed, supply full width/height");
    }
    plan.output_count = available / plan.units_per_output;
    return plan;
}

ReconstructionPlan resolve_windows(const io::WindowProvider& windows, const AxisOverride& time,
                                   const ResolveOptions& options) {
    const int available = windows.length();
    if (available <= 0) {
        throw ShapeMismatchError("no windows to reconstruct from");
    }

    const io::Window first = windows.get(0);
    const partition::AxisTag* tt = first.meta.find(Axis::TIME);

    ScaleDetector detector(options.scale_tolerance);
    const auto last = [&windows, available]() { return windows.window_length(available - 1); };

    ReconstructionPlan plan;
    plan.mode = options.mode;
    plan.scale_tolerance = options.scale_tolerance;
    plan.axes.push_back(resolve_axis(Axis::TIME, static_cast<int>(first.frames.size()), tt, time,
                                     detector, last));

    const AxisResolution& r = plan.axes[0];
    if (available != r.unit_count) {
        throw ShapeMismatchError(std::to_string(available) + " windows present but the plan needs " +
                                 std::to_string(r.unit_count) +
                                 "; if windows were removed, supply the full length");
    }
    plan.units_per_output = 1;
    plan.output_count = r.output_extent;
    return plan;
}

void check_unit(const ReconstructionPlan& plan, const partition::UnitMetadata& meta,
                const std::vector<int>& index, const std::vector<int>& observed,
                const std::string& what) {
    if (index.size() != plan.axes.size() || observed.size() != plan.axes.size()) {
        throw InvalidParameterError("unit check needs one index and size per axis");
    }
    for (size_t k = 0; k < plan.axes.size(); ++k) {
        check_axis(plan.axes[k], meta, index[k], observed[k], plan.scale_tolerance, what);
    }
}

} // namespace tile_weave::reconstruction
