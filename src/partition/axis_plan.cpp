#include "tile_weave/partition/axis_plan.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/core/utils.hpp"

#include <algorithm>

namespace tile_weave::partition {

BoundaryPolicy parse_boundary_policy(const std::string& text) {
    const std::string norm = core::to_lower(core::trim(text));
    if (norm == "discard") {
        return BoundaryPolicy::discard();
    }
    if (norm == "none") {
        return BoundaryPolicy::none();
    }
    return BoundaryPolicy::pad(parse_fill_spec(norm));
}

BoundaryPolicy make_boundary_policy(const std::string& padding, const std::vector<float>& color) {
    if (core::to_lower(core::trim(padding)) == "color") {
        if (color.empty()) {
            throw InvalidParameterError("padding 'color' requires a colour value");
        }
        return BoundaryPolicy::pad(FillSpec::solid(color));
    }
    return parse_boundary_policy(padding);
}

std::string boundary_policy_to_string(const BoundaryPolicy& policy) {
    switch (policy.kind) {
        case BoundaryKind::PAD: return fill_spec_to_string(policy.fill);
        case BoundaryKind::DISCARD: return "discard";
        case BoundaryKind::NONE: return "none";
    }
    return "unknown";
}

int AxisPlan::unit_length(int index) const {
    if (policy.kind == BoundaryKind::NONE && index == unit_count - 1) {
        return unit_size - deficit;
    }
    return unit_size;
}

int AxisPlan::source_length(int index) const {
    return std::min(unit_size, extent - unit_origin(index));
}

int AxisPlan::covered_extent() const {
    if (unit_count <= 0) return 0;
    return unit_origin(unit_count - 1) + unit_length(unit_count - 1);
}

int AxisPlan::output_extent() const {
    if (policy.kind == BoundaryKind::DISCARD) {
        return covered_extent();
    }
    return extent;
}

AxisPlan plan_axis(Axis axis, int extent, int unit_size, int overlap,
                   const BoundaryPolicy& policy) {
    const std::string name = axis_to_string(axis);
    if (unit_size <= 0) {
        throw InvalidParameterError(name + " unit size must be > 0 (got " +
                                    std::to_string(unit_size) + ")");
    }
    if (overlap < 0) {
        throw InvalidParameterError(name + " overlap must be >= 0 (got " +
                                    std::to_string(overlap) + ")");
    }
    if (overlap >= unit_size) {
        throw InvalidParameterError(name + " overlap (" + std::to_string(overlap) +
                                    ") must be smaller than the unit size (" +
                                    std::to_string(unit_size) + ")");
    }
    if (extent <= 0) {
        throw InvalidParameterError(name + " extent must be > 0 (got " +
                                    std::to_string(extent) + ")");
    }
    if (axis != Axis::TIME && policy.kind == BoundaryKind::NONE) {
        throw InvalidParameterError("boundary policy 'none' is only available on the time axis");
    }
    if (axis == Axis::TIME && policy.kind == BoundaryKind::PAD && is_spatial_only(policy.fill.mode)) {
        throw UnsupportedModeError("fill mode '" + fill_mode_to_string(policy.fill.mode) +
                                   "' is not available on the time axis");
    }

    AxisPlan plan;
    plan.axis = axis;
    plan.extent = extent;
    plan.unit_size = unit_size;
    plan.overlap = overlap;
    plan.stride = unit_size - overlap;
    plan.policy = policy;

    if (extent > overlap) {
        plan.unit_count = std::max(1, core::ceil_div(extent - overlap, plan.stride));
    } else {
        plan.unit_count = 1;
    }
    plan.deficit = plan.unit_count * plan.stride + overlap - extent;

    if (plan.deficit > 0 && policy.kind == BoundaryKind::DISCARD) {
        if (plan.unit_count == 1) {
            throw InvalidParameterError(name + " extent " + std::to_string(extent) +
                                        " is smaller than one unit (" + std::to_string(unit_size) +
                                        "); cannot discard the only unit");
        }
        plan.unit_count -= 1;
    }

    return plan;
}

nlohmann::json axis_plan_to_json(const AxisPlan& plan) {
    return {
        {"axis", axis_to_string(plan.axis)},
        {"extent", plan.extent},
        {"unit_size", plan.unit_size},
        {"overlap", plan.overlap},
        {"stride", plan.stride},
        {"unit_count", plan.unit_count},
        {"deficit", plan.deficit},
        {"boundary", boundary_kind_to_string(plan.policy.kind)},
        {"fill", boundary_policy_to_string(plan.policy)},
        {"covered_extent", plan.covered_extent()},
        {"output_extent", plan.output_extent()}
    };
}

} // namespace tile_weave::partition
