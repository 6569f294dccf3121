#include "tile_weave/partition/metadata.hpp"
#include "tile_weave/core/errors.hpp"

namespace tile_weave::partition {

namespace {

template <typename T>
T required(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        throw MissingParameterError(std::string("metadata field '") + key + "'");
    }
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidParameterError(std::string("metadata field '") + key + "': " + e.what());
    }
}

} // namespace

bool AxisTag::same_partition(const AxisTag& other) const {
    return axis == other.axis &&
           original_extent == other.original_extent &&
           unit_size == other.unit_size &&
           overlap == other.overlap &&
           unit_count == other.unit_count &&
           boundary == other.boundary &&
           fill == other.fill;
}

const AxisTag* UnitMetadata::find(Axis axis) const {
    for (const auto& tag : axes) {
        if (tag.axis == axis) return &tag;
    }
    return nullptr;
}

bool UnitMetadata::same_partition(const UnitMetadata& other) const {
    if (version != other.version || axes.size() != other.axes.size()) {
        return false;
    }
    for (size_t i = 0; i < axes.size(); ++i) {
        if (!axes[i].same_partition(other.axes[i])) return false;
    }
    return true;
}

AxisTag tag_axis(const AxisPlan& plan, int index) {
    if (index < 0 || index >= plan.unit_count) {
        throw InvalidParameterError("unit index " + std::to_string(index) + " outside [0, " +
                                    std::to_string(plan.unit_count) + ")");
    }
    AxisTag tag;
    tag.axis = plan.axis;
    tag.original_extent = plan.extent;
    tag.unit_size = plan.unit_size;
    tag.overlap = plan.overlap;
    tag.unit_count = plan.unit_count;
    tag.index = index;
    tag.boundary = plan.policy.kind;
    tag.fill = boundary_policy_to_string(plan.policy);
    return tag;
}

AxisPlan plan_from_tag(const AxisTag& tag) {
    BoundaryPolicy policy;
    switch (tag.boundary) {
        case BoundaryKind::PAD: policy = BoundaryPolicy::pad(parse_fill_spec(tag.fill)); break;
        case BoundaryKind::DISCARD: policy = BoundaryPolicy::discard(); break;
        case BoundaryKind::NONE: policy = BoundaryPolicy::none(); break;
    }
    AxisPlan plan = plan_axis(tag.axis, tag.original_extent, tag.unit_size, tag.overlap, policy);
    if (plan.unit_count != tag.unit_count) {
        throw ShapeMismatchError(axis_to_string(tag.axis) + " metadata claims " +
                                 std::to_string(tag.unit_count) + " units but its parameters give " +
                                 std::to_string(plan.unit_count));
    }
    if (tag.index < 0 || tag.index >= tag.unit_count) {
        throw ShapeMismatchError(axis_to_string(tag.axis) + " metadata index " +
                                 std::to_string(tag.index) + " outside [0, " +
                                 std::to_string(tag.unit_count) + ")");
    }
    return plan;
}

nlohmann::json metadata_to_json(const UnitMetadata& meta) {
    nlohmann::json axes = nlohmann::json::array();
    for (const auto& tag : meta.axes) {
        axes.push_back({
            {"axis", axis_to_string(tag.axis)},
            {"extent", tag.original_extent},
            {"unit", tag.unit_size},
            {"overlap", tag.overlap},
            {"count", tag.unit_count},
            {"index", tag.index},
            {"boundary", boundary_kind_to_string(tag.boundary)},
            {"fill", tag.fill}
        });
    }
    return {
        {"version", meta.version},
        {"source_index", meta.source_index},
        {"axes", axes}
    };
}

UnitMetadata metadata_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InvalidParameterError("unit metadata must be a JSON object");
    }
    UnitMetadata meta;
    meta.version = required<int>(j, "version");
    if (meta.version < 1 || meta.version > UnitMetadata::kVersion) {
        throw InvalidParameterError("unsupported metadata version " + std::to_string(meta.version));
    }
    meta.source_index = required<int>(j, "source_index");

    const auto axes = required<nlohmann::json>(j, "axes");
    if (!axes.is_array()) {
        throw InvalidParameterError("metadata field 'axes' must be an array");
    }
    for (const auto& a : axes) {
        AxisTag tag;
        tag.axis = string_to_axis(required<std::string>(a, "axis"));
        tag.original_extent = required<int>(a, "extent");
        tag.unit_size = required<int>(a, "unit");
        tag.overlap = required<int>(a, "overlap");
        tag.unit_count = required<int>(a, "count");
        tag.index = required<int>(a, "index");
        tag.boundary = string_to_boundary_kind(required<std::string>(a, "boundary"));
        tag.fill = a.value("fill", std::string());
        meta.axes.push_back(std::move(tag));
    }
    return meta;
}

std::string encode_metadata(const UnitMetadata& meta) {
    return metadata_to_json(meta).dump();
}

std::optional<UnitMetadata> decode_metadata(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidParameterError(std::string("malformed unit metadata: ") + e.what());
    }
    return metadata_from_json(j);
}

} // namespace tile_weave::partition
