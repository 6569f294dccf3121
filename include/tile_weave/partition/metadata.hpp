#pragma once

#include "tile_weave/core/types.hpp"
#include "tile_weave/partition/axis_plan.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tile_weave::partition {

// Forward partition parameters of one axis plus the unit's position on it
struct AxisTag {
    Axis axis = Axis::WIDTH;
    int original_extent = 0;
    int unit_size = 0;
    int overlap = 0;
    int unit_count = 0;
    int index = 0;
    BoundaryKind boundary = BoundaryKind::PAD;
    std::string fill;

    // Equal in everything except the index
    bool same_partition(const AxisTag& other) const;

    bool operator==(const AxisTag& other) const {
        return same_partition(other) && index == other.index;
    }
    bool operator!=(const AxisTag& other) const { return !(*this == other); }
};

/**
 * Provenance record attached to every produced unit.
 * Survives external per-unit transforms unchanged; fully determines the
 * forward plan of every tagged axis.
 */
struct UnitMetadata {
    static constexpr int kVersion = 1;

    int version = kVersion;
    int source_index = 0;  // source frame of a tile, first source frame of a window
    std::vector<AxisTag> axes;

    const AxisTag* find(Axis axis) const;
    bool empty() const { return axes.empty(); }
    bool same_partition(const UnitMetadata& other) const;
};

AxisTag tag_axis(const AxisPlan& plan, int index);

// Re-derives the forward plan a tag was produced from
AxisPlan plan_from_tag(const AxisTag& tag);

nlohmann::json metadata_to_json(const UnitMetadata& meta);
UnitMetadata metadata_from_json(const nlohmann::json& j);

std::string encode_metadata(const UnitMetadata& meta);
std::optional<UnitMetadata> decode_metadata(const std::string& text);

} // namespace tile_weave::partition
