#pragma once

#include "tile_weave/config/configuration.hpp"
#include "tile_weave/io/sequence.hpp"
#include "tile_weave/partition/axis_plan.hpp"

#include <memory>
#include <mutex>

namespace tile_weave::partition {

struct TilingParams {
    int tile_width = 256;
    int tile_height = 256;
    int overlap_width = 16;
    int overlap_height = 16;
    BoundaryPolicy boundary = BoundaryPolicy::pad();
    int max_tiles_per_frame = 1024;
    float sample_peak = 1.0f;

    static TilingParams from_config(const config::Config& cfg);
};

// Independent width and height plans composed into a row-major grid
struct TileGeometry {
    AxisPlan columns;
    AxisPlan rows;

    int tiles_per_frame() const { return columns.unit_count * rows.unit_count; }
    int output_width() const { return columns.output_extent(); }
    int output_height() const { return rows.output_extent(); }
};

TileGeometry plan_tiles(int width, int height, const TilingParams& params);

nlohmann::json tile_geometry_to_json(const TileGeometry& geometry);

/**
 * Lazy tile stream over a frame sequence.
 * Tile u belongs to frame u / tiles_per_frame; within a frame tiles are
 * ordered row-major. Each source frame is extended once at its right and
 * bottom edges and every tile is cropped from the extended frame.
 */
class TileSource : public io::TileProvider {
public:
    TileSource(std::shared_ptr<const io::SequenceProvider> frames, TilingParams params);

    const TileGeometry& geometry() const { return geometry_; }

    int length() const override;
    io::Tile get(int index) const override;

private:
    // Source frame with the boundary fill applied
    Frame source_frame(int frame_index) const;

    std::shared_ptr<const io::SequenceProvider> frames_;
    TilingParams params_;
    FrameShape shape_;
    TileGeometry geometry_;

    mutable std::mutex cache_mutex_;
    mutable int cached_index_ = -1;
    mutable Frame cached_frame_;
};

} // namespace tile_weave::partition
