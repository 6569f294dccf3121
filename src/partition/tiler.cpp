#include "tile_weave/partition/tiler.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/image/processing.hpp"
#include "tile_weave/partition/metadata.hpp"

namespace tile_weave::partition {

TilingParams TilingParams::from_config(const config::Config& cfg) {
    TilingParams p;
    p.tile_width = cfg.tiling.tile_width;
    p.tile_height = cfg.tiling.tile_height;
    p.overlap_width = cfg.tiling.overlap_width;
    p.overlap_height = cfg.tiling.overlap_height;
    p.boundary = make_boundary_policy(cfg.tiling.padding, cfg.tiling.color);
    p.max_tiles_per_frame = cfg.tiling.max_tiles_per_frame;
    p.sample_peak = cfg.data.sample_peak;
    return p;
}

TileGeometry plan_tiles(int width, int height, const TilingParams& params) {
    TileGeometry g;
    g.columns = plan_axis(Axis::WIDTH, width, params.tile_width, params.overlap_width,
                          params.boundary);
    g.rows = plan_axis(Axis::HEIGHT, height, params.tile_height, params.overlap_height,
                       params.boundary);

    if (params.max_tiles_per_frame > 0 && g.tiles_per_frame() > params.max_tiles_per_frame) {
        throw InvalidParameterError("tiling would create " + std::to_string(g.tiles_per_frame()) +
                                    " tiles per frame (limit " +
                                    std::to_string(params.max_tiles_per_frame) +
                                    "); use larger tiles");
    }
    return g;
}

nlohmann::json tile_geometry_to_json(const TileGeometry& geometry) {
    return {
        {"columns", axis_plan_to_json(geometry.columns)},
        {"rows", axis_plan_to_json(geometry.rows)},
        {"tiles_per_frame", geometry.tiles_per_frame()},
        {"output_width", geometry.output_width()},
        {"output_height", geometry.output_height()}
    };
}

TileSource::TileSource(std::shared_ptr<const io::SequenceProvider> frames, TilingParams params)
    : frames_(std::move(frames)), params_(std::move(params)) {
    if (!frames_) {
        throw InvalidParameterError("tile source requires a frame sequence");
    }
    shape_ = frames_->shape();
    geometry_ = plan_tiles(shape_.width, shape_.height, params_);
    if (params_.boundary.kind == BoundaryKind::PAD) {
        // Colour errors surface here, not on the first boundary tile
        resolve_fill_color(params_.boundary.fill, shape_.channels, params_.sample_peak);
    }
}

int TileSource::length() const {
    return frames_->length() * geometry_.tiles_per_frame();
}

Frame TileSource::source_frame(int frame_index) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (cached_index_ != frame_index) {
        Frame f = frames_->get(frame_index);
        if (f.shape() != shape_) {
            throw ShapeMismatchError("frame " + std::to_string(frame_index) + " is " +
                                     shape_to_string(f.shape()) + ", expected " +
                                     shape_to_string(shape_));
        }
        // The whole frame is extended once so fills see the full frame content
        const AxisPlan& cx = geometry_.columns;
        const AxisPlan& cy = geometry_.rows;
        const int right = cx.fill_length(cx.unit_count - 1);
        const int bottom = cy.fill_length(cy.unit_count - 1);
        if (right > 0 || bottom > 0) {
            f = extend_frame(f, right, bottom, params_.boundary.fill, params_.sample_peak);
        }
        cached_frame_ = std::move(f);
        cached_index_ = frame_index;
    }
    return cached_frame_;
}

io::Tile TileSource::get(int index) const {
    if (index < 0 || index >= length()) {
        throw InvalidParameterError("tile index " + std::to_string(index) + " outside [0, " +
                                    std::to_string(length()) + ")");
    }
    const int per_frame = geometry_.tiles_per_frame();
    const int frame_index = index / per_frame;
    const int local = index % per_frame;
    const int row = local / geometry_.columns.unit_count;
    const int col = local % geometry_.columns.unit_count;

    const AxisPlan& cx = geometry_.columns;
    const AxisPlan& cy = geometry_.rows;

    const Frame frame = source_frame(frame_index);

    io::Tile tile;
    tile.frame = image::crop_frame(frame, cx.unit_origin(col), cy.unit_origin(row),
                                   cx.unit_length(col), cy.unit_length(row));
    tile.meta.source_index = frame_index;
    tile.meta.axes.push_back(tag_axis(cx, col));
    tile.meta.axes.push_back(tag_axis(cy, row));
    return tile;
}

} // namespace tile_weave::partition
