#include "tile_weave/reconstruction/untiler.hpp"
#include "tile_weave/core/errors.hpp"

namespace tile_weave::reconstruction {

Untiler::Untiler(std::shared_ptr<const io::TileProvider> tiles, ReconstructionPlan plan)
    : tiles_(std::move(tiles)), plan_(std::move(plan)) {
    if (!tiles_) {
        throw InvalidParameterError("untiler requires a tile stream");
    }
    if (plan_.axes.size() != 2) {
        throw InvalidParameterError("untiler requires a width and a height plan");
    }
    const AxisResolution& rx = plan_.axis(Axis::WIDTH);
    const AxisResolution& ry = plan_.axis(Axis::HEIGHT);
    columns_ = build_layout(rx, plan_.mode);
    rows_ = build_layout(ry, plan_.mode);

    const int channels = tiles_->length() > 0 ? tiles_->get(0).frame.channels() : 0;
    shape_ = FrameShape{rx.output_extent, ry.output_extent, channels};
}

std::shared_ptr<Untiler> Untiler::create(std::shared_ptr<const io::TileProvider> tiles,
                                         const AxisOverride& width, const AxisOverride& height,
                                         const ResolveOptions& options) {
    if (!tiles) {
        throw InvalidParameterError("untiler requires a tile stream");
    }
    ReconstructionPlan plan = resolve_tiles(*tiles, width, height, options);
    return std::make_shared<Untiler>(std::move(tiles), std::move(plan));
}

Frame Untiler::get(int index) const {
    if (index < 0 || index >= length()) {
        throw InvalidParameterError("frame index " + std::to_string(index) + " outside [0, " +
                                    std::to_string(length()) + ")");
    }
    const int cols = plan_.axes[0].unit_count;
    const int per_frame = plan_.units_per_output;

    Frame out = Frame::zeros(shape_);
    for (int t = 0; t < per_frame; ++t) {
        const int unit = index * per_frame + t;
        const int row = t / cols;
        const int col = t % cols;

        const io::Tile tile = tiles_->get(unit);
        check_unit(plan_, tile.meta, {col, row}, {tile.frame.width(), tile.frame.height()},
                   "tile " + std::to_string(unit));

        place_tile(out, tile.frame, columns_.spans[static_cast<size_t>(col)],
                   rows_.spans[static_cast<size_t>(row)]);
    }
    return out;
}

} // namespace tile_weave::reconstruction
