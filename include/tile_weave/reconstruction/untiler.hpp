#pragma once

#include "tile_weave/io/sequence.hpp"
#include "tile_weave/reconstruction/blend.hpp"
#include "tile_weave/reconstruction/resolver.hpp"

#include <memory>

namespace tile_weave::reconstruction {

/**
 * Reassembles frames from a tile stream on demand.
 * Frame k reads exactly tiles [k*T, (k+1)*T) where T is the grid size;
 * every tile is checked against the plan when it is fetched.
 */
class Untiler : public io::SequenceProvider {
public:
    Untiler(std::shared_ptr<const io::TileProvider> tiles, ReconstructionPlan plan);

    // Resolves the plan from the tiles themselves
    static std::shared_ptr<Untiler> create(std::shared_ptr<const io::TileProvider> tiles,
                                           const AxisOverride& width, const AxisOverride& height,
                                           const ResolveOptions& options);

    const ReconstructionPlan& plan() const { return plan_; }

    int length() const override { return plan_.output_count; }
    Frame get(int index) const override;
    FrameShape shape() const override { return shape_; }

private:
    std::shared_ptr<const io::TileProvider> tiles_;
    ReconstructionPlan plan_;
    AxisLayout columns_;
    AxisLayout rows_;
    FrameShape shape_;
};

} // namespace tile_weave::reconstruction
