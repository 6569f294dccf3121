#pragma once

#include "tile_weave/io/sequence.hpp"
#include "tile_weave/reconstruction/blend.hpp"
#include "tile_weave/reconstruction/resolver.hpp"

#include <memory>
#include <mutex>

namespace tile_weave::reconstruction {

/**
 * Restores the frame sequence from a window stream on demand.
 * Frame k is covered by window k/S and at most (U-1)/S windows before it;
 * the two most recently used windows stay resident.
 */
class Unwindower : public io::SequenceProvider {
public:
    Unwindower(std::shared_ptr<const io::WindowProvider> windows, ReconstructionPlan plan);

    static std::shared_ptr<Unwindower> create(std::shared_ptr<const io::WindowProvider> windows,
                                              const AxisOverride& time,
                                              const ResolveOptions& options);

    const ReconstructionPlan& plan() const { return plan_; }

    int length() const override { return plan_.axes[0].output_extent; }
    Frame get(int index) const override;
    FrameShape shape() const override { return shape_; }

private:
    std::shared_ptr<const io::Window> window(int index) const;

    std::shared_ptr<const io::WindowProvider> windows_;
    ReconstructionPlan plan_;
    AxisLayout layout_;
    FrameShape shape_;

    struct CacheEntry {
        int index = -1;
        std::shared_ptr<const io::Window> window;
    };
    mutable std::mutex cache_mutex_;
    mutable CacheEntry cache_[2];
    mutable int next_slot_ = 0;
};

} // namespace tile_weave::reconstruction
