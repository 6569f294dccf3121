#pragma once

#include "tile_weave/config/configuration.hpp"
#include "tile_weave/io/sequence.hpp"
#include "tile_weave/partition/axis_plan.hpp"

#include <memory>

namespace tile_weave::partition {

struct WindowingParams {
    int length = 20;
    int overlap = 5;
    BoundaryPolicy boundary = BoundaryPolicy::pad();
    float sample_peak = 1.0f;

    static WindowingParams from_config(const config::Config& cfg);
};

AxisPlan plan_windows(int sequence_length, const WindowingParams& params);

/**
 * Lazy window stream: window i holds source frames [i*S, i*S + U).
 * Under 'none' the last window keeps its natural short length.
 */
class WindowSource : public io::WindowProvider {
public:
    WindowSource(std::shared_ptr<const io::SequenceProvider> frames, WindowingParams params);

    const AxisPlan& plan() const { return plan_; }

    int length() const override { return plan_.unit_count; }
    io::Window get(int index) const override;
    int window_length(int index) const override;

private:
    std::shared_ptr<const io::SequenceProvider> frames_;
    WindowingParams params_;
    AxisPlan plan_;
};

} // namespace tile_weave::partition
