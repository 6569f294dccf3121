#include "tile_weave/partition/windower.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/partition/metadata.hpp"

namespace tile_weave::partition {

WindowingParams WindowingParams::from_config(const config::Config& cfg) {
    WindowingParams p;
    p.length = cfg.windowing.length;
    p.overlap = cfg.windowing.overlap;
    p.boundary = make_boundary_policy(cfg.windowing.padding, cfg.windowing.color);
    p.sample_peak = cfg.data.sample_peak;
    return p;
}

AxisPlan plan_windows(int sequence_length, const WindowingParams& params) {
    return plan_axis(Axis::TIME, sequence_length, params.length, params.overlap, params.boundary);
}

WindowSource::WindowSource(std::shared_ptr<const io::SequenceProvider> frames,
                           WindowingParams params)
    : frames_(std::move(frames)), params_(std::move(params)) {
    if (!frames_) {
        throw InvalidParameterError("window source requires a frame sequence");
    }
    plan_ = plan_windows(frames_->length(), params_);
    if (plan_.policy.kind == BoundaryKind::PAD) {
        resolve_fill_color(plan_.policy.fill, frames_->shape().channels, params_.sample_peak);
    }
}

int WindowSource::window_length(int index) const {
    if (index < 0 || index >= length()) {
        throw InvalidParameterError("window index " + std::to_string(index) + " outside [0, " +
                                    std::to_string(length()) + ")");
    }
    return plan_.unit_length(index);
}

io::Window WindowSource::get(int index) const {
    const int len = window_length(index);
    const int origin = plan_.unit_origin(index);
    const int available = plan_.source_length(index);

    std::vector<Frame> frames;
    frames.reserve(static_cast<size_t>(len));
    for (int t = 0; t < available; ++t) {
        frames.push_back(frames_->get(origin + t));
    }
    if (len > available) {
        frames = extend_frames(frames, len - available, plan_.policy.fill, params_.sample_peak);
    }

    io::Window window;
    window.frames = std::move(frames);
    window.meta.source_index = origin;
    window.meta.axes.push_back(tag_axis(plan_, index));
    return window;
}

} // namespace tile_weave::partition
