#include "tile_weave/reconstruction/unwindower.hpp"
#include "tile_weave/core/errors.hpp"

#include <algorithm>

namespace tile_weave::reconstruction {

Unwindower::Unwindower(std::shared_ptr<const io::WindowProvider> windows, ReconstructionPlan plan)
    : windows_(std::move(windows)), plan_(std::move(plan)) {
    if (!windows_) {
        throw InvalidParameterError("unwindower requires a window stream");
    }
    if (plan_.axes.size() != 1 || plan_.axes[0].axis != Axis::TIME) {
        throw InvalidParameterError("unwindower requires a time plan");
    }
    layout_ = build_layout(plan_.axes[0], plan_.mode);

    const std::shared_ptr<const io::Window> first = window(0);
    shape_ = first->frames.empty() ? FrameShape{} : first->frames.front().shape();
}

std::shared_ptr<Unwindower> Unwindower::create(std::shared_ptr<const io::WindowProvider> windows,
                                               const AxisOverride& time,
                                               const ResolveOptions& options) {
    if (!windows) {
        throw InvalidParameterError("unwindower requires a window stream");
    }
    ReconstructionPlan plan = resolve_windows(*windows, time, options);
    return std::make_shared<Unwindower>(std::move(windows), std::move(plan));
}

std::shared_ptr<const io::Window> Unwindower::window(int index) const {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        for (const auto& entry : cache_) {
            if (entry.index == index) return entry.window;
        }
    }

    // Provider reads run unlocked; concurrent misses may fetch the same window twice
    auto w = std::make_shared<io::Window>(windows_->get(index));
    const int observed = static_cast<int>(w->frames.size());
    check_unit(plan_, w->meta, {index}, {observed}, "window " + std::to_string(index));

    std::lock_guard<std::mutex> lock(cache_mutex_);
    for (const auto& entry : cache_) {
        if (entry.index == index) return entry.window;
    }
    CacheEntry& slot = cache_[next_slot_];
    slot.index = index;
    slot.window = w;
    next_slot_ = 1 - next_slot_;
    return w;
}

Frame Unwindower::get(int index) const {
    if (index < 0 || index >= length()) {
        throw InvalidParameterError("frame index " + std::to_string(index) + " outside [0, " +
                                    std::to_string(length()) + ")");
    }
    const AxisResolution& r = plan_.axes[0];
    const int i0 = std::min(r.unit_count - 1, index / r.stride);
    // A frame lies in at most (U-1)/S earlier windows
    const int reach = std::max(1, (r.unit_size - 1) / r.stride);

    Frame out;
    bool placed = false;
    for (int i = std::max(0, i0 - reach); i <= i0; ++i) {
        const Span& span = layout_.spans[static_cast<size_t>(i)];
        if (!span.contains(index)) continue;

        const float w = span.weight_at(index);
        const std::shared_ptr<const io::Window> win = window(i);
        const Frame& src = win->frames[static_cast<size_t>(span.src_begin + index - span.dst_begin)];
        if (src.shape() != shape_) {
            throw ShapeMismatchError("window " + std::to_string(i) + " holds a " +
                                     shape_to_string(src.shape()) + " frame, expected " +
                                     shape_to_string(shape_));
        }

        if (span.weights.empty()) {
            out = src;
            placed = true;
            continue;
        }
        if (!placed) {
            out = Frame::zeros(shape_);
            placed = true;
        }
        for (size_t c = 0; c < out.planes.size(); ++c) {
            out.planes[c] += w * src.planes[c];
        }
    }

    if (!placed) {
        throw ShapeMismatchError("no window covers frame " + std::to_string(index));
    }
    return out;
}

} // namespace tile_weave::reconstruction
