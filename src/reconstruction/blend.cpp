#include "tile_weave/reconstruction/blend.hpp"
#include "tile_weave/core/errors.hpp"

#include <algorithm>

namespace tile_weave::reconstruction {

float Span::weight_at(int pos) const {
    if (!contains(pos)) return 0.0f;
    if (weights.empty()) return 1.0f;
    return weights[static_cast<size_t>(pos - dst_begin)];
}

std::vector<float> fade_ramp(int length) {
    std::vector<float> w(static_cast<size_t>(std::max(length, 0)), 1.0f);
    if (length <= 1) return w;
    const float denom = static_cast<float>(length - 1);
    for (int x = 0; x < length; ++x) {
        w[static_cast<size_t>(x)] = static_cast<float>(length - 1 - x) / denom;
    }
    return w;
}

AxisLayout crop_layout(const AxisResolution& axis) {
    AxisLayout layout;
    layout.output_extent = axis.output_extent;

    const int lead_crop = axis.overlap / 2;
    const int trail_crop = axis.overlap - lead_crop;
    const int n = axis.unit_count;

    for (int i = 0; i < n; ++i) {
        const int lead = i > 0 ? lead_crop : 0;
        const int trail = i < n - 1 ? trail_crop : 0;
        Span s;
        s.unit = i;
        s.src_begin = lead;
        s.dst_begin = i * axis.stride + lead;
        s.length = axis.unit_length(i) - lead - trail;
        s.length = std::max(0, std::min(s.length, layout.output_extent - s.dst_begin));
        layout.spans.push_back(std::move(s));
    }
    return layout;
}

AxisLayout fade_layout(const AxisResolution& axis) {
    AxisLayout layout;
    layout.output_extent = axis.output_extent;
    const int n = axis.unit_count;
    const int S = axis.stride;

    for (int i = 0; i < n; ++i) {
        Span s;
        s.unit = i;
        s.src_begin = 0;
        s.dst_begin = i * S;
        s.length = std::max(0, std::min(axis.unit_length(i), layout.output_extent - s.dst_begin));
        s.weights.assign(static_cast<size_t>(s.length), 1.0f);
        layout.spans.push_back(std::move(s));
    }

    // Seam between unit i and i+1 starts at offset S inside unit i
    for (int i = 0; i + 1 < n; ++i) {
        const int seam = std::max(0, std::min(axis.unit_length(i) - S, axis.unit_length(i + 1)));
        const std::vector<float> ramp = fade_ramp(seam);
        Span& a = layout.spans[static_cast<size_t>(i)];
        Span& b = layout.spans[static_cast<size_t>(i + 1)];
        for (int x = 0; x < seam; ++x) {
            const int ia = S + x;
            if (ia < a.length) a.weights[static_cast<size_t>(ia)] *= ramp[static_cast<size_t>(x)];
            if (x < b.length) b.weights[static_cast<size_t>(x)] *= 1.0f - ramp[static_cast<size_t>(x)];
        }
    }

    // More than two units meet where the overlap exceeds the stride
    if (axis.overlap > S) {
        std::vector<float> total(static_cast<size_t>(std::max(layout.output_extent, 0)), 0.0f);
        for (const auto& s : layout.spans) {
            for (int x = 0; x < s.length; ++x) {
                total[static_cast<size_t>(s.dst_begin + x)] += s.weights[static_cast<size_t>(x)];
            }
        }
        for (auto& s : layout.spans) {
            for (int x = 0; x < s.length; ++x) {
                const float t = total[static_cast<size_t>(s.dst_begin + x)];
                if (t > 0.0f) s.weights[static_cast<size_t>(x)] /= t;
            }
        }
    }
    return layout;
}

AxisLayout build_layout(const AxisResolution& axis, ReconstructionMode mode) {
    switch (mode) {
        case ReconstructionMode::CROP: return crop_layout(axis);
        case ReconstructionMode::FADE: return fade_layout(axis);
    }
    throw UnsupportedModeError("reconstruction mode");
}

void place_tile(Frame& out, const Frame& tile, const Span& sx, const Span& sy) {
    if (sx.length <= 0 || sy.length <= 0) return;
    if (tile.channels() != out.channels()) {
        throw ShapeMismatchError("tile has " + std::to_string(tile.channels()) +
                                 " channel(s), output has " + std::to_string(out.channels()));
    }

    const bool weighted = !sx.weights.empty() || !sy.weights.empty();
    Matrix2Df w;
    if (weighted) {
        VectorXf wx = VectorXf::Ones(sx.length);
        VectorXf wy = VectorXf::Ones(sy.length);
        if (!sx.weights.empty()) wx = Eigen::Map<const VectorXf>(sx.weights.data(), sx.length);
        if (!sy.weights.empty()) wy = Eigen::Map<const VectorXf>(sy.weights.data(), sy.length);
        w = wy * wx.transpose();
    }

    for (size_t c = 0; c < out.planes.size(); ++c) {
        const auto src = tile.planes[c].block(sy.src_begin, sx.src_begin, sy.length, sx.length);
        auto dst = out.planes[c].block(sy.dst_begin, sx.dst_begin, sy.length, sx.length);
        if (weighted) {
            dst += w.cwiseProduct(src);
        } else {
            dst = src;
        }
    }
}

} // namespace tile_weave::reconstruction
