#include "tile_weave/partition/fill.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/core/utils.hpp"
#include "tile_weave/image/processing.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace tile_weave::partition {

namespace {

bool looks_numeric(const std::string& s) {
    return !s.empty() && (std::isdigit(static_cast<unsigned char>(s[0])) || s[0] == '.' ||
                          s[0] == '-' || s[0] == '+');
}

cv::Mat border_extend(const cv::Mat& src, int right, int bottom, int border_type,
                      const cv::Scalar& value = cv::Scalar()) {
    cv::Mat dst;
    cv::copyMakeBorder(src, dst, 0, bottom, 0, right, border_type, value);
    return dst;
}

// Reflected border blended towards a blurred copy with growing distance from the edge
cv::Mat blur_falloff_extend(const cv::Mat& src, int right, int bottom) {
    cv::Mat reflected = border_extend(src, right, bottom, cv::BORDER_REFLECT_101);
    const double sigma = std::max(1.0, static_cast<double>(std::max(right, bottom)) / 3.0);
    cv::Mat blurred;
    cv::GaussianBlur(reflected, blurred, cv::Size(0, 0), sigma, sigma, cv::BORDER_REFLECT_101);

    cv::Mat out = reflected.clone();
    for (int y = 0; y < out.rows; ++y) {
        const float* r = reflected.ptr<float>(y);
        const float* b = blurred.ptr<float>(y);
        float* o = out.ptr<float>(y);
        const float ty = (y >= src.rows && bottom > 0)
                             ? static_cast<float>(y - src.rows + 1) / static_cast<float>(bottom)
                             : 0.0f;
        for (int x = 0; x < out.cols; ++x) {
            const float tx = (x >= src.cols && right > 0)
                                 ? static_cast<float>(x - src.cols + 1) / static_cast<float>(right)
                                 : 0.0f;
            const float t = std::max(tx, ty);
            if (t > 0.0f) {
                o[x] = (1.0f - t) * r[x] + t * b[x];
            }
        }
    }
    return out;
}

// Outpaints the border on an 8-bit rendition of the plane
cv::Mat inpaint_extend(const cv::Mat& src, int right, int bottom, int flags, float sample_peak) {
    const double to8 = sample_peak > 0.0f ? 255.0 / static_cast<double>(sample_peak) : 1.0;

    cv::Mat src8;
    src.convertTo(src8, CV_8U, to8);
    cv::Mat padded8 = border_extend(src8, right, bottom, cv::BORDER_CONSTANT, cv::Scalar(0));

    cv::Mat mask(padded8.size(), CV_8U, cv::Scalar(255));
    mask(cv::Rect(0, 0, src.cols, src.rows)).setTo(cv::Scalar(0));

    cv::Mat painted8;
    cv::inpaint(padded8, mask, painted8, 3.0, flags);

    cv::Mat out;
    painted8.convertTo(out, CV_32F, 1.0 / to8);
    src.copyTo(out(cv::Rect(0, 0, src.cols, src.rows)));
    return out;
}

cv::Mat extend_plane(const cv::Mat& src, int right, int bottom, const FillSpec& spec,
                     float fill_value, float sample_peak) {
    switch (spec.mode) {
        case FillMode::MIRROR:
            return border_extend(src, right, bottom, cv::BORDER_REFLECT);
        case FillMode::WRAP:
            return border_extend(src, right, bottom, cv::BORDER_WRAP);
        case FillMode::REPEAT:
            return border_extend(src, right, bottom, cv::BORDER_REPLICATE);
        case FillMode::BLUR:
            return blur_falloff_extend(src, right, bottom);
        case FillMode::BLACK:
        case FillMode::COLOR:
            return border_extend(src, right, bottom, cv::BORDER_CONSTANT, cv::Scalar(fill_value));
        case FillMode::TELEA:
            return inpaint_extend(src, right, bottom, cv::INPAINT_TELEA, sample_peak);
        case FillMode::NAVIER_STOKES:
            return inpaint_extend(src, right, bottom, cv::INPAINT_NS, sample_peak);
    }
    throw UnsupportedModeError("fill mode " + fill_mode_to_string(spec.mode));
}

} // namespace

FillSpec parse_fill_spec(const std::string& text) {
    const std::string norm = core::trim(text);
    if (looks_numeric(norm)) {
        std::vector<float> values;
        for (const auto& part : core::split(norm, ',')) {
            const std::string p = core::trim(part);
            if (p.empty()) continue;
            try {
                values.push_back(std::stof(p));
            } catch (const std::exception&) {
                throw InvalidParameterError("cannot parse colour value '" + p + "'");
            }
        }
        if (values.empty()) {
            throw InvalidParameterError("empty colour list");
        }
        return FillSpec::solid(std::move(values));
    }
    return FillSpec::of(string_to_fill_mode(norm));
}

std::string fill_spec_to_string(const FillSpec& spec) {
    if (spec.mode != FillMode::COLOR) {
        return fill_mode_to_string(spec.mode);
    }
    std::ostringstream oss;
    for (size_t i = 0; i < spec.color.size(); ++i) {
        if (i > 0) oss << ",";
        oss << spec.color[i];
    }
    return oss.str();
}

std::vector<float> resolve_fill_color(const FillSpec& spec, int channels, float sample_peak) {
    std::vector<float> out(static_cast<size_t>(std::max(channels, 0)), 0.0f);
    if (spec.mode != FillMode::COLOR) {
        return out;
    }
    if (spec.color.empty()) {
        throw InvalidParameterError("colour fill requires at least one value");
    }
    if (static_cast<int>(spec.color.size()) > channels) {
        throw InvalidParameterError("too many colour values (" + std::to_string(spec.color.size()) +
                                    ") for " + std::to_string(channels) + " channel(s)");
    }
    for (float v : spec.color) {
        if (!(v >= 0.0f && v <= 255.0f)) {
            throw InvalidParameterError("colour values must be in range 0-255");
        }
    }
    for (int c = 0; c < channels; ++c) {
        const size_t src = std::min(static_cast<size_t>(c), spec.color.size() - 1);
        out[static_cast<size_t>(c)] = spec.color[src] * sample_peak / 255.0f;
    }
    return out;
}

Frame extend_frame(const Frame& region, int right, int bottom, const FillSpec& spec,
                   float sample_peak) {
    if (right < 0 || bottom < 0) {
        throw InvalidParameterError("fill amount cannot be negative");
    }
    if (region.empty()) {
        throw InvalidParameterError("cannot extend an empty region");
    }
    if (right == 0 && bottom == 0) {
        return region;
    }

    const std::vector<float> fill = resolve_fill_color(spec, region.channels(), sample_peak);

    Frame out;
    out.planes.reserve(region.planes.size());
    for (size_t c = 0; c < region.planes.size(); ++c) {
        cv::Mat extended = extend_plane(image::as_cv(region.planes[c]), right, bottom, spec,
                                        fill[c], sample_peak);
        out.planes.push_back(image::from_cv(extended));
    }
    return out;
}

std::vector<Frame> extend_frames(const std::vector<Frame>& region, int deficit,
                                 const FillSpec& spec, float sample_peak) {
    if (deficit < 0) {
        throw InvalidParameterError("fill amount cannot be negative");
    }
    if (region.empty()) {
        throw InvalidParameterError("cannot extend an empty window");
    }
    if (is_spatial_only(spec.mode)) {
        throw UnsupportedModeError("fill mode '" + fill_mode_to_string(spec.mode) +
                                   "' is not available on the time axis");
    }

    std::vector<Frame> out = region;
    out.reserve(region.size() + static_cast<size_t>(deficit));
    const int len = static_cast<int>(region.size());

    switch (spec.mode) {
        case FillMode::MIRROR: {
            if (len == 1) {
                for (int i = 0; i < deficit; ++i) out.push_back(region[0]);
                break;
            }
            // Ping-pong without duplicating the turning frames
            std::vector<int> cycle;
            for (int i = len - 2; i >= 0; --i) cycle.push_back(i);
            for (int i = 1; i < len; ++i) cycle.push_back(i);
            for (int i = 0; i < deficit; ++i) {
                out.push_back(region[static_cast<size_t>(cycle[static_cast<size_t>(i) % cycle.size()])]);
            }
            break;
        }
        case FillMode::WRAP:
            for (int i = 0; i < deficit; ++i) out.push_back(region[static_cast<size_t>(i % len)]);
            break;
        case FillMode::REPEAT:
            for (int i = 0; i < deficit; ++i) out.push_back(region.back());
            break;
        case FillMode::BLACK:
        case FillMode::COLOR: {
            const FrameShape shape = region.back().shape();
            const Frame blank = image::solid_frame(
                shape, resolve_fill_color(spec, shape.channels, sample_peak));
            for (int i = 0; i < deficit; ++i) out.push_back(blank);
            break;
        }
        case FillMode::BLUR:
        case FillMode::TELEA:
        case FillMode::NAVIER_STOKES:
            throw UnsupportedModeError("fill mode '" + fill_mode_to_string(spec.mode) +
                                       "' is not available on the time axis");
    }
    return out;
}

} // namespace tile_weave::partition
