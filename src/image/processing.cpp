#include "tile_weave/image/processing.hpp"
#include "tile_weave/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstring>

namespace tile_weave::image {

cv::Mat as_cv(const Matrix2Df& plane) {
    return cv::Mat(static_cast<int>(plane.rows()), static_cast<int>(plane.cols()), CV_32F,
                   const_cast<float*>(plane.data()));
}

Matrix2Df from_cv(const cv::Mat& mat) {
    cv::Mat src = mat;
    if (src.type() != CV_32F) {
        mat.convertTo(src, CV_32F);
    }
    const int h = src.rows;
    const int w = src.cols;
    Matrix2Df out(h, w);
    if (src.isContinuous()) {
        std::memcpy(out.data(), src.ptr<float>(),
                    static_cast<size_t>(out.size()) * sizeof(float));
    } else {
        for (int r = 0; r < h; ++r) {
            const float* row = src.ptr<float>(r);
            float* dst = out.data() + static_cast<size_t>(r) * static_cast<size_t>(w);
            std::memcpy(dst, row, static_cast<size_t>(w) * sizeof(float));
        }
    }
    return out;
}

Frame crop_frame(const Frame& frame, int x, int y, int width, int height) {
    if (x < 0 || y < 0 || width <= 0 || height <= 0 ||
        x + width > frame.width() || y + height > frame.height()) {
        throw ShapeMismatchError("crop region " + std::to_string(width) + "x" +
                                 std::to_string(height) + "+" + std::to_string(x) + "+" +
                                 std::to_string(y) + " outside frame " +
                                 shape_to_string(frame.shape()));
    }
    Frame out;
    out.planes.reserve(frame.planes.size());
    for (const auto& plane : frame.planes) {
        out.planes.emplace_back(plane.block(y, x, height, width));
    }
    return out;
}

Frame resize_frame(const Frame& frame, int width, int height, Interpolation interp) {
    if (width <= 0 || height <= 0) {
        throw InvalidParameterError("resize target must be positive");
    }
    int flag = cv::INTER_LINEAR;
    switch (interp) {
        case Interpolation::NEAREST: flag = cv::INTER_NEAREST; break;
        case Interpolation::BILINEAR: flag = cv::INTER_LINEAR; break;
        case Interpolation::AREA: flag = cv::INTER_AREA; break;
    }

    Frame out;
    out.planes.reserve(frame.planes.size());
    for (const auto& plane : frame.planes) {
        cv::Mat dst;
        cv::resize(as_cv(plane), dst, cv::Size(width, height), 0.0, 0.0, flag);
        out.planes.push_back(from_cv(dst));
    }
    return out;
}

Frame solid_frame(const FrameShape& shape, const std::vector<float>& values) {
    Frame out;
    out.planes.reserve(static_cast<size_t>(shape.channels));
    for (int c = 0; c < shape.channels; ++c) {
        const float v = values.empty() ? 0.0f
                                       : values[std::min(static_cast<size_t>(c), values.size() - 1)];
        out.planes.push_back(Matrix2Df::Constant(shape.height, shape.width, v));
    }
    return out;
}

} // namespace tile_weave::image
