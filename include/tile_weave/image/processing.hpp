#pragma once

#include "tile_weave/core/types.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace tile_weave::image {

// Non-owning CV_32F view of a plane
cv::Mat as_cv(const Matrix2Df& plane);

// Deep copy of a CV_32F matrix into a plane
Matrix2Df from_cv(const cv::Mat& mat);

// Sub-region of every plane; the region must lie inside the frame
Frame crop_frame(const Frame& frame, int x, int y, int width, int height);

enum class Interpolation {
    NEAREST,
    BILINEAR,
    AREA
};

// Resizes every plane; stands in for an external per-unit transform
Frame resize_frame(const Frame& frame, int width, int height,
                   Interpolation interp = Interpolation::BILINEAR);

// Frame with every plane filled by the matching value
Frame solid_frame(const FrameShape& shape, const std::vector<float>& values);

} // namespace tile_weave::image
