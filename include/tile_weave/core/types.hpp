#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <string>
#include <vector>

namespace tile_weave {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

struct FrameShape {
    int width = 0;
    int height = 0;
    int channels = 0;

    bool operator==(const FrameShape& o) const {
        return width == o.width && height == o.height && channels == o.channels;
    }
    bool operator!=(const FrameShape& o) const { return !(*this == o); }
};

// One frame: equally sized sample planes (one per channel)
struct Frame {
    std::vector<Matrix2Df> planes;

    Frame() = default;
    explicit Frame(std::vector<Matrix2Df> p) : planes(std::move(p)) {}

    int width() const { return planes.empty() ? 0 : static_cast<int>(planes[0].cols()); }
    int height() const { return planes.empty() ? 0 : static_cast<int>(planes[0].rows()); }
    int channels() const { return static_cast<int>(planes.size()); }
    FrameShape shape() const { return {width(), height(), channels()}; }
    bool empty() const { return planes.empty() || planes[0].size() == 0; }

    static Frame zeros(const FrameShape& shape) {
        Frame f;
        f.planes.assign(static_cast<size_t>(shape.channels),
                        Matrix2Df::Zero(shape.height, shape.width));
        return f;
    }
};

std::string shape_to_string(const FrameShape& shape);

// Partitioned axis
enum class Axis {
    WIDTH,
    HEIGHT,
    TIME
};

inline std::string axis_to_string(Axis axis) {
    switch (axis) {
        case Axis::WIDTH: return "width";
        case Axis::HEIGHT: return "height";
        case Axis::TIME: return "time";
    }
    return "unknown";
}

Axis string_to_axis(const std::string& s);

// How a short final unit is resolved
enum class BoundaryKind {
    PAD,
    DISCARD,
    NONE  // temporal only: last unit keeps its natural short length
};

inline std::string boundary_kind_to_string(BoundaryKind kind) {
    switch (kind) {
        case BoundaryKind::PAD: return "pad";
        case BoundaryKind::DISCARD: return "discard";
        case BoundaryKind::NONE: return "none";
    }
    return "unknown";
}

BoundaryKind string_to_boundary_kind(const std::string& s);

// Fill strategies for boundary units
enum class FillMode {
    MIRROR,
    WRAP,           // "loop" on the time axis
    REPEAT,
    BLUR,           // reflected border with distance-scaled blur falloff
    BLACK,
    COLOR,
    TELEA,          // delegated outpainting (spatial only)
    NAVIER_STOKES   // delegated outpainting (spatial only)
};

inline std::string fill_mode_to_string(FillMode mode) {
    switch (mode) {
        case FillMode::MIRROR: return "mirror";
        case FillMode::WRAP: return "wrap";
        case FillMode::REPEAT: return "repeat";
        case FillMode::BLUR: return "blur";
        case FillMode::BLACK: return "black";
        case FillMode::COLOR: return "color";
        case FillMode::TELEA: return "telea";
        case FillMode::NAVIER_STOKES: return "ns";
    }
    return "unknown";
}

FillMode string_to_fill_mode(const std::string& s);

inline bool is_spatial_only(FillMode mode) {
    switch (mode) {
        case FillMode::BLUR:
        case FillMode::TELEA:
        case FillMode::NAVIER_STOKES:
            return true;
        case FillMode::MIRROR:
        case FillMode::WRAP:
        case FillMode::REPEAT:
        case FillMode::BLACK:
        case FillMode::COLOR:
            return false;
    }
    return false;
}

// Inverse reconstruction strategy
enum class ReconstructionMode {
    CROP,
    FADE
};

inline std::string reconstruction_mode_to_string(ReconstructionMode mode) {
    switch (mode) {
        case ReconstructionMode::CROP: return "crop";
        case ReconstructionMode::FADE: return "fade";
    }
    return "unknown";
}

ReconstructionMode string_to_reconstruction_mode(const std::string& s);

// Pipeline phase enumeration (CLI event stream)
enum class Phase {
    LOAD_INPUT = 0,
    PLAN = 1,
    PARTITION = 2,
    RESOLVE = 3,
    RECONSTRUCT = 4,
    WRITE_OUTPUT = 5,
    DONE = 6
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_INPUT: return "LOAD_INPUT";
        case Phase::PLAN: return "PLAN";
        case Phase::PARTITION: return "PARTITION";
        case Phase::RESOLVE: return "RESOLVE";
        case Phase::RECONSTRUCT: return "RECONSTRUCT";
        case Phase::WRITE_OUTPUT: return "WRITE_OUTPUT";
        case Phase::DONE: return "DONE";
    }
    return "UNKNOWN";
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace tile_weave
