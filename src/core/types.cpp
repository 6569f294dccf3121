#include "tile_weave/core/types.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/core/utils.hpp"

namespace tile_weave {

std::string shape_to_string(const FrameShape& shape) {
    return std::to_string(shape.width) + "x" + std::to_string(shape.height) +
           "x" + std::to_string(shape.channels);
}

Axis string_to_axis(const std::string& s) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "width") return Axis::WIDTH;
    if (norm == "height") return Axis::HEIGHT;
    if (norm == "time") return Axis::TIME;
    throw UnsupportedModeError("unknown axis '" + s + "'");
}

BoundaryKind string_to_boundary_kind(const std::string& s) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "pad") return BoundaryKind::PAD;
    if (norm == "discard") return BoundaryKind::DISCARD;
    if (norm == "none") return BoundaryKind::NONE;
    throw UnsupportedModeError("unknown boundary policy '" + s + "'");
}

FillMode string_to_fill_mode(const std::string& s) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "mirror") return FillMode::MIRROR;
    if (norm == "wrap" || norm == "loop") return FillMode::WRAP;
    if (norm == "repeat") return FillMode::REPEAT;
    if (norm == "blur") return FillMode::BLUR;
    if (norm == "black") return FillMode::BLACK;
    if (norm == "color") return FillMode::COLOR;
    if (norm == "telea") return FillMode::TELEA;
    if (norm == "ns") return FillMode::NAVIER_STOKES;
    throw UnsupportedModeError("unknown fill mode '" + s +
                               "' (expected mirror, wrap, loop, repeat, blur, black, "
                               "color, telea or ns)");
}

ReconstructionMode string_to_reconstruction_mode(const std::string& s) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "crop") return ReconstructionMode::CROP;
    if (norm == "fade") return ReconstructionMode::FADE;
    throw UnsupportedModeError("unknown reconstruction mode '" + s + "' (expected crop or fade)");
}

} // namespace tile_weave
