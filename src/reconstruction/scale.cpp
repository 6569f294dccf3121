#include "tile_weave/reconstruction/scale.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/core/utils.hpp"

#include <cstdlib>
#include <sstream>

namespace tile_weave::reconstruction {

double detect_scale(int observed, int tagged) {
    if (tagged <= 0) {
        throw InvalidParameterError("tagged size must be > 0 (got " + std::to_string(tagged) + ")");
    }
    if (observed <= 0) {
        throw ShapeMismatchError("unit has no samples along a partitioned axis");
    }
    return static_cast<double>(observed) / static_cast<double>(tagged);
}

ScaleDetector::ScaleDetector(int tolerance) : tolerance_(tolerance) {
    if (tolerance_ < 0) {
        throw InvalidParameterError("scale tolerance must be >= 0");
    }
}

bool ScaleDetector::consistent(int observed, int tagged) const {
    if (!has_factor_) return true;
    return std::abs(observed - core::scale_round(tagged, factor_)) <= tolerance_;
}

double ScaleDetector::observe(const std::string& what, int observed, int tagged) {
    const double f = detect_scale(observed, tagged);
    if (!has_factor_) {
        factor_ = f;
        has_factor_ = true;
        return f;
    }
    if (!consistent(observed, tagged)) {
        std::ostringstream oss;
        oss << what << " is " << observed << " samples (tagged " << tagged << "), implying scale "
            << f << " but other units imply " << factor_;
        throw InconsistentScaleError(oss.str());
    }
    return f;
}

} // namespace tile_weave::reconstruction
