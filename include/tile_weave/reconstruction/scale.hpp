#pragma once

#include "tile_weave/core/types.hpp"

#include <string>

namespace tile_weave::reconstruction {

// observed / tagged; both sizes must be positive
double detect_scale(int observed, int tagged);

/**
 * Tracks the uniform scale an external stage applied to all units.
 * The first observation fixes the factor; later observations must land
 * within `tolerance` samples of the tagged size scaled by that factor.
 */
class ScaleDetector {
public:
    explicit ScaleDetector(int tolerance = 1);

    // Returns the factor implied by this observation alone
    double observe(const std::string& what, int observed, int tagged);

    bool consistent(int observed, int tagged) const;

    bool has_factor() const { return has_factor_; }
    double factor() const { return factor_; }
    int tolerance() const { return tolerance_; }

private:
    int tolerance_;
    bool has_factor_ = false;
    double factor_ = 1.0;
};

} // namespace tile_weave::reconstruction
