#pragma once

#include "core/Platform.hpp"
#include "core/Raster.hpp"

namespace verdant {

/// Explicit grid alignment ahead of compositing
class VD_API Resample {
public:
    /// Sample `source` at every pixel centre of `target` (nearest neighbour).
    /// Target pixels falling outside the source extent are undefined.
    /// @throws GridMismatchError if the CRS identifiers differ
    static Raster NearestNeighbour(const Raster& source, const GridSpec& target);
};

} // namespace verdant
