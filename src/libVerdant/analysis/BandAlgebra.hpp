#pragma once

#include "core/Platform.hpp"
#include "core/Raster.hpp"
#include "catalog/Scene.hpp"

// ============================================================================
// BandAlgebra - Per-pixel normalized difference
// ============================================================================
//   index = (a - b) / (a + b)
// With a = NIR and b = Red this is NDVI; with a = Green and b = SWIR it is
// NDSI, etc. The result is undefined (not NaN, not a fault) where a + b == 0
// or where either input is undefined or non-finite.
// ============================================================================

namespace verdant {

class VD_API BandAlgebra {
public:
    /// Normalized difference of two rasters on the same grid
    /// @throws GridMismatchError if a and b are not aligned
    static Raster NormalizedDifference(const Raster& a, const Raster& b);

    /// Normalized difference of two bands of a scene
    /// @throws DataSourceError if the scene lacks either band
    /// @throws GridMismatchError if the bands are not aligned
    static Raster NormalizedDifference(const Scene& scene, StringView bandA, StringView bandB);
};

} // namespace verdant
