#pragma once

#include "core/Platform.hpp"
#include "core/Raster.hpp"
#include "geometry/Polygon.hpp"

// ============================================================================
// ZonalArea - Physical area of masked pixels inside a region
// ============================================================================
// Partial-overlap policy: a pixel contributes its full area when its centre
// lies inside the region (Polygon::Contains, even-odd, half-open edges), and
// nothing otherwise. Pixels straddling the boundary are therefore over- or
// under-counted; the error shrinks with pixel size. Results are additive
// over disjoint tiles of the same grid.
//
// Pixel area:
//   Projected grid:  |pixelWidth * pixelHeight|            (m^2)
//   Geographic grid: R^2 * dLon * |sin(lat2) - sin(lat1)|  (spherical cell,
//                    R = authalic radius, angles in radians)
// ============================================================================

namespace verdant {

enum class AreaUnit : u8 {
    SquareMetres,
    Hectares,
    SquareKilometres,
    Acres
};

/// "m2", "ha", "km2", "acres"
VD_API Optional<AreaUnit> ParseAreaUnit(StringView name);
VD_API const char* AreaUnitSuffix(AreaUnit unit);

/// Convert square metres to the requested unit
VD_API f64 ConvertArea(f64 squareMetres, AreaUnit unit);

/// Per-pixel physical area (m^2), kept in f64
struct AreaGrid {
    GridSpec grid;
    std::vector<f64> data;

    AreaGrid() = default;
    explicit AreaGrid(const GridSpec& g) : grid(g), data(g.PixelCount(), 0.0) {}

    inline f64 At(usize i) const { return data[i]; }
};

struct AreaResult {
    f64 squareMetres = 0.0;
    f64 value = 0.0;         // in `unit`
    AreaUnit unit = AreaUnit::Hectares;
    usize pixelCount = 0;    // masked pixels whose centre lies in the region
};

class VD_API ZonalArea {
public:
    /// Per-pixel area in m^2 for every cell of the grid
    static AreaGrid PixelAreas(const GridSpec& grid);

    /// Sum of pixel areas (m^2) where mask is true and the pixel centre lies
    /// inside the region
    /// @throws DimensionMismatchError if mask and pixelAreas differ in size
    static f64 MaskedArea(const Mask& mask, const AreaGrid& pixelAreas, const Polygon& region);

    /// MaskedArea plus unit conversion and pixel count
    static AreaResult Aggregate(const Mask& mask, const AreaGrid& pixelAreas,
                                const Polygon& region, AreaUnit unit);
};

} // namespace verdant
