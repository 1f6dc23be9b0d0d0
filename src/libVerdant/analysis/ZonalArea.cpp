#include "ZonalArea.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <cmath>

namespace verdant {

namespace {

struct Accumulation {
    f64 squareMetres = 0.0;
    usize pixelCount = 0;
};

Accumulation Accumulate(const Mask& mask, const AreaGrid& pixelAreas, const Polygon& region) {
    if (!mask.grid.SameShape(pixelAreas.grid) ||
        mask.data.size() != pixelAreas.data.size()) {
        throw DimensionMismatchError(
            "Mask is " + std::to_string(mask.grid.width) + "x" + std::to_string(mask.grid.height) +
            " but pixel-area grid is " + std::to_string(pixelAreas.grid.width) + "x" +
            std::to_string(pixelAreas.grid.height));
    }

    const GridSpec& grid = mask.grid;
    const BoundingBox& bounds = region.Bounds();

    CompensatedSum sum;
    usize count = 0;

    for (u32 y = 0; y < grid.height; ++y) {
        const f64 rowCenterY = grid.PixelCenter(0, y).y;
        if (rowCenterY < bounds.min.y || rowCenterY > bounds.max.y) {
            continue;
        }

        for (u32 x = 0; x < grid.width; ++x) {
            const usize i = grid.Index(x, y);
            if (!mask.At(i)) {
                continue;
            }

            const f64 area = pixelAreas.At(i);
            if (!std::isfinite(area) || area <= 0.0) {
                continue;
            }

            if (!region.Contains(grid.PixelCenter(x, y))) {
                continue;
            }

            sum.Add(area);
            ++count;
        }
    }

    return {std::max(sum.Total(), 0.0), count};
}

} // namespace

Optional<AreaUnit> ParseAreaUnit(StringView name) {
    if (name == "m2")    return AreaUnit::SquareMetres;
    if (name == "ha")    return AreaUnit::Hectares;
    if (name == "km2")   return AreaUnit::SquareKilometres;
    if (name == "acres") return AreaUnit::Acres;
    return std::nullopt;
}

const char* AreaUnitSuffix(AreaUnit unit) {
    switch (unit) {
        case AreaUnit::SquareMetres:     return "m2";
        case AreaUnit::Hectares:         return "ha";
        case AreaUnit::SquareKilometres: return "km2";
        case AreaUnit::Acres:            return "acres";
    }
    return "m2";
}

f64 ConvertArea(f64 squareMetres, AreaUnit unit) {
    switch (unit) {
        case AreaUnit::SquareMetres:     return squareMetres;
        case AreaUnit::Hectares:         return squareMetres / constants::M2_PER_HECTARE;
        case AreaUnit::SquareKilometres: return squareMetres / constants::M2_PER_KM2;
        case AreaUnit::Acres:            return squareMetres / constants::M2_PER_ACRE;
    }
    return squareMetres;
}

AreaGrid ZonalArea::PixelAreas(const GridSpec& grid) {
    AreaGrid areas(grid);

    if (grid.crsKind == CrsKind::Projected) {
        std::fill(areas.data.begin(), areas.data.end(),
                  std::abs(grid.pixelWidth * grid.pixelHeight));
        return areas;
    }

    // Geographic: every cell in a row has the same area
    const f64 r2 = constants::EARTH_AUTHALIC_RADIUS_M * constants::EARTH_AUTHALIC_RADIUS_M;
    const f64 dLon = std::abs(grid.pixelWidth) * constants::DEG_TO_RAD;

    for (u32 y = 0; y < grid.height; ++y) {
        f64 lat1 = grid.originY + static_cast<f64>(y) * grid.pixelHeight;
        f64 lat2 = lat1 + grid.pixelHeight;
        lat1 = std::clamp(lat1, -90.0, 90.0) * constants::DEG_TO_RAD;
        lat2 = std::clamp(lat2, -90.0, 90.0) * constants::DEG_TO_RAD;

        const f64 cell = r2 * dLon * std::abs(std::sin(lat2) - std::sin(lat1));
        std::fill_n(areas.data.begin() + static_cast<isize>(grid.Index(0, y)), grid.width, cell);
    }
    return areas;
}

f64 ZonalArea::MaskedArea(const Mask& mask, const AreaGrid& pixelAreas, const Polygon& region) {
    return Accumulate(mask, pixelAreas, region).squareMetres;
}

AreaResult ZonalArea::Aggregate(const Mask& mask, const AreaGrid& pixelAreas,
                                const Polygon& region, AreaUnit unit) {
    Accumulation acc = Accumulate(mask, pixelAreas, region);

    AreaResult result;
    result.squareMetres = acc.squareMetres;
    result.value = ConvertArea(acc.squareMetres, unit);
    result.unit = unit;
    result.pixelCount = acc.pixelCount;

    VD_LOG_INFO("ZonalArea: {} pixels inside region, {:.4f} m^2 = {:.6f} {}",
                result.pixelCount, result.squareMetres, result.value, AreaUnitSuffix(unit));
    return result;
}

} // namespace verdant
