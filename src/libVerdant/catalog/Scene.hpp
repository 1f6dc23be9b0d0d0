#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "core/Raster.hpp"
#include "geometry/Polygon.hpp"

#include <chrono>
#include <map>

// ============================================================================
// Scene - One raster observation from a catalog
// ============================================================================
// SceneInfo is what a catalog listing returns (cheap, no pixels).
// Scene adds the fetched band rasters; each band carries its own grid.
// Both are treated as immutable once built.
// ============================================================================

namespace verdant {

using Date = std::chrono::year_month_day;

/// Parse an ISO calendar date "YYYY-MM-DD"
VD_API Optional<Date> ParseDate(StringView text);

/// Format as "YYYY-MM-DD"
VD_API String FormatDate(const Date& date);

struct SceneInfo {
    String id;
    Date date{};
    Polygon footprint;

    // Fraction of the scene covered by cloud, [0, 1]
    f64 cloudFraction = 0.0;

    // Band identifiers the source can deliver (e.g. {"red", "nir"})
    Vector<String> bands;

    // Source-specific locator (file path, object key, ...)
    String location;
};

struct Scene {
    SceneInfo info;

    // Ordered so iteration (and logging) is deterministic
    std::map<String, Raster, std::less<>> bands;

    const Raster* FindBand(StringView name) const {
        auto it = bands.find(name);
        return it == bands.end() ? nullptr : &it->second;
    }
};

} // namespace verdant
