#include "Resample.hpp"
#include "core/Errors.hpp"

#include <cmath>

namespace verdant {

Raster Resample::NearestNeighbour(const Raster& source, const GridSpec& target) {
    if (source.grid.crs != target.crs) {
        throw GridMismatchError("Cannot resample from " + source.grid.crs + " to " + target.crs +
                                " without reprojection");
    }

    if (source.grid.IsAlignedWith(target)) {
        return source;
    }

    const GridSpec& src = source.grid;
    Raster out(target);
    out.metadata = source.metadata;
    out.metadata["resampled"] = "nearest";

    for (u32 y = 0; y < target.height; ++y) {
        for (u32 x = 0; x < target.width; ++x) {
            const Point c = target.PixelCenter(x, y);
            const f64 col = std::floor((c.x - src.originX) / src.pixelWidth);
            const f64 row = std::floor((c.y - src.originY) / src.pixelHeight);
            if (col < 0.0 || row < 0.0 ||
                col >= static_cast<f64>(src.width) || row >= static_cast<f64>(src.height)) {
                continue;
            }

            const usize si = src.Index(static_cast<u32>(col), static_cast<u32>(row));
            if (source.IsDefinedAt(si)) {
                out.Set(x, y, source.ValueAt(si));
            }
        }
    }

    return out;
}

} // namespace verdant
