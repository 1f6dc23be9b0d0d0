#include "BandAlgebra.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"

#include <cmath>

namespace verdant {

Raster BandAlgebra::NormalizedDifference(const Raster& a, const Raster& b) {
    if (!a.grid.IsAlignedWith(b.grid)) {
        throw GridMismatchError("Band grids differ: " + a.grid.Describe() +
                                " vs " + b.grid.Describe());
    }

    Raster index(a.grid);
    const usize n = a.PixelCount();

    for (usize i = 0; i < n; ++i) {
        if (!a.IsDefinedAt(i) || !b.IsDefinedAt(i)) {
            continue;
        }

        const f64 va = a.ValueAt(i);
        const f64 vb = b.ValueAt(i);
        if (!std::isfinite(va) || !std::isfinite(vb)) {
            continue;
        }

        const f64 sum = va + vb;
        if (sum == 0.0) {
            continue;
        }

        index.SetAt(i, static_cast<f32>((va - vb) / sum));
    }

    return index;
}

Raster BandAlgebra::NormalizedDifference(const Scene& scene, StringView bandA, StringView bandB) {
    const Raster* a = scene.FindBand(bandA);
    const Raster* b = scene.FindBand(bandB);
    if (!a || !b) {
        throw DataSourceError("Scene " + scene.info.id + " lacks band '" +
                              String(a ? bandB : bandA) + "'");
    }

    Raster index = NormalizedDifference(*a, *b);
    index.metadata["scene_id"] = scene.info.id;
    index.metadata["date"] = FormatDate(scene.info.date);
    index.metadata["expression"] = "(" + String(bandA) + " - " + String(bandB) + ") / (" +
                                   String(bandA) + " + " + String(bandB) + ")";

    VD_LOG_DEBUG("BandAlgebra: scene {} -> {}/{} pixels defined",
                 scene.info.id, index.DefinedCount(), index.PixelCount());
    return index;
}

} // namespace verdant
