#include "Classifier.hpp"
#include "core/Log.hpp"

namespace verdant {

Mask Classifier::Threshold(const Raster& composite, f64 threshold) {
    Mask mask(composite.grid);

    const usize n = composite.PixelCount();
    for (usize i = 0; i < n; ++i) {
        if (composite.IsDefinedAt(i) && static_cast<f64>(composite.ValueAt(i)) > threshold) {
            mask.data[i] = 1;
        }
    }

    VD_LOG_DEBUG("Classifier: threshold {:.4f} -> {}/{} pixels", threshold, mask.CountTrue(), n);
    return mask;
}

} // namespace verdant
