#pragma once

#include "core/Platform.hpp"
#include "core/Raster.hpp"

namespace verdant {

// Threshold classification. mask = value > threshold where the composite is
// defined; undefined composite pixels classify as false.
class VD_API Classifier {
public:
    static Mask Threshold(const Raster& composite, f64 threshold);
};

} // namespace verdant
