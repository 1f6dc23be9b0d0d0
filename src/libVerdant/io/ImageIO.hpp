#pragma once

#include "core/Raster.hpp"
#include "core/Log.hpp"

#include <optional>
#include <string>
#include <tuple>

namespace verdant {

// ============================================================================
// ImageIO - EXR export of composite rasters using OpenEXR 3.x
// ============================================================================
// Channels (all FLOAT):
//   value  - composite value, NaN where undefined
//   valid  - 1 where defined, 0 otherwise
//   mask   - classification (only when a mask is given)
//
// Georeferencing and raster metadata are written as string attributes
// (origin_x, origin_y, pixel_width, pixel_height, crs, ...).
// ============================================================================

class VD_API ImageIO {
public:
    // Write composite (and optional mask) to an EXR file
    // Returns true on success, false on failure
    static bool WriteEXR(const std::string& filepath, const Raster& composite,
                         const Mask* mask = nullptr);

    // Get image dimensions and channel count without loading pixels
    static std::optional<std::tuple<u32, u32, u32>> GetDimensions(const std::string& filepath);
};

} // namespace verdant
