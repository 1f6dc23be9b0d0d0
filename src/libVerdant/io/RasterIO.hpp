#pragma once

#include "core/Raster.hpp"
#include "core/Log.hpp"

#include <map>
#include <optional>
#include <string>

namespace verdant {

// ============================================================================
// RasterIO - HDF5 raster reading/writing
// ============================================================================
// Scene file (band data):
//   /bands              - Group; grid stored as attributes:
//                         origin_x, origin_y, pixel_width, pixel_height (f64),
//                         crs (string)
//   /bands/<name>       - 2D dataset [height, width], float32
//                         NaN (or the optional "nodata" attribute) = undefined
//
// Composite file (pipeline output):
//   /composite          - 2D dataset [height, width], float32, NaN = undefined
//   /valid              - 2D dataset [height, width], uint8
//   /mask               - 2D dataset [height, width], uint8 (optional)
//   /                   - grid attributes as above, plus string metadata
//
// Memory layout: C-order (row-major), data[y][x], matching Raster.
// ============================================================================

class VD_API RasterIO {
public:
    // ========================================================================
    // Scene files
    // ========================================================================

    // Write aligned bands to a scene file. All bands must share one grid.
    static bool WriteBands(const std::string& filepath,
                           const std::map<std::string, Raster, std::less<>>& bands);

    // Read one band; std::nullopt (with an error logged) on failure
    static std::optional<Raster> ReadBand(const std::string& filepath, const std::string& band);

    // Names of the datasets under /bands
    static std::optional<std::vector<std::string>> ListBands(const std::string& filepath);

    // ========================================================================
    // Composite files
    // ========================================================================

    // Write a composite raster and, optionally, its classification mask
    static bool WriteComposite(const std::string& filepath, const Raster& composite,
                               const Mask* mask = nullptr);

    // Read a composite raster back (validity restored from /valid)
    static std::optional<Raster> ReadComposite(const std::string& filepath);

    // ========================================================================
    // Utilities
    // ========================================================================

    static bool FileExists(const std::string& filepath);
};

} // namespace verdant
