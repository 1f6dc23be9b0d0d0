#pragma once

#include "Types.hpp"
#include "geometry/Polygon.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace verdant {

// ============================================================================
// GridSpec - Georeferencing of a raster
// ============================================================================
// North-up affine grid:
//   x_world = originX + col * pixelWidth
//   y_world = originY + row * pixelHeight   (pixelHeight < 0 for north-up)
// (originX, originY) is the outer corner of pixel (0, 0).
// ============================================================================

enum class CrsKind : u8 {
    Geographic, // degrees (lon, lat)
    Projected   // linear units, metres
};

inline const char* CrsKindName(CrsKind kind) {
    return kind == CrsKind::Geographic ? "geographic" : "projected";
}

inline Optional<CrsKind> ParseCrsKind(StringView name) {
    if (name == "geographic") return CrsKind::Geographic;
    if (name == "projected")  return CrsKind::Projected;
    return std::nullopt;
}

struct GridSpec {
    u32 width = 0;
    u32 height = 0;

    f64 originX = 0.0;
    f64 originY = 0.0;
    f64 pixelWidth = 1.0;
    f64 pixelHeight = -1.0;

    String crs = "EPSG:4326";
    CrsKind crsKind = CrsKind::Geographic;

    inline usize PixelCount() const { return static_cast<usize>(width) * height; }

    inline usize Index(u32 x, u32 y) const { return static_cast<usize>(y) * width + x; }

    inline Point PixelCenter(u32 x, u32 y) const {
        return {originX + (static_cast<f64>(x) + 0.5) * pixelWidth,
                originY + (static_cast<f64>(y) + 0.5) * pixelHeight};
    }

    BoundingBox Extent() const {
        f64 x1 = originX + static_cast<f64>(width) * pixelWidth;
        f64 y1 = originY + static_cast<f64>(height) * pixelHeight;
        return {{std::min(originX, x1), std::min(originY, y1)},
                {std::max(originX, x1), std::max(originY, y1)}};
    }

    inline bool IsValid() const {
        return width > 0 && height > 0 &&
               std::isfinite(originX) && std::isfinite(originY) &&
               std::isfinite(pixelWidth) && std::isfinite(pixelHeight) &&
               pixelWidth != 0.0 && pixelHeight != 0.0;
    }

    inline bool SameShape(const GridSpec& other) const {
        return width == other.width && height == other.height;
    }

    /// Same dimensions, origin, resolution and CRS
    bool IsAlignedWith(const GridSpec& other) const {
        constexpr f64 kRelTol = 1e-9;
        auto close = [](f64 a, f64 b) {
            return std::abs(a - b) <= kRelTol * std::max({1.0, std::abs(a), std::abs(b)});
        };
        return SameShape(other) && crs == other.crs &&
               close(originX, other.originX) && close(originY, other.originY) &&
               close(pixelWidth, other.pixelWidth) && close(pixelHeight, other.pixelHeight);
    }

    String Describe() const {
        return std::to_string(width) + "x" + std::to_string(height) +
               " @(" + std::to_string(originX) + ", " + std::to_string(originY) + ")" +
               " res(" + std::to_string(pixelWidth) + ", " + std::to_string(pixelHeight) + ") " + crs;
    }

    /// Kind of a well-known CRS identifier; nullopt when it is not recognised.
    /// Files carry the kind explicitly, this only covers files that do not.
    static Optional<CrsKind> KindForCrs(StringView crs) {
        static constexpr StringView kGeographic[] = {
            "EPSG:4326", "EPSG:4979", "EPSG:4269", "EPSG:4258", "EPSG:4283",
            "EPSG:4617", "EPSG:4167", "EPSG:4674", "EPSG:7844", "OGC:CRS84", "CRS84",
        };
        static constexpr StringView kProjected[] = {
            "EPSG:3857", "EPSG:3035", "EPSG:3577", "EPSG:5070", "EPSG:2154",
            "EPSG:27700", "EPSG:3006", "EPSG:3395",
        };

        if (std::find(std::begin(kGeographic), std::end(kGeographic), crs) != std::end(kGeographic)) {
            return CrsKind::Geographic;
        }
        if (std::find(std::begin(kProjected), std::end(kProjected), crs) != std::end(kProjected)) {
            return CrsKind::Projected;
        }

        // WGS 84 / UTM north (326xx) and south (327xx), ETRS89 / UTM (258xx)
        auto utmZone = [crs](StringView prefix, int first, int last) {
            if (crs.size() != prefix.size() + 2 || crs.substr(0, prefix.size()) != prefix) {
                return false;
            }
            const char hi = crs[prefix.size()];
            const char lo = crs[prefix.size() + 1];
            if (hi < '0' || hi > '9' || lo < '0' || lo > '9') {
                return false;
            }
            const int zone = (hi - '0') * 10 + (lo - '0');
            return zone >= first && zone <= last;
        };
        if (utmZone("EPSG:326", 1, 60) || utmZone("EPSG:327", 1, 60) || utmZone("EPSG:258", 28, 38)) {
            return CrsKind::Projected;
        }
        return std::nullopt;
    }
};

// ============================================================================
// Raster - Single-band f32 raster with explicit validity
// ============================================================================
// Memory layout: row-major, data[y * width + x]
// valid[i] == 0 marks an undefined pixel; data[i] is then meaningless
// (kept at 0). Undefined never travels as NaN.
// ============================================================================

struct Raster {
    GridSpec grid;

    std::vector<f32> data;
    std::vector<u8> valid;

    // e.g. {"scene_id": "S2A_20240612", "band": "ndvi"}
    std::unordered_map<std::string, std::string> metadata;

    Raster() = default;

    explicit Raster(const GridSpec& g)
        : grid(g), data(g.PixelCount(), 0.0f), valid(g.PixelCount(), 0) {}

    inline u32 Width() const { return grid.width; }
    inline u32 Height() const { return grid.height; }
    inline usize PixelCount() const { return grid.PixelCount(); }

    inline bool IsDefined(u32 x, u32 y) const { return valid[grid.Index(x, y)] != 0; }
    inline bool IsDefinedAt(usize i) const { return valid[i] != 0; }

    inline f32 ValueAt(usize i) const { return data[i]; }

    inline Optional<f32> Get(u32 x, u32 y) const {
        usize i = grid.Index(x, y);
        if (!valid[i]) return std::nullopt;
        return data[i];
    }

    inline void Set(u32 x, u32 y, f32 value) { SetAt(grid.Index(x, y), value); }

    inline void SetAt(usize i, f32 value) {
        data[i] = value;
        valid[i] = 1;
    }

    inline void SetUndefinedAt(usize i) {
        data[i] = 0.0f;
        valid[i] = 0;
    }

    usize DefinedCount() const {
        return static_cast<usize>(std::count(valid.begin(), valid.end(), u8{1}));
    }

    inline bool IsValid() const {
        return grid.IsValid() && data.size() == grid.PixelCount() &&
               valid.size() == grid.PixelCount();
    }

    /// Build a fully-defined raster from row-major values
    static Raster FromValues(const GridSpec& g, const std::vector<f32>& values) {
        Raster r(g);
        for (usize i = 0; i < r.PixelCount() && i < values.size(); ++i) {
            r.SetAt(i, values[i]);
        }
        return r;
    }
};

// ============================================================================
// Mask - Boolean classification of a raster grid
// ============================================================================

struct Mask {
    GridSpec grid;
    std::vector<u8> data;

    Mask() = default;
    explicit Mask(const GridSpec& g) : grid(g), data(g.PixelCount(), 0) {}

    inline bool operator()(u32 x, u32 y) const { return data[grid.Index(x, y)] != 0; }
    inline bool At(usize i) const { return data[i] != 0; }

    usize CountTrue() const {
        return static_cast<usize>(std::count_if(data.begin(), data.end(),
                                                [](u8 v) { return v != 0; }));
    }
};

} // namespace verdant
