#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"

VD_DISABLE_WARNINGS_PUSH
#include <glm/glm.hpp>
#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Polygon_2.h>
#include <CGAL/Polygon_with_holes_2.h>
VD_DISABLE_WARNINGS_POP

// ============================================================================
// Polygon - Planar polygon with holes, backed by CGAL
// ============================================================================
// Coordinates are (x, y) in the CRS of the data they are compared against:
// (lon, lat) degrees for geographic grids, (easting, northing) for projected
// grids. No reprojection happens here.
//
// Rings are stored open (the closing vertex of WKT/GeoJSON input is dropped).
// Interior and exterior points come straight from CGAL::Polygon_2::bounded_side.
// Points exactly on a boundary are resolved half-open: they belong to the
// polygon when the point nudged towards +x/+y lies inside, so a point on an
// edge shared by two adjacent polygons is counted in exactly one of them.
// ============================================================================

namespace verdant {

using GeoKernel = CGAL::Exact_predicates_inexact_constructions_kernel;
using GeoPoint = GeoKernel::Point_2;
using GeoRing = CGAL::Polygon_2<GeoKernel>;
using GeoPolygon = CGAL::Polygon_with_holes_2<GeoKernel>;

using Point = glm::dvec2;
using Ring = Vector<Point>;

struct BoundingBox {
    Point min{0.0, 0.0};
    Point max{0.0, 0.0};

    bool IsEmpty() const { return !(max.x > min.x && max.y > min.y); }

    bool Intersects(const BoundingBox& other) const {
        return min.x <= other.max.x && other.min.x <= max.x &&
               min.y <= other.max.y && other.min.y <= max.y;
    }

    bool Contains(const Point& p) const {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }
};

class VD_API Polygon {
public:
    Polygon() = default;
    explicit Polygon(Ring outer, Vector<Ring> holes = {});

    /// Parse "POLYGON ((x y, ...), (hole ...))" through CGAL's WKT reader
    static Result<Polygon, String> FromWkt(StringView wkt);

    /// Parse a GeoJSON Polygon geometry, a Feature wrapping one, or a
    /// FeatureCollection whose first feature is a Polygon
    static Result<Polygon, String> FromGeoJson(StringView json);

    /// Axis-aligned rectangle
    static Polygon FromBox(const BoundingBox& box);

    const GeoPolygon& Shape() const { return m_shape; }
    usize VertexCount() const { return m_shape.outer_boundary().size(); }
    usize HoleCount() const { return m_shape.number_of_holes(); }

    const BoundingBox& Bounds() const { return m_bounds; }

    /// Simple rings with at least three vertices and non-zero area
    bool IsValid() const { return m_valid; }

    /// Point-in-polygon with half-open boundaries
    bool Contains(const Point& p) const;

    /// True when the two polygons share any area or boundary point
    bool Intersects(const Polygon& other) const;

    /// Planar area in squared coordinate units, holes subtracted
    f64 PlanarArea() const;

    String ToWkt() const;

private:
    /// Closed-set membership: boundary points count as covered
    bool Covers(const GeoPoint& p) const;

    GeoPolygon m_shape;
    BoundingBox m_bounds;
    f64 m_nudge = 0.0;
    bool m_valid = false;
};

} // namespace verdant
