#include "Polygon.hpp"

VD_DISABLE_WARNINGS_PUSH
#include <CGAL/IO/WKT.h>
#include <CGAL/intersections.h>
#include <nlohmann/json.hpp>
VD_DISABLE_WARNINGS_POP

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

namespace verdant {

namespace {

// ============================================================================
// Ring helpers
// ============================================================================

Result<Ring, String> NormalizeRing(Ring ring) {
    if (ring.size() > 1 && ring.front() == ring.back()) {
        ring.pop_back();
    }
    if (ring.size() < 3) {
        return Result<Ring, String>::Err(
            "Polygon ring needs at least 3 distinct vertices, got " + std::to_string(ring.size()));
    }
    for (const Point& p : ring) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            return Result<Ring, String>::Err("Polygon ring contains a non-finite coordinate");
        }
    }
    return ring;
}

GeoRing ToGeoRing(const Ring& ring) {
    GeoRing out;
    for (const Point& p : ring) {
        out.push_back(GeoPoint(p.x, p.y));
    }
    return out;
}

Ring FromGeoRing(const GeoRing& ring) {
    Ring out;
    out.reserve(ring.size());
    for (auto it = ring.vertices_begin(); it != ring.vertices_end(); ++it) {
        out.emplace_back(it->x(), it->y());
    }
    return out;
}

bool IsUsableRing(const GeoRing& ring) {
    return ring.size() >= 3 && ring.is_simple() && ring.area() != 0.0;
}

// Membership of a point lying on `ring`'s boundary, decided by nudging it
bool InsideHalfOpen(const GeoRing& ring, const GeoPoint& p, f64 nudge) {
    switch (ring.bounded_side(p)) {
        case CGAL::ON_BOUNDED_SIDE:   return true;
        case CGAL::ON_UNBOUNDED_SIDE: return false;
        default:
            return ring.bounded_side(GeoPoint(p.x() + nudge, p.y() + nudge)) == CGAL::ON_BOUNDED_SIDE;
    }
}

bool BoundariesTouch(const GeoRing& a, const GeoRing& b) {
    for (auto ea = a.edges_begin(); ea != a.edges_end(); ++ea) {
        for (auto eb = b.edges_begin(); eb != b.edges_end(); ++eb) {
            if (CGAL::do_intersect(*ea, *eb)) {
                return true;
            }
        }
    }
    return false;
}

Result<Polygon, String> MakeChecked(Ring outer, Vector<Ring> holes) {
    Polygon polygon(std::move(outer), std::move(holes));
    if (!polygon.IsValid()) {
        return Result<Polygon, String>::Err("Polygon is self-intersecting or has zero area");
    }
    return polygon;
}

// ============================================================================
// GeoJSON helpers
// ============================================================================

Result<Ring, String> ReadJsonRing(const nlohmann::json& coords) {
    if (!coords.is_array()) {
        return Result<Ring, String>::Err("GeoJSON ring must be an array of positions");
    }
    Ring ring;
    ring.reserve(coords.size());
    for (const auto& position : coords) {
        if (!position.is_array() || position.size() < 2 ||
            !position[0].is_number() || !position[1].is_number()) {
            return Result<Ring, String>::Err("GeoJSON position must be [x, y]");
        }
        ring.emplace_back(position[0].get<f64>(), position[1].get<f64>());
    }
    return NormalizeRing(std::move(ring));
}

Result<Polygon, String> PolygonFromGeometry(const nlohmann::json& geometry) {
    if (!geometry.is_object() || !geometry.contains("type") || !geometry["type"].is_string()) {
        return Result<Polygon, String>::Err("GeoJSON geometry has no type");
    }
    const String type = geometry["type"].get<String>();
    if (type != "Polygon") {
        return Result<Polygon, String>::Err("Unsupported GeoJSON geometry type: " + type);
    }

    const auto& rings = geometry.value("coordinates", nlohmann::json::array());
    if (!rings.is_array() || rings.empty()) {
        return Result<Polygon, String>::Err("GeoJSON Polygon has no coordinates");
    }

    auto outer = ReadJsonRing(rings[0]);
    if (!outer) {
        return Result<Polygon, String>::Err(outer.error());
    }

    Vector<Ring> holes;
    for (usize i = 1; i < rings.size(); ++i) {
        auto hole = ReadJsonRing(rings[i]);
        if (!hole) {
            return Result<Polygon, String>::Err(hole.error());
        }
        holes.push_back(std::move(hole).value());
    }
    return MakeChecked(std::move(outer).value(), std::move(holes));
}

} // namespace

// ============================================================================
// Polygon
// ============================================================================

Polygon::Polygon(Ring outer, Vector<Ring> holes) {
    Vector<GeoRing> geoHoles;
    geoHoles.reserve(holes.size());
    for (const Ring& hole : holes) {
        geoHoles.push_back(ToGeoRing(hole));
    }
    m_shape = GeoPolygon(ToGeoRing(outer), geoHoles.begin(), geoHoles.end());

    const GeoRing& boundary = m_shape.outer_boundary();
    m_valid = IsUsableRing(boundary) &&
              std::all_of(geoHoles.begin(), geoHoles.end(), IsUsableRing);

    if (!boundary.is_empty()) {
        const CGAL::Bbox_2 box = boundary.bbox();
        m_bounds = BoundingBox{{box.xmin(), box.ymin()}, {box.xmax(), box.ymax()}};
    }
    const f64 extent = std::max({m_bounds.max.x - m_bounds.min.x, m_bounds.max.y - m_bounds.min.y, 1.0});
    m_nudge = extent * 1e-9;
}

Polygon Polygon::FromBox(const BoundingBox& box) {
    return Polygon(Ring{
        {box.min.x, box.min.y},
        {box.max.x, box.min.y},
        {box.max.x, box.max.y},
        {box.min.x, box.max.y},
    });
}

Result<Polygon, String> Polygon::FromWkt(StringView wkt) {
    // CGAL reads one line and matches an upper-case POLYGON tag
    String text(wkt);
    for (char& c : text) {
        c = std::isspace(static_cast<unsigned char>(c))
                ? ' '
                : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    std::istringstream in(text);
    GeoPolygon parsed;
    if (!CGAL::IO::read_polygon_WKT(in, parsed)) {
        return Result<Polygon, String>::Err("Malformed WKT POLYGON: '" + String(wkt) + "'");
    }

    auto outer = NormalizeRing(FromGeoRing(parsed.outer_boundary()));
    if (!outer) {
        return Result<Polygon, String>::Err(outer.error());
    }

    Vector<Ring> holes;
    for (auto it = parsed.holes_begin(); it != parsed.holes_end(); ++it) {
        auto hole = NormalizeRing(FromGeoRing(*it));
        if (!hole) {
            return Result<Polygon, String>::Err(hole.error());
        }
        holes.push_back(std::move(hole).value());
    }
    return MakeChecked(std::move(outer).value(), std::move(holes));
}

Result<Polygon, String> Polygon::FromGeoJson(StringView json) {
    nlohmann::json doc = nlohmann::json::parse(json, nullptr, false);
    if (doc.is_discarded()) {
        return Result<Polygon, String>::Err("Region is not valid JSON");
    }
    if (!doc.is_object() || !doc.contains("type") || !doc["type"].is_string()) {
        return Result<Polygon, String>::Err("GeoJSON object has no type");
    }

    const String type = doc["type"].get<String>();
    if (type == "Feature") {
        return PolygonFromGeometry(doc.value("geometry", nlohmann::json()));
    }
    if (type == "FeatureCollection") {
        const auto& features = doc.value("features", nlohmann::json::array());
        if (!features.is_array() || features.empty()) {
            return Result<Polygon, String>::Err("GeoJSON FeatureCollection is empty");
        }
        if (!features[0].is_object()) {
            return Result<Polygon, String>::Err("GeoJSON feature must be an object");
        }
        return PolygonFromGeometry(features[0].value("geometry", nlohmann::json()));
    }
    return PolygonFromGeometry(doc);
}

bool Polygon::Contains(const Point& p) const {
    if (!m_valid || !m_bounds.Contains(p)) {
        return false;
    }

    const GeoPoint q(p.x, p.y);
    if (!InsideHalfOpen(m_shape.outer_boundary(), q, m_nudge)) {
        return false;
    }
    for (auto hole = m_shape.holes_begin(); hole != m_shape.holes_end(); ++hole) {
        if (InsideHalfOpen(*hole, q, m_nudge)) {
            return false;
        }
    }
    return true;
}

bool Polygon::Covers(const GeoPoint& p) const {
    if (m_shape.outer_boundary().bounded_side(p) == CGAL::ON_UNBOUNDED_SIDE) {
        return false;
    }
    for (auto hole = m_shape.holes_begin(); hole != m_shape.holes_end(); ++hole) {
        if (hole->bounded_side(p) == CGAL::ON_BOUNDED_SIDE) {
            return false;
        }
    }
    return true;
}

bool Polygon::Intersects(const Polygon& other) const {
    if (!m_valid || !other.m_valid || !m_bounds.Intersects(other.m_bounds)) {
        return false;
    }

    auto ringsOf = [](const GeoPolygon& shape) {
        Vector<const GeoRing*> rings{&shape.outer_boundary()};
        for (auto hole = shape.holes_begin(); hole != shape.holes_end(); ++hole) {
            rings.push_back(&*hole);
        }
        return rings;
    };

    for (const GeoRing* a : ringsOf(m_shape)) {
        for (const GeoRing* b : ringsOf(other.m_shape)) {
            if (BoundariesTouch(*a, *b)) {
                return true;
            }
        }
    }

    // Disjoint boundaries: one polygon lies wholly inside the other or apart
    return Covers(*other.m_shape.outer_boundary().vertices_begin()) ||
           other.Covers(*m_shape.outer_boundary().vertices_begin());
}

f64 Polygon::PlanarArea() const {
    if (m_shape.outer_boundary().size() < 3) {
        return 0.0;
    }
    f64 area = std::abs(m_shape.outer_boundary().area());
    for (auto hole = m_shape.holes_begin(); hole != m_shape.holes_end(); ++hole) {
        area -= std::abs(hole->area());
    }
    return std::max(area, 0.0);
}

String Polygon::ToWkt() const {
    if (m_shape.outer_boundary().is_empty()) {
        return "POLYGON EMPTY";
    }

    std::ostringstream oss;
    oss.precision(std::numeric_limits<f64>::max_digits10);
    CGAL::IO::write_polygon_WKT(oss, m_shape);

    String wkt = oss.str();
    while (!wkt.empty() && std::isspace(static_cast<unsigned char>(wkt.back()))) {
        wkt.pop_back();
    }
    return wkt;
}

} // namespace verdant
