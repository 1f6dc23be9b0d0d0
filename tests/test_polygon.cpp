#include <gtest/gtest.h>

#include "geometry/Polygon.hpp"
#include "TestUtils.hpp"

namespace verdant::test {

// ============================================================================
// WKT
// ============================================================================

TEST(PolygonWktTest, ParsesClosedRingAndDropsClosingVertex) {
    auto poly = Polygon::FromWkt("POLYGON ((0 0, 10 0, 10 10, 0 10, 0 0))");
    ASSERT_TRUE(poly.has_value()) << poly.error();
    EXPECT_EQ(poly->VertexCount(), 4u);
    EXPECT_EQ(poly->HoleCount(), 0u);
    EXPECT_TRUE(poly->IsValid());
    EXPECT_DOUBLE_EQ(poly->PlanarArea(), 100.0);
}

TEST(PolygonWktTest, AcceptsLowercaseAndNoSpace) {
    auto poly = Polygon::FromWkt("polygon((0 0,4 0,4 3,0 0))");
    ASSERT_TRUE(poly.has_value()) << poly.error();
    EXPECT_DOUBLE_EQ(poly->PlanarArea(), 6.0);
}

TEST(PolygonWktTest, ParsesHoles) {
    auto poly = Polygon::FromWkt(
        "POLYGON ((0 0, 10 0, 10 10, 0 10, 0 0), (4 4, 6 4, 6 6, 4 6, 4 4))");
    ASSERT_TRUE(poly.has_value()) << poly.error();
    ASSERT_EQ(poly->HoleCount(), 1u);
    EXPECT_DOUBLE_EQ(poly->PlanarArea(), 96.0);
}

TEST(PolygonWktTest, AcceptsMultiLineText) {
    auto poly = Polygon::FromWkt("POLYGON ((0 0, 2 0,\n  2 2, 0 2,\n  0 0))");
    ASSERT_TRUE(poly.has_value()) << poly.error();
    EXPECT_DOUBLE_EQ(poly->PlanarArea(), 4.0);
}

TEST(PolygonWktTest, RejectsSelfIntersectingRing) {
    // Bow-tie: the two diagonals cross at (1, 1)
    EXPECT_FALSE(Polygon::FromWkt("POLYGON ((0 0, 2 2, 2 0, 0 2, 0 0))").has_value());
    EXPECT_FALSE(Polygon::FromGeoJson(
        R"({"type": "Polygon", "coordinates": [[[0, 0], [2, 2], [2, 0], [0, 2], [0, 0]]]})").has_value());

    const Polygon bowTie(Ring{{0, 0}, {2, 2}, {2, 0}, {0, 2}});
    EXPECT_FALSE(bowTie.IsValid());
    EXPECT_FALSE(bowTie.Contains({1.5, 1.0}));
}

TEST(PolygonWktTest, RejectsMalformedInput) {
    EXPECT_FALSE(Polygon::FromWkt("POINT (1 2)").has_value());
    EXPECT_FALSE(Polygon::FromWkt("POLYGON EMPTY").has_value());
    EXPECT_FALSE(Polygon::FromWkt("POLYGON ((0 0, 1 1, 0 0))").has_value());
    EXPECT_FALSE(Polygon::FromWkt("POLYGON ((0 0, 1 0, 1 1, 0 0)").has_value());
    EXPECT_FALSE(Polygon::FromWkt("POLYGON ((0 0, 1 0, 1 1, 0 0)) trailing").has_value());
    EXPECT_FALSE(Polygon::FromWkt("").has_value());
}

TEST(PolygonWktTest, ToWktParsesBack) {
    auto poly = Polygon::FromWkt(
        "POLYGON ((0 0, 10 0, 10 10, 0 10, 0 0), (4 4, 6 4, 6 6, 4 6, 4 4))");
    ASSERT_TRUE(poly.has_value());

    auto again = Polygon::FromWkt(poly->ToWkt());
    ASSERT_TRUE(again.has_value()) << again.error();
    EXPECT_DOUBLE_EQ(again->PlanarArea(), poly->PlanarArea());
    EXPECT_EQ(again->HoleCount(), 1u);
}

// ============================================================================
// GeoJSON
// ============================================================================

TEST(PolygonGeoJsonTest, ParsesGeometry) {
    auto poly = Polygon::FromGeoJson(
        R"({"type": "Polygon", "coordinates": [[[0, 0], [3, 0], [3, 3], [0, 3], [0, 0]]]})");
    ASSERT_TRUE(poly.has_value()) << poly.error();
    EXPECT_DOUBLE_EQ(poly->PlanarArea(), 9.0);
}

TEST(PolygonGeoJsonTest, ParsesFeatureAndFeatureCollection) {
    auto feature = Polygon::FromGeoJson(R"({
        "type": "Feature", "properties": {},
        "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [2, 0], [2, 2], [0, 2]]]}
    })");
    ASSERT_TRUE(feature.has_value()) << feature.error();
    EXPECT_DOUBLE_EQ(feature->PlanarArea(), 4.0);

    auto collection = Polygon::FromGeoJson(R"({
        "type": "FeatureCollection",
        "features": [{"type": "Feature",
                      "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [1, 0], [1, 1], [0, 1]]]}}]
    })");
    ASSERT_TRUE(collection.has_value()) << collection.error();
    EXPECT_DOUBLE_EQ(collection->PlanarArea(), 1.0);
}

TEST(PolygonGeoJsonTest, RejectsInvalidDocuments) {
    EXPECT_FALSE(Polygon::FromGeoJson("{not json").has_value());
    EXPECT_FALSE(Polygon::FromGeoJson(R"({"type": "Point", "coordinates": [1, 2]})").has_value());
    EXPECT_FALSE(Polygon::FromGeoJson(R"({"type": "FeatureCollection", "features": []})").has_value());
    EXPECT_FALSE(Polygon::FromGeoJson(R"({"type": "Polygon", "coordinates": [[[0, 0], ["a", 1]]]})").has_value());
    EXPECT_FALSE(Polygon::FromGeoJson("[1, 2, 3]").has_value());
}

// ============================================================================
// Containment and intersection
// ============================================================================

TEST(PolygonContainsTest, RespectsHoles) {
    auto poly = Polygon::FromWkt(
        "POLYGON ((0 0, 10 0, 10 10, 0 10, 0 0), (4 4, 6 4, 6 6, 4 6, 4 4))");
    ASSERT_TRUE(poly.has_value());

    EXPECT_TRUE(poly->Contains({1.0, 1.0}));
    EXPECT_TRUE(poly->Contains({9.0, 5.0}));
    EXPECT_FALSE(poly->Contains({5.0, 5.0}));
    EXPECT_FALSE(poly->Contains({11.0, 5.0}));
    EXPECT_FALSE(poly->Contains({-0.5, 5.0}));
}

TEST(PolygonContainsTest, SharedEdgePointBelongsToExactlyOnePolygon) {
    const Polygon left = Box(0, 0, 10, 10);
    const Polygon right = Box(10, 0, 20, 10);
    const Point onVertical{10.0, 5.0};
    EXPECT_NE(left.Contains(onVertical), right.Contains(onVertical));

    const Polygon lower = Box(0, 0, 10, 10);
    const Polygon upper = Box(0, 10, 10, 20);
    const Point onHorizontal{5.0, 10.0};
    EXPECT_NE(lower.Contains(onHorizontal), upper.Contains(onHorizontal));
}

TEST(PolygonIntersectsTest, DetectsOverlapContainmentAndTouching) {
    const Polygon a = Box(0, 0, 10, 10);

    EXPECT_TRUE(a.Intersects(Box(5, 5, 15, 15)));     // overlap
    EXPECT_TRUE(a.Intersects(Box(2, 2, 3, 3)));       // inside
    EXPECT_TRUE(Box(2, 2, 3, 3).Intersects(a));       // contains
    EXPECT_TRUE(a.Intersects(Box(10, 0, 20, 10)));    // shared edge
    EXPECT_FALSE(a.Intersects(Box(11, 11, 20, 20)));  // disjoint
}

TEST(PolygonContainsTest, VerticesFollowHalfOpenRule) {
    const Polygon box = Box(0, 0, 10, 10);
    EXPECT_TRUE(box.Contains({0.0, 0.0}));
    EXPECT_FALSE(box.Contains({10.0, 0.0}));
    EXPECT_FALSE(box.Contains({0.0, 10.0}));
    EXPECT_FALSE(box.Contains({10.0, 10.0}));
}

TEST(PolygonIntersectsTest, PolygonInsideHoleDoesNotIntersect) {
    auto ring = Polygon::FromWkt(
        "POLYGON ((0 0, 10 0, 10 10, 0 10, 0 0), (2 2, 8 2, 8 8, 2 8, 2 2))");
    ASSERT_TRUE(ring.has_value());
    EXPECT_FALSE(ring->Intersects(Box(4, 4, 6, 6)));
    EXPECT_TRUE(ring->Intersects(Box(1, 4, 6, 6)));
}

TEST(PolygonIntersectsTest, CrossingWithoutContainedVertices) {
    // A plus-shape: neither rectangle contains a vertex of the other
    const Polygon wide = Box(0, 4, 10, 6);
    const Polygon tall = Box(4, 0, 6, 10);
    EXPECT_TRUE(wide.Intersects(tall));
}

TEST(PolygonIntersectsTest, DiagonalNeighbourWithOverlappingBounds) {
    auto triangle = Polygon::FromWkt("POLYGON ((0 0, 10 0, 0 10, 0 0))");
    ASSERT_TRUE(triangle.has_value());
    EXPECT_FALSE(triangle->Intersects(Box(8, 8, 10, 10)));
}

} // namespace verdant::test
