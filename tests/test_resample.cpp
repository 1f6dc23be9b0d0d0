#include <gtest/gtest.h>

#include "analysis/Resample.hpp"
#include "core/Errors.hpp"
#include "TestUtils.hpp"

namespace verdant::test {

TEST(ResampleTest, AlignedSourceIsReturnedUnchanged) {
    const GridSpec grid = MakeProjectedGrid(2, 2);
    Raster source = Raster::FromValues(grid, {1.0f, 2.0f, 3.0f, 4.0f});
    source.SetUndefinedAt(2);

    Raster out = Resample::NearestNeighbour(source, grid);
    EXPECT_EQ(out.data, source.data);
    EXPECT_EQ(out.valid, source.valid);
}

TEST(ResampleTest, CoarseToFinePicksContainingPixel) {
    // 2x2 source at 20 m, 4x4 target at 10 m over the same extent
    const GridSpec coarse = MakeProjectedGrid(2, 2, 20.0);
    const GridSpec fine = MakeProjectedGrid(4, 4, 10.0);
    Raster source = Raster::FromValues(coarse, {1.0f, 2.0f, 3.0f, 4.0f});

    Raster out = Resample::NearestNeighbour(source, fine);
    ASSERT_TRUE(out.grid.IsAlignedWith(fine));
    EXPECT_FLOAT_EQ(*out.Get(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(*out.Get(1, 1), 1.0f);
    EXPECT_FLOAT_EQ(*out.Get(3, 0), 2.0f);
    EXPECT_FLOAT_EQ(*out.Get(0, 3), 3.0f);
    EXPECT_FLOAT_EQ(*out.Get(2, 2), 4.0f);
    EXPECT_EQ(out.metadata["resampled"], "nearest");
}

TEST(ResampleTest, OutsideSourceExtentIsUndefined) {
    const GridSpec source = MakeProjectedGrid(2, 2, 10.0);
    const GridSpec shifted = MakeProjectedGrid(2, 2, 10.0, 10.0);  // half overlaps

    Raster out = Resample::NearestNeighbour(Raster::FromValues(source, {1.0f, 2.0f, 3.0f, 4.0f}), shifted);
    EXPECT_FLOAT_EQ(*out.Get(0, 0), 2.0f);
    EXPECT_FLOAT_EQ(*out.Get(0, 1), 4.0f);
    EXPECT_FALSE(out.IsDefined(1, 0));
    EXPECT_FALSE(out.IsDefined(1, 1));
}

TEST(ResampleTest, UndefinedSourcePixelsStayUndefined) {
    const GridSpec coarse = MakeProjectedGrid(1, 1, 20.0);
    Raster source(coarse);

    Raster out = Resample::NearestNeighbour(source, MakeProjectedGrid(2, 2, 10.0));
    EXPECT_EQ(out.DefinedCount(), 0u);
}

TEST(ResampleTest, DifferentCrsThrows) {
    const GridSpec utm = MakeProjectedGrid(2, 2);
    GridSpec other = utm;
    other.crs = "EPSG:3857";
    EXPECT_THROW(Resample::NearestNeighbour(Raster(utm), other), GridMismatchError);
}

} // namespace verdant::test
