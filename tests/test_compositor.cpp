#include <gtest/gtest.h>

#include "analysis/Compositor.hpp"
#include "core/Errors.hpp"
#include "TestUtils.hpp"

namespace verdant::test {

class CompositorTest : public ::testing::Test {
protected:
    Raster Single(f32 value) { return Raster::FromValues(grid, {value}); }

    Raster Undefined() { return Raster(grid); }

    GridSpec grid = MakeProjectedGrid(1, 1);
};

TEST_F(CompositorTest, MedianOfOddCount) {
    Vector<Raster> stack;
    stack.push_back(Single(0.1f));
    stack.push_back(Single(0.9f));
    stack.push_back(Single(0.4f));

    Raster composite = Compositor::Reduce(std::move(stack));
    EXPECT_NEAR(*composite.Get(0, 0), 0.4, 1e-6);
}

TEST_F(CompositorTest, MedianOfEvenCountIsMeanOfMiddlePair) {
    Vector<Raster> stack;
    for (f32 v : {0.9f, 0.1f, 0.5f, 0.3f}) {
        stack.push_back(Single(v));
    }

    Raster composite = Compositor::Reduce(std::move(stack), Reducer::Median);
    EXPECT_NEAR(*composite.Get(0, 0), 0.4, 1e-6);
}

TEST_F(CompositorTest, MeanMinMax) {
    auto reduce = [this](Reducer reducer) {
        Vector<Raster> stack;
        for (f32 v : {0.2f, 0.8f, 0.5f}) {
            stack.push_back(Single(v));
        }
        return *Compositor::Reduce(std::move(stack), reducer).Get(0, 0);
    };

    EXPECT_NEAR(reduce(Reducer::Mean), 0.5, 1e-6);
    EXPECT_NEAR(reduce(Reducer::Min), 0.2, 1e-6);
    EXPECT_NEAR(reduce(Reducer::Max), 0.8, 1e-6);
}

TEST_F(CompositorTest, MeanKeepsSmallTermsBesideLargeOnes) {
    // A plain running total drops both 1s next to 1e20 and yields 0.25
    Vector<Raster> stack;
    for (f32 v : {1.0e20f, 1.0f, -1.0e20f, 1.0f}) {
        stack.push_back(Single(v));
    }

    Raster composite = Compositor::Reduce(std::move(stack), Reducer::Mean);
    EXPECT_FLOAT_EQ(*composite.Get(0, 0), 0.5f);
}

TEST_F(CompositorTest, SkipsUndefinedInputsPerPixel) {
    Vector<Raster> stack;
    stack.push_back(Undefined());
    stack.push_back(Single(0.8f));
    stack.push_back(Single(0.4f));

    // Median of the two defined values
    Raster composite = Compositor::Reduce(std::move(stack));
    EXPECT_NEAR(*composite.Get(0, 0), 0.6, 1e-6);
}

TEST_F(CompositorTest, UndefinedEverywhereStaysUndefined) {
    Vector<Raster> stack;
    stack.push_back(Undefined());
    stack.push_back(Undefined());

    Raster composite = Compositor::Reduce(std::move(stack), Reducer::Mean);
    EXPECT_FALSE(composite.IsDefined(0, 0));
}

TEST_F(CompositorTest, OutputMatchesInputDimensions) {
    const GridSpec g = MakeProjectedGrid(7, 3, 30.0);
    Vector<Raster> stack;
    for (int k = 0; k < 4; ++k) {
        Raster r(g);
        for (usize i = 0; i < r.PixelCount(); ++i) {
            r.SetAt(i, static_cast<f32>(k) * 0.1f);
        }
        stack.push_back(std::move(r));
    }

    Raster composite = Compositor::Reduce(std::move(stack));
    EXPECT_EQ(composite.Width(), 7u);
    EXPECT_EQ(composite.Height(), 3u);
    EXPECT_TRUE(composite.grid.IsAlignedWith(g));
    EXPECT_EQ(composite.DefinedCount(), g.PixelCount());
    EXPECT_EQ(composite.metadata["reducer"], "median");
    EXPECT_EQ(composite.metadata["inputs"], "4");
}

TEST_F(CompositorTest, SingleInputIsIdentity) {
    Vector<Raster> stack;
    Raster only = Raster::FromValues(MakeProjectedGrid(2, 1), {0.25f, -0.5f});
    only.SetUndefinedAt(1);
    stack.push_back(only);

    Raster composite = Compositor::Reduce(std::move(stack));
    EXPECT_FLOAT_EQ(*composite.Get(0, 0), 0.25f);
    EXPECT_FALSE(composite.IsDefined(1, 0));
}

TEST_F(CompositorTest, EmptyStackThrows) {
    EXPECT_THROW(Compositor::Reduce({}), EmptyInputError);
}

TEST_F(CompositorTest, MisalignedStackThrows) {
    Vector<Raster> stack;
    stack.push_back(Single(0.1f));
    stack.push_back(Raster::FromValues(MakeProjectedGrid(2, 1), {0.1f, 0.2f}));
    EXPECT_THROW(Compositor::Reduce(std::move(stack)), GridMismatchError);

    GridSpec otherCrs = grid;
    otherCrs.crs = "EPSG:32632";
    Vector<Raster> crsStack;
    crsStack.push_back(Single(0.1f));
    crsStack.push_back(Raster::FromValues(otherCrs, {0.2f}));
    EXPECT_THROW(Compositor::Reduce(std::move(crsStack)), GridMismatchError);
}

TEST(ReducerTest, ParsesNames) {
    EXPECT_EQ(ParseReducer("median"), Reducer::Median);
    EXPECT_EQ(ParseReducer("mean"), Reducer::Mean);
    EXPECT_EQ(ParseReducer("min"), Reducer::Min);
    EXPECT_EQ(ParseReducer("max"), Reducer::Max);
    EXPECT_FALSE(ParseReducer("Median").has_value());
    EXPECT_STREQ(ReducerName(Reducer::Mean), "mean");
}

} // namespace verdant::test
