#include <gtest/gtest.h>

#include "catalog/LocalCatalogSource.hpp"
#include "core/Errors.hpp"
#include "io/ImageIO.hpp"
#include "io/RasterIO.hpp"
#include "TestUtils.hpp"

#include <H5Cpp.h>

#include <atomic>
#include <fstream>
#include <thread>

namespace verdant::test {

class RasterIOTest : public ::testing::Test {
protected:
    void WriteSceneFile(const std::string& name, const GridSpec& grid,
                        const std::vector<f32>& nir, const std::vector<f32>& red) {
        Scene scene = MakeScene(name, D(2024, 6, 1), grid, nir, red);
        ASSERT_TRUE(RasterIO::WriteBands(dir / (name + ".h5"), scene.bands));
    }

    void WriteIndex(const std::string& content) {
        std::ofstream file(dir / LocalCatalogSource::kIndexFileName);
        file << content;
    }

    TempDir dir;
    GridSpec grid = MakeProjectedGrid(2, 2, 10.0);
};

// ============================================================================
// Scene files
// ============================================================================

TEST_F(RasterIOTest, BandsSurviveWriteAndRead) {
    Scene scene = MakeScene("S1", D(2024, 6, 1), grid, {0.8f, 0.6f, 0.5f, 0.4f}, {0.2f, 0.4f, 0.5f, 0.6f});
    scene.bands.at("nir").SetUndefinedAt(2);

    const std::string path = dir / "S1.h5";
    ASSERT_TRUE(RasterIO::WriteBands(path, scene.bands));

    auto nir = RasterIO::ReadBand(path, "nir");
    ASSERT_TRUE(nir.has_value());
    EXPECT_TRUE(nir->grid.IsAlignedWith(grid));
    EXPECT_EQ(nir->grid.crsKind, CrsKind::Projected);
    EXPECT_FLOAT_EQ(*nir->Get(0, 0), 0.8f);
    EXPECT_FLOAT_EQ(*nir->Get(1, 1), 0.4f);
    EXPECT_FALSE(nir->IsDefinedAt(2));
    EXPECT_EQ(nir->metadata["band"], "nir");

    auto bands = RasterIO::ListBands(path);
    ASSERT_TRUE(bands.has_value());
    EXPECT_EQ(*bands, (std::vector<std::string>{"nir", "red"}));
}

TEST_F(RasterIOTest, MissingFileOrBandIsNullopt) {
    EXPECT_FALSE(RasterIO::ReadBand(dir / "absent.h5", "nir").has_value());

    WriteSceneFile("S1", grid, {1, 1, 1, 1}, {0, 0, 0, 0});
    EXPECT_FALSE(RasterIO::ReadBand(dir / "S1.h5", "swir").has_value());
}

TEST_F(RasterIOTest, RejectsMisalignedBands) {
    std::map<std::string, Raster, std::less<>> bands;
    bands.emplace("a", Raster::FromValues(grid, {1, 2, 3, 4}));
    bands.emplace("b", Raster::FromValues(MakeProjectedGrid(1, 1), {1}));
    EXPECT_FALSE(RasterIO::WriteBands(dir / "bad.h5", bands));
}

TEST_F(RasterIOTest, CrsKindIsStoredWithTheGrid) {
    // A lon/lat CRS that the identifier table does not know about
    GridSpec gda94 = MakeGeographicGrid(2, 2, 0.5, 150.0, -33.0);
    gda94.crs = "EPSG:4939";

    const std::string path = dir / "gda94.h5";
    ASSERT_TRUE(RasterIO::WriteBands(path, MakeScene("G", D(2024, 6, 1), gda94, {1, 1, 1, 1}, {0, 0, 0, 0}).bands));

    auto band = RasterIO::ReadBand(path, "nir");
    ASSERT_TRUE(band.has_value());
    EXPECT_EQ(band->grid.crs, "EPSG:4939");
    EXPECT_EQ(band->grid.crsKind, CrsKind::Geographic);
}

TEST_F(RasterIOTest, FileWithoutCrsKindNeedsAKnownCrs) {
    auto writeLegacy = [this](const std::string& name, const std::string& crs) {
        const std::string path = dir / name;
        H5::H5File file(path, H5F_ACC_TRUNC);
        H5::Group group = file.createGroup("/bands");

        H5::DataSpace scalar(H5S_SCALAR);
        const f64 grid[] = {0.0, 20.0, 10.0, -10.0};
        const char* names[] = {"origin_x", "origin_y", "pixel_width", "pixel_height"};
        for (int i = 0; i < 4; ++i) {
            group.createAttribute(names[i], H5::PredType::NATIVE_DOUBLE, scalar)
                .write(H5::PredType::NATIVE_DOUBLE, &grid[i]);
        }
        H5::StrType strType(H5::PredType::C_S1, H5T_VARIABLE);
        group.createAttribute("crs", strType, scalar).write(strType, crs);

        const hsize_t dims[2] = {2, 2};
        const f32 values[4] = {0.1f, 0.2f, 0.3f, 0.4f};
        group.createDataSet("nir", H5::PredType::NATIVE_FLOAT, H5::DataSpace(2, dims))
            .write(values, H5::PredType::NATIVE_FLOAT);
        return path;
    };

    auto utm = RasterIO::ReadBand(writeLegacy("utm.h5", "EPSG:32755"), "nir");
    ASSERT_TRUE(utm.has_value());
    EXPECT_EQ(utm->grid.crsKind, CrsKind::Projected);

    auto nad83 = RasterIO::ReadBand(writeLegacy("nad83.h5", "EPSG:4617"), "nir");
    ASSERT_TRUE(nad83.has_value());
    EXPECT_EQ(nad83->grid.crsKind, CrsKind::Geographic);

    EXPECT_FALSE(RasterIO::ReadBand(writeLegacy("custom.h5", "EPSG:99999"), "nir").has_value());
}

TEST(GridSpecTest, KindForCrsKnowsCommonIdentifiersOnly) {
    EXPECT_EQ(GridSpec::KindForCrs("EPSG:4326"), CrsKind::Geographic);
    EXPECT_EQ(GridSpec::KindForCrs("EPSG:4979"), CrsKind::Geographic);
    EXPECT_EQ(GridSpec::KindForCrs("EPSG:4283"), CrsKind::Geographic);
    EXPECT_EQ(GridSpec::KindForCrs("EPSG:32633"), CrsKind::Projected);
    EXPECT_EQ(GridSpec::KindForCrs("EPSG:32760"), CrsKind::Projected);
    EXPECT_EQ(GridSpec::KindForCrs("EPSG:3857"), CrsKind::Projected);
    EXPECT_FALSE(GridSpec::KindForCrs("EPSG:32661").has_value());
    EXPECT_FALSE(GridSpec::KindForCrs("EPSG:32600").has_value());
    EXPECT_FALSE(GridSpec::KindForCrs("LOCAL_CS").has_value());
    EXPECT_FALSE(GridSpec::KindForCrs("").has_value());
}

TEST_F(RasterIOTest, ConcurrentReadsAllSucceed) {
    WriteSceneFile("S1", grid, {0.8f, 0.6f, 0.5f, 0.4f}, {0.2f, 0.4f, 0.5f, 0.6f});
    const std::string path = dir / "S1.h5";

    std::atomic<int> good{0};
    {
        std::vector<std::jthread> readers;
        for (int t = 0; t < 8; ++t) {
            readers.emplace_back([&good, &path, t] {
                for (int i = 0; i < 20; ++i) {
                    auto band = RasterIO::ReadBand(path, (t + i) % 2 ? "nir" : "red");
                    if (band && band->DefinedCount() == 4) {
                        ++good;
                    }
                }
            });
        }
    }
    EXPECT_EQ(good.load(), 8 * 20);
}

// ============================================================================
// Composite files
// ============================================================================

TEST_F(RasterIOTest, CompositeRoundTripKeepsValidityAndGrid) {
    Raster composite = Raster::FromValues(grid, {0.6f, 0.0f, 0.6f, 0.25f});
    composite.SetUndefinedAt(1);
    composite.metadata["reducer"] = "median";

    Mask mask(grid);
    mask.data = {1, 0, 1, 0};

    const std::string path = dir / "composite.h5";
    ASSERT_TRUE(RasterIO::WriteComposite(path, composite, &mask));

    auto read = RasterIO::ReadComposite(path);
    ASSERT_TRUE(read.has_value());
    EXPECT_TRUE(read->grid.IsAlignedWith(grid));
    EXPECT_EQ(read->valid, composite.valid);
    EXPECT_FLOAT_EQ(*read->Get(0, 0), 0.6f);
    EXPECT_FALSE(read->IsDefined(1, 0));
}

TEST_F(RasterIOTest, CompositeExportsToExr) {
    Raster composite = Raster::FromValues(grid, {0.6f, 0.0f, 0.6f, 0.25f});
    Mask mask(grid);

    const std::string path = dir / "composite.exr";
    ASSERT_TRUE(ImageIO::WriteEXR(path, composite, &mask));

    auto dims = ImageIO::GetDimensions(path);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(std::get<0>(*dims), 2u);
    EXPECT_EQ(std::get<1>(*dims), 2u);
    EXPECT_EQ(std::get<2>(*dims), 3u);
}

// ============================================================================
// LocalCatalogSource
// ============================================================================

TEST_F(RasterIOTest, LocalCatalogListsAndFetchesScenes) {
    WriteSceneFile("S1", grid, {0.8f, 0.6f, 0.5f, 0.4f}, {0.2f, 0.4f, 0.5f, 0.6f});
    WriteSceneFile("S2", grid, {0.5f, 0.5f, 0.5f, 0.5f}, {0.1f, 0.1f, 0.1f, 0.1f});
    WriteIndex(R"(
[[scenes]]
id = "S2"
date = "2024-06-11"
cloud_cover = 0.05
footprint = "POLYGON ((0 0, 20 0, 20 20, 0 20, 0 0))"
file = "S2.h5"

[[scenes]]
id = "S1"
date = "2024-06-01"
cloud_cover = 0
footprint = "POLYGON ((0 0, 20 0, 20 20, 0 20, 0 0))"
file = "S1.h5"
bands = ["nir", "red"]

[[scenes]]
id = "far-away"
date = "2024-06-05"
cloud_cover = 0.0
footprint = "POLYGON ((1000 1000, 1010 1000, 1010 1010, 1000 1010, 1000 1000))"
file = "missing.h5"
)");

    LocalCatalogSource source(dir.Path());

    CatalogQuery query;
    query.region = Box(0, 0, 20, 20);
    query.start = D(2024, 5, 1);
    query.end = D(2024, 9, 1);
    query.maxCloudFraction = 0.2;

    Vector<SceneInfo> scenes = ImageCatalog::Query(source, query);
    ASSERT_EQ(scenes.size(), 2u);
    EXPECT_EQ(scenes[0].id, "S1");
    EXPECT_EQ(scenes[1].id, "S2");
    EXPECT_EQ(scenes[1].bands, (Vector<String>{"nir", "red"}));  // read from the file

    Raster red = source.FetchBand(scenes[0], "red");
    EXPECT_FLOAT_EQ(*red.Get(0, 0), 0.2f);
    EXPECT_EQ(red.metadata["scene_id"], "S1");

    EXPECT_THROW(source.FetchBand(scenes[0], "swir"), DataSourceError);
}

TEST_F(RasterIOTest, LocalCatalogRejectsMissingOrMalformedIndex) {
    EXPECT_THROW(LocalCatalogSource(dir.Path()), DataSourceError);

    WriteIndex(R"(
[[scenes]]
id = "S1"
date = "June 1st"
cloud_cover = 0.0
footprint = "POLYGON ((0 0, 20 0, 20 20, 0 20, 0 0))"
file = "S1.h5"
)");
    EXPECT_THROW(LocalCatalogSource(dir.Path()), DataSourceError);

    WriteIndex(R"(
[[scenes]]
id = "S1"
date = "2024-06-01"
footprint = "POLYGON ((0 0, 20 0, 20 20, 0 20, 0 0))"
file = "S1.h5"
)");
    EXPECT_THROW(LocalCatalogSource(dir.Path()), DataSourceError);
}

} // namespace verdant::test
