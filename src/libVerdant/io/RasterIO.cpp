#include "RasterIO.hpp"

#include <H5Cpp.h>

#include <cmath>
#include <filesystem>
#include <limits>
#include <mutex>

namespace verdant {

// ============================================================================
// HDF5 access is serialised process-wide: the C++ API is not thread-safe even
// on a thread-safe HDF5 build, and pipeline workers read bands concurrently.
// ============================================================================

static std::mutex& Hdf5Mutex() {
    static std::mutex mutex;
    return mutex;
}

// ============================================================================
// Helper: grid attributes
// ============================================================================

static void WriteDoubleAttribute(H5::H5Object& obj, const char* name, f64 value) {
    H5::DataSpace scalar(H5S_SCALAR);
    H5::Attribute attr = obj.createAttribute(name, H5::PredType::NATIVE_DOUBLE, scalar);
    attr.write(H5::PredType::NATIVE_DOUBLE, &value);
}

static void WriteStringAttribute(H5::H5Object& obj, const std::string& name, const std::string& value) {
    H5::StrType strType(H5::PredType::C_S1, H5T_VARIABLE);
    H5::DataSpace scalar(H5S_SCALAR);
    H5::Attribute attr = obj.createAttribute(name, strType, scalar);
    attr.write(strType, value);
}

static void WriteGridAttributes(H5::H5Object& obj, const GridSpec& grid) {
    WriteDoubleAttribute(obj, "origin_x", grid.originX);
    WriteDoubleAttribute(obj, "origin_y", grid.originY);
    WriteDoubleAttribute(obj, "pixel_width", grid.pixelWidth);
    WriteDoubleAttribute(obj, "pixel_height", grid.pixelHeight);
    WriteStringAttribute(obj, "crs", grid.crs);
    WriteStringAttribute(obj, "crs_kind", CrsKindName(grid.crsKind));
}

// Fails on a CRS whose kind is neither stored nor recognised: guessing would
// turn degrees into metres in the area computation.
static bool ReadGridAttributes(H5::H5Object& obj, GridSpec& grid, const std::string& filepath) {
    auto readDouble = [&obj](const char* name) {
        f64 value = 0.0;
        H5::Attribute attr = obj.openAttribute(name);
        attr.read(H5::PredType::NATIVE_DOUBLE, &value);
        return value;
    };

    grid.originX = readDouble("origin_x");
    grid.originY = readDouble("origin_y");
    grid.pixelWidth = readDouble("pixel_width");
    grid.pixelHeight = readDouble("pixel_height");

    H5::StrType strType(H5::PredType::C_S1, H5T_VARIABLE);
    H5::Attribute crsAttr = obj.openAttribute("crs");
    crsAttr.read(strType, grid.crs);

    Optional<CrsKind> kind;
    if (obj.attrExists("crs_kind")) {
        std::string kindName;
        obj.openAttribute("crs_kind").read(strType, kindName);
        kind = ParseCrsKind(kindName);
        if (!kind) {
            VD_LOG_ERROR("RasterIO: {} has an invalid crs_kind '{}'", filepath, kindName);
            return false;
        }
    } else {
        kind = GridSpec::KindForCrs(grid.crs);
        if (!kind) {
            VD_LOG_ERROR("RasterIO: {} uses CRS '{}' without a crs_kind attribute; "
                         "cannot tell degrees from metres", filepath, grid.crs);
            return false;
        }
    }
    grid.crsKind = *kind;
    return true;
}

// ============================================================================
// Helper: 2D datasets
// ============================================================================

static void WriteFloatDataset(H5::Group& group, const std::string& name,
                              const GridSpec& grid, const std::vector<f32>& values) {
    hsize_t dims[2] = {grid.height, grid.width};
    H5::DataSpace dataspace(2, dims);
    H5::DataSet dataset = group.createDataSet(name, H5::PredType::NATIVE_FLOAT, dataspace);
    dataset.write(values.data(), H5::PredType::NATIVE_FLOAT);
}

static void WriteByteDataset(H5::Group& group, const std::string& name,
                             const GridSpec& grid, const std::vector<u8>& values) {
    hsize_t dims[2] = {grid.height, grid.width};
    H5::DataSpace dataspace(2, dims);
    H5::DataSet dataset = group.createDataSet(name, H5::PredType::NATIVE_UINT8, dataspace);
    dataset.write(values.data(), H5::PredType::NATIVE_UINT8);
}

// Undefined pixels are stored as NaN
static std::vector<f32> EncodeValues(const Raster& raster) {
    std::vector<f32> values(raster.PixelCount());
    for (usize i = 0; i < values.size(); ++i) {
        values[i] = raster.IsDefinedAt(i) ? raster.ValueAt(i)
                                          : std::numeric_limits<f32>::quiet_NaN();
    }
    return values;
}

static bool ReadDims(const H5::DataSet& dataset, u32& width, u32& height) {
    H5::DataSpace dataspace = dataset.getSpace();
    if (dataspace.getSimpleExtentNdims() != 2) {
        return false;
    }
    hsize_t dims[2];
    dataspace.getSimpleExtentDims(dims);
    height = static_cast<u32>(dims[0]);
    width = static_cast<u32>(dims[1]);
    return true;
}

// ============================================================================
// Public API: WriteBands
// ============================================================================

bool RasterIO::WriteBands(const std::string& filepath,
                          const std::map<std::string, Raster, std::less<>>& bands) {
    if (bands.empty()) {
        VD_LOG_ERROR("RasterIO::WriteBands: No bands to write");
        return false;
    }

    const GridSpec& grid = bands.begin()->second.grid;
    for (const auto& [name, raster] : bands) {
        if (!raster.IsValid() || !raster.grid.IsAlignedWith(grid)) {
            VD_LOG_ERROR("RasterIO::WriteBands: Band '{}' is invalid or not aligned", name);
            return false;
        }
    }

    try {
        std::lock_guard<std::mutex> lock(Hdf5Mutex());
        H5::H5File file(filepath, H5F_ACC_TRUNC);
        H5::Group group = file.createGroup("/bands");
        WriteGridAttributes(group, grid);

        for (const auto& [name, raster] : bands) {
            WriteFloatDataset(group, name, grid, EncodeValues(raster));
        }

        VD_LOG_INFO("RasterIO::WriteBands: Wrote {} bands ({}x{}) to {}",
                    bands.size(), grid.width, grid.height, filepath);
        return true;

    } catch (const H5::Exception& e) {
        VD_LOG_ERROR("RasterIO::WriteBands: Failed to write {}: {}", filepath, e.getDetailMsg());
        return false;
    }
}

// ============================================================================
// Public API: ReadBand
// ============================================================================

std::optional<Raster> RasterIO::ReadBand(const std::string& filepath, const std::string& band) {
    if (!FileExists(filepath)) {
        VD_LOG_ERROR("RasterIO::ReadBand: File not found: {}", filepath);
        return std::nullopt;
    }

    try {
        std::lock_guard<std::mutex> lock(Hdf5Mutex());
        H5::Exception::dontPrint();
        H5::H5File file(filepath, H5F_ACC_RDONLY);
        H5::Group group = file.openGroup("/bands");

        if (!group.nameExists(band)) {
            VD_LOG_ERROR("RasterIO::ReadBand: {} has no band '{}'", filepath, band);
            return std::nullopt;
        }

        H5::DataSet dataset = group.openDataSet(band);

        GridSpec grid;
        if (!ReadDims(dataset, grid.width, grid.height)) {
            VD_LOG_ERROR("RasterIO::ReadBand: Band '{}' in {} is not 2D", band, filepath);
            return std::nullopt;
        }
        if (!ReadGridAttributes(group, grid, filepath)) {
            return std::nullopt;
        }

        std::vector<f32> values(grid.PixelCount());
        dataset.read(values.data(), H5::PredType::NATIVE_FLOAT);

        Optional<f32> nodata;
        if (dataset.attrExists("nodata")) {
            f32 value = 0.0f;
            dataset.openAttribute("nodata").read(H5::PredType::NATIVE_FLOAT, &value);
            nodata = value;
        }

        Raster raster(grid);
        for (usize i = 0; i < values.size(); ++i) {
            const f32 v = values[i];
            if (std::isnan(v) || (nodata && v == *nodata)) {
                continue;
            }
            raster.SetAt(i, v);
        }
        raster.metadata["band"] = band;
        raster.metadata["source"] = filepath;

        VD_LOG_DEBUG("RasterIO::ReadBand: Read '{}' {}x{} from {}",
                     band, grid.width, grid.height, filepath);
        return raster;

    } catch (const H5::Exception& e) {
        VD_LOG_ERROR("RasterIO::ReadBand: Failed to read '{}' from {}: {}",
                     band, filepath, e.getDetailMsg());
        return std::nullopt;
    }
}

// ============================================================================
// Public API: ListBands
// ============================================================================

std::optional<std::vector<std::string>> RasterIO::ListBands(const std::string& filepath) {
    if (!FileExists(filepath)) {
        return std::nullopt;
    }

    try {
        std::lock_guard<std::mutex> lock(Hdf5Mutex());
        H5::Exception::dontPrint();
        H5::H5File file(filepath, H5F_ACC_RDONLY);
        H5::Group group = file.openGroup("/bands");

        std::vector<std::string> names;
        for (hsize_t i = 0; i < group.getNumObjs(); ++i) {
            names.push_back(group.getObjnameByIdx(i));
        }
        return names;

    } catch (const H5::Exception& e) {
        VD_LOG_ERROR("RasterIO::ListBands: Failed: {}", e.getDetailMsg());
        return std::nullopt;
    }
}

// ============================================================================
// Public API: WriteComposite
// ============================================================================

bool RasterIO::WriteComposite(const std::string& filepath, const Raster& composite, const Mask* mask) {
    if (!composite.IsValid()) {
        VD_LOG_ERROR("RasterIO::WriteComposite: Invalid raster");
        return false;
    }
    if (mask && (!mask->grid.SameShape(composite.grid) ||
                 mask->data.size() != composite.PixelCount())) {
        VD_LOG_ERROR("RasterIO::WriteComposite: Mask does not match composite grid");
        return false;
    }

    try {
        std::lock_guard<std::mutex> lock(Hdf5Mutex());
        H5::H5File file(filepath, H5F_ACC_TRUNC);
        H5::Group root = file.openGroup("/");

        WriteFloatDataset(root, "composite", composite.grid, EncodeValues(composite));
        WriteByteDataset(root, "valid", composite.grid, composite.valid);
        if (mask) {
            WriteByteDataset(root, "mask", composite.grid, mask->data);
        }

        WriteGridAttributes(root, composite.grid);
        for (const auto& [key, value] : composite.metadata) {
            WriteStringAttribute(root, key, value);
        }

        VD_LOG_INFO("RasterIO::WriteComposite: Wrote {}x{} composite to {}",
                    composite.Width(), composite.Height(), filepath);
        return true;

    } catch (const H5::Exception& e) {
        VD_LOG_ERROR("RasterIO::WriteComposite: Failed to write {}: {}", filepath, e.getDetailMsg());
        return false;
    }
}

// ============================================================================
// Public API: ReadComposite
// ============================================================================

std::optional<Raster> RasterIO::ReadComposite(const std::string& filepath) {
    if (!FileExists(filepath)) {
        VD_LOG_ERROR("RasterIO::ReadComposite: File not found: {}", filepath);
        return std::nullopt;
    }

    try {
        std::lock_guard<std::mutex> lock(Hdf5Mutex());
        H5::Exception::dontPrint();
        H5::H5File file(filepath, H5F_ACC_RDONLY);
        H5::Group root = file.openGroup("/");

        H5::DataSet dataset = root.openDataSet("composite");
        GridSpec grid;
        if (!ReadDims(dataset, grid.width, grid.height)) {
            VD_LOG_ERROR("RasterIO::ReadComposite: /composite is not 2D");
            return std::nullopt;
        }
        if (!ReadGridAttributes(root, grid, filepath)) {
            return std::nullopt;
        }

        Raster raster(grid);
        dataset.read(raster.data.data(), H5::PredType::NATIVE_FLOAT);
        root.openDataSet("valid").read(raster.valid.data(), H5::PredType::NATIVE_UINT8);

        for (usize i = 0; i < raster.PixelCount(); ++i) {
            if (!raster.valid[i]) {
                raster.data[i] = 0.0f;
            }
        }

        VD_LOG_INFO("RasterIO::ReadComposite: Read {}x{} composite from {}",
                    grid.width, grid.height, filepath);
        return raster;

    } catch (const H5::Exception& e) {
        VD_LOG_ERROR("RasterIO::ReadComposite: Failed to read {}: {}", filepath, e.getDetailMsg());
        return std::nullopt;
    }
}

// ============================================================================
// Public API: FileExists
// ============================================================================

bool RasterIO::FileExists(const std::string& filepath) {
    return std::filesystem::exists(filepath) &&
           std::filesystem::is_regular_file(filepath);
}

} // namespace verdant
