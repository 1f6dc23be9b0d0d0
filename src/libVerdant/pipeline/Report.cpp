#include "Report.hpp"
#include "core/Log.hpp"
#include "io/ImageIO.hpp"
#include "io/RasterIO.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <tuple>

namespace verdant {

nlohmann::ordered_json Report::Summary(const PipelineResult& result, const PipelineOptions& options) {
    nlohmann::ordered_json summary;
    summary[String("area_") + AreaUnitSuffix(result.area.unit)] = result.area.value;
    if (result.area.unit != AreaUnit::SquareMetres) {
        summary["area_m2"] = result.area.squareMetres;
    }
    summary["pixels"] = result.area.pixelCount;
    summary["scenes_matched"] = result.scenesMatched;
    summary["scenes_used"] = result.scenesUsed.size();
    summary["scenes_dropped"] = result.scenesDropped;
    summary["reducer"] = ReducerName(options.reducer);
    summary["threshold"] = options.threshold;
    summary["start"] = FormatDate(options.query.start);
    summary["end"] = FormatDate(options.query.end);
    return summary;
}

bool Report::WriteSummary(const nlohmann::ordered_json& summary, const String& path) {
    const String line = summary.dump();

    if (path.empty()) {
        std::cout << line << std::endl;
        return static_cast<bool>(std::cout);
    }

    const std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            VD_LOG_ERROR("Cannot create directory {}: {}", target.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream file(target);
    if (!file) {
        VD_LOG_ERROR("Cannot open summary file for writing: {}", path);
        return false;
    }
    file << line << '\n';
    if (!file) {
        VD_LOG_ERROR("Failed to write summary file: {}", path);
        return false;
    }

    VD_LOG_INFO("Summary written to {}", path);
    return true;
}

bool Report::WriteComposite(const PipelineResult& result, const String& path) {
    const std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            VD_LOG_ERROR("Cannot create directory {}: {}", target.parent_path().string(), ec.message());
            return false;
        }
    }

    const String ext = target.extension().string();
    if (ext == ".exr") {
        if (!ImageIO::WriteEXR(path, result.composite, &result.mask)) {
            return false;
        }
        // Read the header back: value, valid and mask channels on the composite grid
        const GridSpec& grid = result.composite.grid;
        auto dims = ImageIO::GetDimensions(path);
        if (!dims || *dims != std::make_tuple(grid.width, grid.height, u32{3})) {
            VD_LOG_ERROR("Composite {} does not read back as a {}x{} three-channel EXR",
                         path, grid.width, grid.height);
            return false;
        }
        return true;
    }
    if (ext == ".h5" || ext == ".hdf5") {
        return RasterIO::WriteComposite(path, result.composite, &result.mask);
    }

    VD_LOG_ERROR("Unsupported composite format '{}' ({})", ext, path);
    return false;
}

} // namespace verdant
