#include "LocalCatalogSource.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"
#include "io/RasterIO.hpp"

namespace verdant {

namespace {

SceneInfo ParseEntry(const Config& entry, usize index, const std::filesystem::path& directory) {
    const String where = "catalog entry #" + std::to_string(index);

    SceneInfo info;
    info.id = entry.Get<String>("id");
    if (info.id.empty()) {
        throw DataSourceError(where + ": missing 'id'");
    }

    auto date = ParseDate(entry.Get<String>("date"));
    if (!date) {
        throw DataSourceError(where + " (" + info.id + "): 'date' must be YYYY-MM-DD");
    }
    info.date = *date;

    auto cloud = entry.GetRequired<f64>("cloud_cover");
    if (!cloud) {
        throw DataSourceError(where + " (" + info.id + "): " + cloud.error());
    }
    info.cloudFraction = *cloud;

    auto footprint = Polygon::FromWkt(entry.Get<String>("footprint"));
    if (!footprint) {
        throw DataSourceError(where + " (" + info.id + "): footprint: " + footprint.error());
    }
    info.footprint = std::move(footprint).value();

    const String file = entry.Get<String>("file");
    if (file.empty()) {
        throw DataSourceError(where + " (" + info.id + "): missing 'file'");
    }
    info.location = (directory / file).string();
    info.bands = entry.GetArray<String>("bands");

    return info;
}

} // namespace

LocalCatalogSource::LocalCatalogSource(std::filesystem::path directory)
    : m_directory(std::move(directory)) {
    const std::filesystem::path indexPath = m_directory / kIndexFileName;

    auto config = Config::Load(indexPath);
    if (!config) {
        throw DataSourceError("Cannot open catalog index: " + config.error());
    }

    const Vector<Config> entries = config.value().GetTableArray("scenes");
    m_entries.reserve(entries.size());
    for (usize i = 0; i < entries.size(); ++i) {
        m_entries.push_back(ParseEntry(entries[i], i, m_directory));
    }

    VD_LOG_INFO("LocalCatalogSource: {} scenes indexed in {}", m_entries.size(), m_directory.string());
}

String LocalCatalogSource::Name() const {
    return "local:" + m_directory.string();
}

Vector<SceneInfo> LocalCatalogSource::ListScenes(const CatalogQuery& query) {
    Vector<SceneInfo> scenes;
    for (const SceneInfo& entry : m_entries) {
        // Cheap bounding-box pre-filter; exact tests happen in ImageCatalog
        if (!entry.footprint.Bounds().Intersects(query.region.Bounds())) {
            continue;
        }

        SceneInfo info = entry;
        if (info.bands.empty()) {
            if (auto names = RasterIO::ListBands(info.location)) {
                info.bands = std::move(*names);
            }
        }
        scenes.push_back(std::move(info));
    }
    return scenes;
}

Raster LocalCatalogSource::FetchBand(const SceneInfo& scene, StringView band) {
    auto raster = RasterIO::ReadBand(scene.location, String(band));
    if (!raster) {
        throw DataSourceError("Failed to read band '" + String(band) + "' of scene " +
                              scene.id + " from " + scene.location);
    }
    raster->metadata["scene_id"] = scene.id;
    return std::move(*raster);
}

} // namespace verdant
