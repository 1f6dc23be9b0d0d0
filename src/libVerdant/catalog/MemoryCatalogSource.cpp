#include "MemoryCatalogSource.hpp"
#include "core/Errors.hpp"

namespace verdant {

void MemoryCatalogSource::AddScene(Scene scene) {
    scene.info.bands.clear();
    for (const auto& [name, raster] : scene.bands) {
        scene.info.bands.push_back(name);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_scenes.push_back(std::move(scene));
}

Vector<SceneInfo> MemoryCatalogSource::ListScenes(const CatalogQuery&) {
    std::lock_guard<std::mutex> lock(m_mutex);

    Vector<SceneInfo> infos;
    infos.reserve(m_scenes.size());
    for (const Scene& scene : m_scenes) {
        infos.push_back(scene.info);
    }
    return infos;
}

Raster MemoryCatalogSource::FetchBand(const SceneInfo& info, StringView band) {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (const Scene& scene : m_scenes) {
        if (scene.info.id != info.id) {
            continue;
        }
        if (const Raster* raster = scene.FindBand(band)) {
            return *raster;
        }
        throw DataSourceError("Scene " + info.id + " has no band '" + String(band) + "'");
    }
    throw DataSourceError("Unknown scene " + info.id + " in catalog '" + m_name + "'");
}

} // namespace verdant
