#pragma once

#include "catalog/CatalogSource.hpp"

#include <mutex>

namespace verdant {

/// Catalog held entirely in memory (tests, embedding, pre-loaded data)
class VD_API MemoryCatalogSource : public CatalogSource {
public:
    explicit MemoryCatalogSource(String name = "memory") : m_name(std::move(name)) {}

    /// Register a scene; info.bands is filled from the band map
    void AddScene(Scene scene);

    String Name() const override { return m_name; }
    Vector<SceneInfo> ListScenes(const CatalogQuery& query) override;
    Raster FetchBand(const SceneInfo& scene, StringView band) override;

private:
    String m_name;
    mutable std::mutex m_mutex;
    Vector<Scene> m_scenes;
};

} // namespace verdant
