#pragma once

#include "catalog/CatalogSource.hpp"

#include <filesystem>

// ============================================================================
// LocalCatalogSource - Scenes stored in a directory
// ============================================================================
// <dir>/catalog.toml:
//
//   [[scenes]]
//   id = "S2A_20240612"
//   date = "2024-06-12"
//   cloud_cover = 0.05
//   footprint = "POLYGON ((10 45, 11 45, 11 46, 10 46, 10 45))"
//   file = "S2A_20240612.h5"        # relative to <dir>
//   bands = ["red", "nir"]          # optional, read from the file if absent
//
// Band pixels live in the HDF5 file (see RasterIO).
// ============================================================================

namespace verdant {

class VD_API LocalCatalogSource : public CatalogSource {
public:
    static constexpr const char* kIndexFileName = "catalog.toml";

    /// Load <directory>/catalog.toml
    /// @throws DataSourceError if the index is missing or malformed
    explicit LocalCatalogSource(std::filesystem::path directory);

    String Name() const override;
    Vector<SceneInfo> ListScenes(const CatalogQuery& query) override;
    Raster FetchBand(const SceneInfo& scene, StringView band) override;

    const std::filesystem::path& Directory() const { return m_directory; }

private:
    std::filesystem::path m_directory;
    Vector<SceneInfo> m_entries;
};

} // namespace verdant
