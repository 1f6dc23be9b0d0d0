#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "core/Raster.hpp"
#include "catalog/Scene.hpp"

// ============================================================================
// CatalogQuery / CatalogSource - Scene selection and the data-source seam
// ============================================================================
// CatalogSource is the pluggable collaborator behind the pipeline: a local
// directory, an object store, a remote imagery API. Implementations report
// failures as DataSourceError. FetchBand may be called concurrently from
// worker threads and must be thread-safe.
// ============================================================================

namespace verdant {

struct CatalogQuery {
    Polygon region;
    Date start{};          // inclusive
    Date end{};            // exclusive
    f64 maxCloudFraction = 1.0;

    /// @throws ConfigurationError for a degenerate region, an empty date
    ///         range or a cloud threshold outside [0, 1]
    void Validate() const;

    /// Footprint intersects region, date in [start, end), cloud below threshold
    bool Matches(const SceneInfo& scene) const;
};

class VD_API CatalogSource {
public:
    virtual ~CatalogSource() = default;

    /// Human-readable identifier for logs
    virtual String Name() const = 0;

    /// Candidate scenes for the query. Implementations may pre-filter; the
    /// catalog applies the full filter either way.
    /// @throws DataSourceError
    virtual Vector<SceneInfo> ListScenes(const CatalogQuery& query) = 0;

    /// Pixel data of one band of one scene
    /// @throws DataSourceError
    virtual Raster FetchBand(const SceneInfo& scene, StringView band) = 0;
};

/// Image Catalog Query
class VD_API ImageCatalog {
public:
    /// Scenes matching the query, ordered by (date, id). An empty result is
    /// not an error.
    /// @throws DataSourceError if the source listing fails
    static Vector<SceneInfo> Query(CatalogSource& source, const CatalogQuery& query);
};

} // namespace verdant
