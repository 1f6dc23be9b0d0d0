#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "core/Raster.hpp"
#include "analysis/ZonalArea.hpp"
#include "catalog/CatalogSource.hpp"
#include "pipeline/DeadlineExecutor.hpp"
#include "pipeline/PipelineOptions.hpp"

#include <stop_token>

// ============================================================================
// Pipeline - Catalog query -> per-scene index -> composite -> mask -> area
// ============================================================================
// Per-scene work (two band fetches and the normalized difference) runs on a
// WorkerPool. The catalog listing and each band fetch are bounded by
// options.fetchTimeout through a DeadlineExecutor; a scene whose fetch fails
// or times out is dropped with a warning. Compositing starts once every scene
// future has resolved. Timed-out calls are joined before Run() returns.
//
// The stop token is checked before each scene unit and before compositing.
// ============================================================================

namespace verdant {

struct PipelineResult {
    Raster composite;
    Mask mask;
    AreaResult area;

    usize scenesMatched = 0;
    Vector<String> scenesUsed;       // ids, in catalog order
    Vector<String> scenesDropped;    // ids, in catalog order
};

class VD_API Pipeline {
public:
    /// @throws ConfigurationError if source is null
    Pipeline(PipelineOptions options, SharedPtr<CatalogSource> source);

    /// Run every stage
    /// @throws ConfigurationError   invalid options, region CRS differs from the data
    /// @throws DataSourceError      catalog listing failed or timed out
    /// @throws EmptyInputError      no scene matched, or every scene was dropped
    /// @throws GridMismatchError    scenes on different grids with strict alignment
    /// @throws CancelledError       stop was requested
    PipelineResult Run(std::stop_token stop = {});

    const PipelineOptions& Options() const { return m_options; }

    /// Build the configured source, wrapped with retries
    /// @throws ConfigurationError for an unknown source type
    /// @throws DataSourceError if the source cannot be opened
    static SharedPtr<CatalogSource> CreateSource(const PipelineOptions& options);

private:
    struct SceneOutcome {
        Optional<Raster> index;
        bool skipped = false;   // not attempted (stop requested)
    };

    SceneOutcome ProcessScene(const SceneInfo& scene, DeadlineExecutor& deadlines,
                              std::stop_token stop) const;

    /// Bring every index raster onto one grid according to options.align
    Vector<Raster> AlignStack(Vector<Raster>&& stack) const;

    PipelineOptions m_options;
    SharedPtr<CatalogSource> m_source;
};

} // namespace verdant
