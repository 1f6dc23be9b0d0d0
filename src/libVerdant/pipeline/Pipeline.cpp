#include "Pipeline.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"
#include "analysis/BandAlgebra.hpp"
#include "analysis/Classifier.hpp"
#include "analysis/Compositor.hpp"
#include "analysis/Resample.hpp"
#include "catalog/LocalCatalogSource.hpp"
#include "catalog/RetryingCatalogSource.hpp"
#include "pipeline/WorkerPool.hpp"

#include <algorithm>
#include <chrono>
#include <future>

namespace verdant {

Pipeline::Pipeline(PipelineOptions options, SharedPtr<CatalogSource> source)
    : m_options(std::move(options)), m_source(std::move(source)) {
    if (!m_source) {
        throw ConfigurationError("Pipeline requires a catalog source");
    }
}

SharedPtr<CatalogSource> Pipeline::CreateSource(const PipelineOptions& options) {
    SharedPtr<CatalogSource> source;
    if (options.sourceType == "local") {
        source = std::make_shared<LocalCatalogSource>(options.sourcePath);
    } else {
        throw ConfigurationError("Unknown source type: " + options.sourceType);
    }

    if (options.retry.maxRetries == 0) {
        return source;
    }
    return std::make_shared<RetryingCatalogSource>(std::move(source), options.retry);
}

// ============================================================================
// Per-scene unit: fetch both bands, compute the normalized difference
// ============================================================================

Pipeline::SceneOutcome Pipeline::ProcessScene(const SceneInfo& scene, DeadlineExecutor& deadlines,
                                               std::stop_token stop) const {
    SceneOutcome outcome;
    if (stop.stop_requested()) {
        outcome.skipped = true;
        return outcome;
    }

    // A timed-out fetch outlives this call and the scene list, so it owns its inputs
    auto fetch = [this, &scene, &deadlines](const String& band) {
        SharedPtr<CatalogSource> source = m_source;
        return deadlines.Run(
            [source, scene, band] { return source->FetchBand(scene, band); },
            m_options.fetchTimeout,
            "Fetch of band '" + band + "' for scene " + scene.id);
    };

    try {
        Scene data;
        data.info = scene;
        data.bands.emplace(m_options.bandA, fetch(m_options.bandA));
        data.bands.emplace(m_options.bandB, fetch(m_options.bandB));

        outcome.index = BandAlgebra::NormalizedDifference(data, m_options.bandA, m_options.bandB);
        VD_LOG_DEBUG("Scene {}: {} of {} pixels defined", scene.id,
                     outcome.index->DefinedCount(), outcome.index->PixelCount());
    } catch (const DataSourceError& e) {
        VD_LOG_WARN("Dropping scene {} ({}): {}", scene.id, ErrorCodeToString(e.Code()), e.what());
    }
    return outcome;
}

Vector<Raster> Pipeline::AlignStack(Vector<Raster>&& stack) const {
    if (m_options.align == AlignPolicy::Strict || stack.empty()) {
        // Compositor rejects misaligned input
        return std::move(stack);
    }

    const GridSpec reference = stack.front().grid;
    for (usize i = 1; i < stack.size(); ++i) {
        if (!stack[i].grid.IsAlignedWith(reference)) {
            VD_LOG_DEBUG("Resampling {} onto {}", stack[i].grid.Describe(), reference.Describe());
            Raster resampled = Resample::NearestNeighbour(stack[i], reference);
            resampled.metadata = std::move(stack[i].metadata);
            stack[i] = std::move(resampled);
        }
    }
    return std::move(stack);
}

// ============================================================================
// Pipeline::Run
// ============================================================================

PipelineResult Pipeline::Run(std::stop_token stop) {
    const auto startTime = std::chrono::steady_clock::now();

    m_options.Validate();

    if (stop.stop_requested()) {
        throw CancelledError("Cancelled before the catalog query");
    }

    // ========================================================================
    // Catalog query
    // ========================================================================

    VD_LOG_INFO("Querying {} for [{}, {}), cloud < {:.2f}", m_source->Name(),
                FormatDate(m_options.query.start), FormatDate(m_options.query.end),
                m_options.query.maxCloudFraction);

    // Slots cover the abandoned calls too, so timeouts never raise the fetch concurrency
    DeadlineExecutor deadlines(m_options.WorkerCount());

    const Vector<SceneInfo> scenes = deadlines.Run(
        [source = m_source, query = m_options.query] { return ImageCatalog::Query(*source, query); },
        m_options.fetchTimeout, "Catalog listing from " + m_source->Name());

    PipelineResult result;
    result.scenesMatched = scenes.size();

    if (scenes.empty()) {
        throw EmptyInputError("No scenes match the query (" + FormatDate(m_options.query.start) +
                              " to " + FormatDate(m_options.query.end) + ", cloud < " +
                              std::to_string(m_options.query.maxCloudFraction) + ")");
    }

    // ========================================================================
    // Per-scene index computation (parallel), then barrier
    // ========================================================================

    Vector<SceneOutcome> outcomes;
    outcomes.reserve(scenes.size());
    {
        WorkerPool pool(std::min(m_options.WorkerCount(), scenes.size()));
        VD_LOG_INFO("Processing {} scenes on {} workers", scenes.size(), pool.ThreadCount());

        Vector<std::future<SceneOutcome>> futures;
        futures.reserve(scenes.size());
        for (const SceneInfo& scene : scenes) {
            futures.push_back(pool.Submit([this, &scene, &deadlines, stop] {
                return ProcessScene(scene, deadlines, stop);
            }));
        }

        for (auto& future : futures) {
            outcomes.push_back(future.get());
        }
    }

    if (stop.stop_requested()) {
        const auto done = std::count_if(outcomes.begin(), outcomes.end(),
                                        [](const SceneOutcome& o) { return !o.skipped; });
        throw CancelledError("Cancelled after " + std::to_string(done) + " of " +
                             std::to_string(scenes.size()) + " scenes");
    }

    Vector<Raster> stack;
    stack.reserve(outcomes.size());
    for (usize i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].index) {
            result.scenesUsed.push_back(scenes[i].id);
            stack.push_back(std::move(*outcomes[i].index));
        } else {
            result.scenesDropped.push_back(scenes[i].id);
        }
    }
    outcomes.clear();

    if (!result.scenesDropped.empty()) {
        VD_LOG_WARN("{} of {} scenes dropped", result.scenesDropped.size(), scenes.size());
    }
    if (stack.empty()) {
        throw EmptyInputError("All " + std::to_string(scenes.size()) +
                              " matching scenes failed to load");
    }

    // Region coordinates are interpreted in the data CRS; no reprojection
    const GridSpec& dataGrid = stack.front().grid;
    if (dataGrid.crs != m_options.regionCrs) {
        throw ConfigurationError("Region CRS " + m_options.regionCrs +
                                 " differs from the data CRS " + dataGrid.crs);
    }
    if (!m_options.query.region.Bounds().Intersects(dataGrid.Extent())) {
        VD_LOG_WARN("Region does not overlap the raster extent; area will be zero");
    }

    // ========================================================================
    // Composite, classify, aggregate
    // ========================================================================

    stack = AlignStack(std::move(stack));
    result.composite = Compositor::Reduce(std::move(stack), m_options.reducer);
    result.composite.metadata["index"] = "(" + m_options.bandA + " - " + m_options.bandB + ") / (" +
                                         m_options.bandA + " + " + m_options.bandB + ")";

    result.mask = Classifier::Threshold(result.composite, m_options.threshold);
    result.composite.metadata["threshold"] = std::to_string(m_options.threshold);

    const AreaGrid pixelAreas = ZonalArea::PixelAreas(result.composite.grid);
    result.area = ZonalArea::Aggregate(result.mask, pixelAreas, m_options.query.region, m_options.unit);

    const auto elapsed = std::chrono::duration<f64>(std::chrono::steady_clock::now() - startTime);
    VD_LOG_INFO("Pipeline finished in {:.2f} s: {:.4f} {} from {} scenes", elapsed.count(),
                result.area.value, AreaUnitSuffix(result.area.unit), result.scenesUsed.size());

    return result;
}

} // namespace verdant
