#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "core/Config.hpp"
#include "analysis/Compositor.hpp"
#include "analysis/ZonalArea.hpp"
#include "catalog/CatalogSource.hpp"
#include "catalog/RetryingCatalogSource.hpp"

#include <chrono>

// ============================================================================
// PipelineOptions - Everything a pipeline run needs, parsed from TOML
// ============================================================================
// Usage:
//   auto config = Config::Load("run.toml");
//   auto options = PipelineOptions::FromConfig(*config);
//   if (!options) { /* configuration error */ }
// ============================================================================

namespace verdant {

/// How scenes on different grids are brought together before compositing
enum class AlignPolicy : u8 {
    Strict,  // differing grids are a GridMismatchError
    Nearest  // resample onto the first scene's grid (nearest neighbour)
};

VD_API Optional<AlignPolicy> ParseAlignPolicy(StringView name);
VD_API const char* AlignPolicyName(AlignPolicy policy);

struct VD_API PipelineOptions {
    // Region and catalog filter
    CatalogQuery query;
    String regionCrs = "EPSG:4326";

    // Normalized difference (bandA - bandB) / (bandA + bandB)
    String bandA = "nir";
    String bandB = "red";

    Reducer reducer = Reducer::Median;
    AlignPolicy align = AlignPolicy::Strict;
    f64 threshold = 0.3;
    AreaUnit unit = AreaUnit::Hectares;

    // Scene workers; 0 means hardware concurrency
    usize concurrency = 0;

    // Data source
    String sourceType = "local";
    String sourcePath;
    std::chrono::milliseconds fetchTimeout{30000};  // 0 disables
    RetryPolicy retry;

    // Outputs (empty = not written / stdout)
    String compositePath;
    String summaryPath;

    // Upper bounds enforced by Validate()
    static constexpr u32 kMaxRetries = 100;
    static constexpr std::chrono::milliseconds kMaxRetryBackoff{std::chrono::hours(1)};
    static constexpr std::chrono::milliseconds kMaxFetchTimeout{std::chrono::hours(24)};

    /// Parse and validate the [region], [query], [index], [composite],
    /// [classify], [area], [pipeline], [source] and [output] tables
    static Result<PipelineOptions, String> FromConfig(const Config& config);

    /// @throws ConfigurationError on any invalid setting
    void Validate() const;

    /// Worker count actually used (concurrency resolved, at least 1)
    usize WorkerCount() const;
};

} // namespace verdant
