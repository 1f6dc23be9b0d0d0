#include "PipelineOptions.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"

#include <cmath>
#include <filesystem>
#include <limits>
#include <thread>

namespace verdant {

namespace {

using OptionsResult = Result<PipelineOptions, String>;

OptionsResult Fail(const String& message) {
    return OptionsResult::Err(message);
}

/// Integer setting in [0, max], `fallback` when absent
Optional<i64> ReadCount(const Config& config, StringView key, i64 fallback, String& error,
                        i64 max = std::numeric_limits<i64>::max()) {
    if (!config.Has(key)) {
        return fallback;
    }
    auto value = config.GetRequired<i64>(key);
    if (!value) {
        error = String(key) + " must be an integer";
        return std::nullopt;
    }
    if (*value < 0) {
        error = String(key) + " must not be negative (got " + std::to_string(*value) + ")";
        return std::nullopt;
    }
    if (*value > max) {
        error = String(key) + " must be at most " + std::to_string(max) +
                " (got " + std::to_string(*value) + ")";
        return std::nullopt;
    }
    return *value;
}

} // namespace

Optional<AlignPolicy> ParseAlignPolicy(StringView name) {
    if (name == "strict")  return AlignPolicy::Strict;
    if (name == "nearest") return AlignPolicy::Nearest;
    return std::nullopt;
}

const char* AlignPolicyName(AlignPolicy policy) {
    switch (policy) {
        case AlignPolicy::Strict:  return "strict";
        case AlignPolicy::Nearest: return "nearest";
    }
    return "unknown";
}

// ============================================================================
// PipelineOptions::FromConfig
// ============================================================================

Result<PipelineOptions, String> PipelineOptions::FromConfig(const Config& config) {
    PipelineOptions options;

    // ========================================================================
    // Region
    // ========================================================================

    const bool hasWkt = config.Has("region.wkt");
    const bool hasGeoJson = config.Has("region.geojson");
    if (hasWkt == hasGeoJson) {
        return Fail("exactly one of region.wkt or region.geojson must be set");
    }

    auto region = hasWkt ? Polygon::FromWkt(config.Get<String>("region.wkt"))
                         : Polygon::FromGeoJson(config.Get<String>("region.geojson"));
    if (!region) {
        return Fail("region: " + region.error());
    }
    options.query.region = std::move(region).value();
    options.regionCrs = config.Get<String>("region.crs", "EPSG:4326");

    // ========================================================================
    // Date range and cloud filter
    // ========================================================================

    for (const char* key : {"query.start", "query.end"}) {
        if (!config.Has(key)) {
            return Fail(String("Missing required key: ") + key);
        }
    }

    auto start = ParseDate(config.Get<String>("query.start"));
    if (!start) {
        return Fail("query.start must be a YYYY-MM-DD date");
    }
    auto end = ParseDate(config.Get<String>("query.end"));
    if (!end) {
        return Fail("query.end must be a YYYY-MM-DD date");
    }
    options.query.start = *start;
    options.query.end = *end;

    if (config.Has("query.max_cloud")) {
        auto cloud = config.GetRequired<f64>("query.max_cloud");
        if (!cloud) {
            return Fail("query.max_cloud must be a number");
        }
        options.query.maxCloudFraction = *cloud;
    }

    // ========================================================================
    // Index, compositing, classification, area
    // ========================================================================

    if (config.Has("index.bands")) {
        auto bands = config.GetArray<String>("index.bands");
        if (bands.size() != 2) {
            return Fail("index.bands must be an array of 2 band names, but got " +
                        std::to_string(bands.size()));
        }
        options.bandA = bands[0];
        options.bandB = bands[1];
    }

    const String reducerName = config.Get<String>("composite.reducer", "median");
    auto reducer = ParseReducer(reducerName);
    if (!reducer) {
        return Fail("composite.reducer must be median, mean, min or max (got '" + reducerName + "')");
    }
    options.reducer = *reducer;

    const String alignName = config.Get<String>("composite.align", "strict");
    auto align = ParseAlignPolicy(alignName);
    if (!align) {
        return Fail("composite.align must be strict or nearest (got '" + alignName + "')");
    }
    options.align = *align;

    if (config.Has("classify.threshold")) {
        auto threshold = config.GetRequired<f64>("classify.threshold");
        if (!threshold) {
            return Fail("classify.threshold must be a number");
        }
        options.threshold = *threshold;
    }

    const String unitName = config.Get<String>("area.unit", "ha");
    auto unit = ParseAreaUnit(unitName);
    if (!unit) {
        return Fail("area.unit must be m2, ha, km2 or acres (got '" + unitName + "')");
    }
    options.unit = *unit;

    // ========================================================================
    // Execution and data source
    // ========================================================================

    String error;
    if (config.Has("pipeline.concurrency")) {
        auto concurrency = ReadCount(config, "pipeline.concurrency", 0, error);
        if (!concurrency) {
            return Fail(error);
        }
        if (*concurrency < 1) {
            return Fail("pipeline.concurrency must be at least 1");
        }
        options.concurrency = static_cast<usize>(*concurrency);
    }

    options.sourceType = config.Get<String>("source.type", "local");
    if (options.sourceType != "local") {
        return Fail("source.type '" + options.sourceType + "' is not supported (expected 'local')");
    }
    options.sourcePath = config.Get<String>("source.path");
    if (options.sourcePath.empty()) {
        return Fail("Missing required key: source.path");
    }

    auto timeoutMs = ReadCount(config, "source.fetch_timeout_ms", options.fetchTimeout.count(), error,
                               PipelineOptions::kMaxFetchTimeout.count());
    if (!timeoutMs) {
        return Fail(error);
    }
    options.fetchTimeout = std::chrono::milliseconds(*timeoutMs);

    auto maxRetries = ReadCount(config, "source.max_retries", options.retry.maxRetries, error,
                                PipelineOptions::kMaxRetries);
    if (!maxRetries) {
        return Fail(error);
    }
    options.retry.maxRetries = static_cast<u32>(*maxRetries);

    auto backoffMs = ReadCount(config, "source.retry_backoff_ms", options.retry.initialBackoff.count(), error,
                               PipelineOptions::kMaxRetryBackoff.count());
    if (!backoffMs) {
        return Fail(error);
    }
    options.retry.initialBackoff = std::chrono::milliseconds(*backoffMs);

    // ========================================================================
    // Outputs
    // ========================================================================

    options.compositePath = config.Get<String>("output.composite");
    options.summaryPath = config.Get<String>("output.summary");

    try {
        options.Validate();
    } catch (const ConfigurationError& e) {
        return Fail(e.what());
    }

    VD_LOG_INFO("Pipeline options:");
    VD_LOG_INFO("  Region:    {} ({})", options.query.region.ToWkt(), options.regionCrs);
    VD_LOG_INFO("  Dates:     [{}, {})", FormatDate(options.query.start), FormatDate(options.query.end));
    VD_LOG_INFO("  Max cloud: {:.2f}", options.query.maxCloudFraction);
    VD_LOG_INFO("  Index:     ({} - {}) / ({} + {})", options.bandA, options.bandB, options.bandA, options.bandB);
    VD_LOG_INFO("  Reducer:   {} (align: {})", ReducerName(options.reducer), AlignPolicyName(options.align));
    VD_LOG_INFO("  Threshold: {}", options.threshold);
    VD_LOG_INFO("  Workers:   {}", options.WorkerCount());

    return options;
}

// ============================================================================
// Validation
// ============================================================================

void PipelineOptions::Validate() const {
    query.Validate();

    if (regionCrs.empty()) {
        throw ConfigurationError("region.crs must not be empty");
    }
    if (bandA.empty() || bandB.empty()) {
        throw ConfigurationError("index bands must be named");
    }
    if (bandA == bandB) {
        throw ConfigurationError("index bands must differ (got '" + bandA + "' twice)");
    }
    if (!std::isfinite(threshold) || threshold < -1.0 || threshold > 1.0) {
        throw ConfigurationError("classify.threshold must lie in [-1, 1] (got " +
                                 std::to_string(threshold) + ")");
    }
    if (fetchTimeout.count() < 0 || fetchTimeout > kMaxFetchTimeout) {
        throw ConfigurationError("source.fetch_timeout_ms must lie in [0, " +
                                 std::to_string(kMaxFetchTimeout.count()) + "]");
    }
    if (retry.maxRetries > kMaxRetries) {
        throw ConfigurationError("source.max_retries must be at most " + std::to_string(kMaxRetries));
    }
    if (retry.initialBackoff.count() < 0 || retry.initialBackoff > kMaxRetryBackoff) {
        throw ConfigurationError("source.retry_backoff_ms must lie in [0, " +
                                 std::to_string(kMaxRetryBackoff.count()) + "]");
    }

    if (!compositePath.empty()) {
        const String ext = std::filesystem::path(compositePath).extension().string();
        if (ext != ".h5" && ext != ".hdf5" && ext != ".exr") {
            throw ConfigurationError("output.composite must end in .h5, .hdf5 or .exr (got '" +
                                     compositePath + "')");
        }
    }
}

usize PipelineOptions::WorkerCount() const {
    if (concurrency > 0) {
        return concurrency;
    }
    const unsigned hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}

} // namespace verdant
