// ============================================================================
// Verdant - Vegetation Index Compositing and Zonal Area
// ============================================================================
// Main entry point: catalog query -> NDVI per scene -> temporal composite
// -> threshold mask -> area inside the region.
//
// Usage: verdant <config.toml>
// The JSON summary goes to output.summary, or stdout when unset. Logs go to
// stderr and logging.file.
// ============================================================================

#include "core/Log.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "pipeline/Pipeline.hpp"
#include "pipeline/PipelineOptions.hpp"
#include "pipeline/Report.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <stop_token>
#include <thread>

using namespace verdant;

namespace {

volatile std::sig_atomic_t g_StopSignal = 0;

extern "C" void OnStopSignal(int signal) {
    g_StopSignal = signal;
}

int Exit(ExitCode code) {
    Log::Shutdown();
    return static_cast<int>(code);
}

} // namespace

int main(int argc, char* argv[]) {
    // ========================================================================
    // Initialize Logging (console only until the config names a file)
    // ========================================================================
    Log::Init(nullptr, Log::Level::Info);

    VD_LOG_INFO("========================================");
    VD_LOG_INFO("  Verdant NDVI Composite & Zonal Area");
    VD_LOG_INFO("========================================");

    // ========================================================================
    // Load Configuration
    // ========================================================================
    if (argc < 2) {
        VD_LOG_ERROR("No configuration file provided");
        VD_LOG_INFO("Usage: {} <config.toml>", argv[0]);
        return Exit(ExitCode::ConfigurationError);
    }

    std::filesystem::path configPath(argv[1]);
    VD_LOG_INFO("Loading configuration: {}", configPath.string());

    auto configResult = Config::Load(configPath);
    if (!configResult.has_value()) {
        VD_LOG_ERROR("Failed to load configuration: {}", configResult.error());
        return Exit(ExitCode::ConfigurationError);
    }
    const Config& config = configResult.value();

    const String levelName = config.Get<String>("logging.level", "info");
    auto level = Log::ParseLevel(levelName);
    if (!level) {
        VD_LOG_ERROR("logging.level must be trace, debug, info, warn, error, critical or off (got '{}')",
                     levelName);
        return Exit(ExitCode::ConfigurationError);
    }
    const String logFile = config.Get<String>("logging.file", "verdant.log");
    Log::Init(logFile.c_str(), *level);

    auto optionsResult = PipelineOptions::FromConfig(config);
    if (!optionsResult.has_value()) {
        VD_LOG_ERROR("Invalid configuration: {}", optionsResult.error());
        return Exit(ExitCode::ConfigurationError);
    }
    const PipelineOptions& options = optionsResult.value();

    // ========================================================================
    // Cancellation: SIGINT / SIGTERM request a stop
    // ========================================================================
    std::stop_source stopSource;
    std::signal(SIGINT, OnStopSignal);
    std::signal(SIGTERM, OnStopSignal);

    std::jthread signalWatcher([&stopSource](std::stop_token watcherStop) {
        while (!watcherStop.stop_requested()) {
            if (g_StopSignal != 0) {
                VD_LOG_WARN("Signal {} received, stopping after the current scenes", static_cast<int>(g_StopSignal));
                stopSource.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    // ========================================================================
    // Run
    // ========================================================================
    try {
        Pipeline pipeline(options, Pipeline::CreateSource(options));
        PipelineResult result = pipeline.Run(stopSource.get_token());

        signalWatcher.request_stop();

        if (!options.compositePath.empty()) {
            if (!Report::WriteComposite(result, options.compositePath)) {
                VD_LOG_ERROR("Failed to write composite: {}", options.compositePath);
                return Exit(ExitCode::InternalError);
            }
            VD_LOG_INFO("Composite written to {}", options.compositePath);
        }

        if (!Report::WriteSummary(Report::Summary(result, options), options.summaryPath)) {
            return Exit(ExitCode::InternalError);
        }

        VD_LOG_INFO("Masked area: {:.4f} {} ({} pixels)",
                    result.area.value, AreaUnitSuffix(result.area.unit), result.area.pixelCount);

    } catch (const PipelineError& e) {
        VD_LOG_ERROR("{}: {}", ErrorCodeToString(e.Code()), e.what());
        return Exit(ExitCodeFor(e.Code()));
    } catch (const std::exception& e) {
        VD_LOG_CRITICAL("Fatal error: {}", e.what());
        return Exit(ExitCode::InternalError);
    }

    VD_LOG_INFO("Done");
    return Exit(ExitCode::Success);
}
