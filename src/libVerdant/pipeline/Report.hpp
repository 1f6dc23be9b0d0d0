#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "pipeline/Pipeline.hpp"

VD_DISABLE_WARNINGS_PUSH
#include <nlohmann/json.hpp>
VD_DISABLE_WARNINGS_POP

// ============================================================================
// Report - Pipeline outputs
// ============================================================================
// Summary (one JSON line, keys in this order):
//   {"area_ha": 0.02, "area_m2": 200.0, "pixels": 2, "scenes_matched": 3,
//    "scenes_used": 3, "scenes_dropped": [], "reducer": "median",
//    "threshold": 0.3, "start": "2024-05-01", "end": "2024-09-01"}
// The first key is area_<unit> for the configured unit.
//
// Composite: .h5/.hdf5 via RasterIO, .exr via ImageIO (mask included).
// ============================================================================

namespace verdant {

class VD_API Report {
public:
    static nlohmann::ordered_json Summary(const PipelineResult& result, const PipelineOptions& options);

    /// Write the summary as a single line to `path`, or stdout when empty
    static bool WriteSummary(const nlohmann::ordered_json& summary, const String& path);

    /// Write composite and mask; the format follows the file extension
    static bool WriteComposite(const PipelineResult& result, const String& path);
};

} // namespace verdant
