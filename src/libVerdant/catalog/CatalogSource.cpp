#include "CatalogSource.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"

#include <algorithm>

namespace verdant {

void CatalogQuery::Validate() const {
    if (!region.IsValid()) {
        throw ConfigurationError("Region of interest is empty or degenerate");
    }
    if (!start.ok() || !end.ok()) {
        throw ConfigurationError("Query dates are not valid calendar dates");
    }
    if (!(start < end)) {
        throw ConfigurationError("Query date range is empty: [" + FormatDate(start) +
                                 ", " + FormatDate(end) + ")");
    }
    if (!(maxCloudFraction >= 0.0 && maxCloudFraction <= 1.0)) {
        throw ConfigurationError("Cloud threshold must be within [0, 1], got " +
                                 std::to_string(maxCloudFraction));
    }
}

bool CatalogQuery::Matches(const SceneInfo& scene) const {
    if (scene.date < start || !(scene.date < end)) {
        return false;
    }
    if (!(scene.cloudFraction < maxCloudFraction)) {
        return false;
    }
    return scene.footprint.Intersects(region);
}

Vector<SceneInfo> ImageCatalog::Query(CatalogSource& source, const CatalogQuery& query) {
    Vector<SceneInfo> candidates = source.ListScenes(query);
    const usize listed = candidates.size();

    std::erase_if(candidates, [&query](const SceneInfo& s) { return !query.Matches(s); });

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const SceneInfo& a, const SceneInfo& b) {
                         if (a.date != b.date) return a.date < b.date;
                         return a.id < b.id;
                     });

    VD_LOG_INFO("Catalog '{}': {} of {} listed scenes match [{}, {}), cloud < {:.2f}",
                source.Name(), candidates.size(), listed,
                FormatDate(query.start), FormatDate(query.end), query.maxCloudFraction);
    for (const SceneInfo& s : candidates) {
        VD_LOG_DEBUG("  {} {} cloud={:.3f}", s.id, FormatDate(s.date), s.cloudFraction);
    }
    return candidates;
}

} // namespace verdant
