#include "RetryingCatalogSource.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <limits>
#include <thread>

namespace verdant {

std::chrono::milliseconds RetryPolicy::BackoffFor(u32 attempt) const {
    const i64 base = std::max<i64>(initialBackoff.count(), 0);
    const i64 factor = std::max<u32>(maxBackoffFactor, 1);
    constexpr i64 kLimit = std::numeric_limits<i64>::max();

    // Saturate instead of overflowing for large base delays
    const i64 cap = base > kLimit / factor ? kLimit : base * factor;
    const u32 shift = std::min<u32>(attempt, 16);
    if (base > (cap >> shift)) {
        return std::chrono::milliseconds(cap);
    }
    return std::chrono::milliseconds(std::min<i64>(base << shift, cap));
}

RetryingCatalogSource::RetryingCatalogSource(SharedPtr<CatalogSource> inner, RetryPolicy policy)
    : m_inner(std::move(inner))
    , m_policy(policy)
    , m_sleep([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
{
    if (!m_inner) {
        throw ConfigurationError("RetryingCatalogSource requires an inner source");
    }
}

String RetryingCatalogSource::Name() const {
    return m_inner->Name();
}

template<typename Fn>
auto RetryingCatalogSource::WithRetry(StringView what, Fn&& fn) -> decltype(fn()) {
    for (u32 attempt = 0;; ++attempt) {
        try {
            return fn();
        }
        catch (const FetchTimeoutError&) {
            throw;
        }
        catch (const DataSourceError& e) {
            if (attempt >= m_policy.maxRetries) {
                VD_LOG_ERROR("{}: giving up after {} attempts: {}", what, attempt + 1, e.what());
                throw;
            }
            const auto delay = m_policy.BackoffFor(attempt);
            VD_LOG_WARN("{}: attempt {} failed ({}), retrying in {} ms",
                        what, attempt + 1, e.what(), delay.count());
            m_sleep(delay);
        }
    }
}

Vector<SceneInfo> RetryingCatalogSource::ListScenes(const CatalogQuery& query) {
    return WithRetry("ListScenes(" + m_inner->Name() + ")",
                     [&] { return m_inner->ListScenes(query); });
}

Raster RetryingCatalogSource::FetchBand(const SceneInfo& scene, StringView band) {
    return WithRetry("FetchBand(" + scene.id + ", " + String(band) + ")",
                     [&] { return m_inner->FetchBand(scene, band); });
}

} // namespace verdant
