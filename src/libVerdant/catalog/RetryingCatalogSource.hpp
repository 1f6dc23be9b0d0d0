#pragma once

#include "catalog/CatalogSource.hpp"

#include <chrono>
#include <functional>

namespace verdant {

struct RetryPolicy {
    u32 maxRetries = 3;
    std::chrono::milliseconds initialBackoff{200};

    // Delay doubles per attempt, capped at initialBackoff * maxBackoffFactor
    u32 maxBackoffFactor = 8;

    std::chrono::milliseconds BackoffFor(u32 attempt) const;
};

/// Decorator retrying DataSourceError with bounded exponential backoff.
/// The last error is rethrown once retries are exhausted. Timeouts are not
/// retried here; they are handled by the caller that set the deadline.
class VD_API RetryingCatalogSource : public CatalogSource {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryingCatalogSource(SharedPtr<CatalogSource> inner, RetryPolicy policy);

    /// Replace the sleep function (tests)
    void SetSleeper(Sleeper sleeper) { m_sleep = std::move(sleeper); }

    String Name() const override;
    Vector<SceneInfo> ListScenes(const CatalogQuery& query) override;
    Raster FetchBand(const SceneInfo& scene, StringView band) override;

private:
    template<typename Fn>
    auto WithRetry(StringView what, Fn&& fn) -> decltype(fn());

    SharedPtr<CatalogSource> m_inner;
    RetryPolicy m_policy;
    Sleeper m_sleep;
};

} // namespace verdant
