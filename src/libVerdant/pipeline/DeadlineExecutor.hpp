#pragma once

#include "core/Errors.hpp"
#include "core/Platform.hpp"
#include "core/Types.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <semaphore>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>

// ============================================================================
// DeadlineExecutor - Run blocking calls with a deadline
// ============================================================================
// Each call runs on a helper thread while the caller waits until the
// deadline. A late call raises FetchTimeoutError in the caller; the helper
// thread is kept by the executor and joined by Drain() or the destructor, so
// nothing the call touches may be destroyed before the executor.
//
// At most `maxInFlight` helper threads exist at once, abandoned ones
// included. Waiting for a free slot counts against the same deadline.
//
// Usage:
//   DeadlineExecutor deadlines(4);
//   Raster band = deadlines.Run([&] { return source.FetchBand(scene, "nir"); },
//                               std::chrono::seconds(30), "nir fetch");
// ============================================================================

namespace verdant {

class VD_API DeadlineExecutor {
public:
    /// @param maxInFlight Concurrent helper threads allowed (0 is treated as 1)
    explicit DeadlineExecutor(usize maxInFlight);

    /// Joins abandoned calls
    ~DeadlineExecutor();

    DeadlineExecutor(const DeadlineExecutor&) = delete;
    DeadlineExecutor& operator=(const DeadlineExecutor&) = delete;

    /// Run `fn` and wait at most `timeout` for its result. A zero or negative
    /// timeout runs `fn` inline on the calling thread.
    /// @throws FetchTimeoutError if the deadline passes first
    /// @throws whatever `fn` throws
    template<typename Fn>
    auto Run(Fn fn, std::chrono::milliseconds timeout, const String& what) -> std::invoke_result_t<Fn&>;

    /// Block until every abandoned call has returned
    void Drain();

    /// Calls that missed their deadline and have not been joined yet
    usize AbandonedCount() const;

private:
    std::counting_semaphore<> m_slots;

    mutable std::mutex m_mutex;
    Vector<std::thread> m_abandoned;
};

template<typename Fn>
auto DeadlineExecutor::Run(Fn fn, std::chrono::milliseconds timeout, const String& what)
    -> std::invoke_result_t<Fn&>
{
    using R = std::invoke_result_t<Fn&>;

    if (timeout.count() <= 0) {
        return fn();
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const String expired = what + " timed out after " + std::to_string(timeout.count()) + " ms";

    if (!m_slots.try_acquire_until(deadline)) {
        throw FetchTimeoutError(expired + " (no free slot)");
    }

    std::promise<R> promise;
    std::future<R> future = promise.get_future();

    std::thread helper;
    try {
        helper = std::thread([this, promise = std::move(promise), fn = std::move(fn)]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    fn();
                    promise.set_value();
                } else {
                    promise.set_value(fn());
                }
            } catch (...) {
                // Rethrown to the waiting caller by future.get()
                promise.set_exception(std::current_exception());
            }
            m_slots.release();
        });
    } catch (const std::system_error&) {
        m_slots.release();
        throw;
    }

    if (future.wait_until(deadline) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_abandoned.push_back(std::move(helper));
        throw FetchTimeoutError(expired);
    }

    helper.join();
    return future.get();
}

} // namespace verdant
