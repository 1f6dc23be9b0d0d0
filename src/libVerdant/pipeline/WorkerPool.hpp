#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>

// ============================================================================
// WorkerPool - Fixed-size thread pool with a FIFO task queue
// ============================================================================
// At most ThreadCount() tasks run at once. Submit() returns a future that
// carries the task's result or exception. Destruction stops accepting work,
// lets workers drain the queue, then joins them.
// ============================================================================

namespace verdant {

class VD_API WorkerPool {
public:
    /// @param threadCount Number of workers (0 is treated as 1)
    explicit WorkerPool(usize threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename Fn>
    auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>>;

    usize ThreadCount() const { return m_threads.size(); }

private:
    void WorkerThread(std::stop_token stop);

    std::mutex m_mutex;
    std::condition_variable_any m_condition;
    std::queue<std::function<void()>> m_tasks;

    // Declared last: joined before the queue and mutex are destroyed
    std::vector<std::jthread> m_threads;
};

template<typename Fn>
auto WorkerPool::Submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using R = std::invoke_result_t<std::decay_t<Fn>>;

    // std::function needs a copyable target
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    std::future<R> future = task->get_future();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.emplace([task] { (*task)(); });
    }
    m_condition.notify_one();
    return future;
}

} // namespace verdant
