#include "WorkerPool.hpp"
#include "core/Log.hpp"

#include <algorithm>

namespace verdant {

WorkerPool::WorkerPool(usize threadCount) {
    const usize count = std::max<usize>(threadCount, 1);
    m_threads.reserve(count);
    for (usize i = 0; i < count; ++i) {
        m_threads.emplace_back([this](std::stop_token stop) { WorkerThread(stop); });
    }
    VD_LOG_DEBUG("WorkerPool: started {} worker threads", count);
}

WorkerPool::~WorkerPool() {
    for (auto& thread : m_threads) {
        thread.request_stop();
    }
    m_condition.notify_all();
    m_threads.clear();
}

void WorkerPool::WorkerThread(std::stop_token stop) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, stop, [this] { return !m_tasks.empty(); });

            // Stop requested and nothing left to drain
            if (m_tasks.empty()) {
                return;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
        }
        task();
    }
}

} // namespace verdant
