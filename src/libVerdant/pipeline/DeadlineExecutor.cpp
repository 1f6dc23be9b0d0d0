#include "DeadlineExecutor.hpp"
#include "core/Log.hpp"

#include <algorithm>

namespace verdant {

DeadlineExecutor::DeadlineExecutor(usize maxInFlight)
    : m_slots(static_cast<std::ptrdiff_t>(
          std::clamp<usize>(maxInFlight, 1, static_cast<usize>(std::counting_semaphore<>::max())))) {}

DeadlineExecutor::~DeadlineExecutor() {
    Drain();
}

void DeadlineExecutor::Drain() {
    Vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        threads.swap(m_abandoned);
    }
    if (threads.empty()) {
        return;
    }

    VD_LOG_INFO("Waiting for {} timed-out call(s) to return", threads.size());
    for (std::thread& thread : threads) {
        thread.join();
    }
}

usize DeadlineExecutor::AbandonedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_abandoned.size();
}

} // namespace verdant
