#include "infrastructure/RequestThrottle.hpp"
#include <algorithm>
#include <thread>

namespace crawlscope::infrastructure {

RequestThrottle::RequestThrottle(int maxConcurrent, double requestsPerSecond)
    : m_capacity(std::max(1, maxConcurrent)),
      m_available(std::max(1, maxConcurrent)),
      m_minInterval(std::chrono::steady_clock::duration::zero()) {
    if (requestsPerSecond > 0.0) {
        m_minInterval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / requestsPerSecond));
    }
}

RequestThrottle::Permit RequestThrottle::acquire() {
    std::chrono::steady_clock::time_point notBefore;
    bool pace = false;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_available > 0; });
        --m_available;
        if (m_hasCompletedRequest) {
            notBefore = m_lastRequestEnd + m_minInterval;
            pace = true;
        }
    }

    // Sleep outside the lock so releases are never held up by pacing
    if (pace) {
        auto now = std::chrono::steady_clock::now();
        if (now < notBefore) {
            std::this_thread::sleep_for(notBefore - now);
        }
    }
    return Permit(this);
}

void RequestThrottle::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_available;
        m_lastRequestEnd = std::chrono::steady_clock::now();
        m_hasCompletedRequest = true;
    }
    m_cv.notify_one();
}

int RequestThrottle::inFlight() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capacity - m_available;
}

} // namespace crawlscope::infrastructure
