/**
 * @file RequestThrottle.hpp
 * @brief Concurrency gate plus request pacing shared by the remote clients.
 */

#pragma once
#include <mutex>
#include <condition_variable>
#include <chrono>

namespace crawlscope::infrastructure {

/**
 * @class RequestThrottle
 * @brief Counting semaphore bounding in-flight requests, with a minimum
 *        interval between requests measured from the end of the previous one.
 *
 * One instance may be shared by the index and object clients to bound the
 * aggregate number of outbound connections.
 */
class RequestThrottle {
public:
    /**
     * @param maxConcurrent Number of requests allowed in flight (at least 1).
     * @param requestsPerSecond Pacing ceiling; 0 or less disables pacing.
     */
    RequestThrottle(int maxConcurrent, double requestsPerSecond);

    RequestThrottle(const RequestThrottle&) = delete;
    RequestThrottle& operator=(const RequestThrottle&) = delete;

    /**
     * @class Permit
     * @brief RAII slot; releasing it marks the end of the request.
     */
    class Permit {
    public:
        explicit Permit(RequestThrottle* owner) : m_owner(owner) {}
        Permit(Permit&& other) noexcept : m_owner(other.m_owner) { other.m_owner = nullptr; }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit& operator=(Permit&&) = delete;
        ~Permit() {
            if (m_owner) m_owner->release();
        }

    private:
        RequestThrottle* m_owner;
    };

    /** @brief Blocks until a slot is free and the pacing interval has passed. */
    Permit acquire();

    /** @brief Number of requests currently holding a permit. */
    int inFlight() const;

    int capacity() const { return m_capacity; }

private:
    void release();

    const int m_capacity;
    int m_available;
    std::chrono::steady_clock::duration m_minInterval;
    std::chrono::steady_clock::time_point m_lastRequestEnd;
    bool m_hasCompletedRequest = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace crawlscope::infrastructure
