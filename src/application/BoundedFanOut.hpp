/**
 * @file BoundedFanOut.hpp
 * @brief Fixed-width worker pool for per-page work within one request.
 */

#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <thread>
#include <mutex>
#include <atomic>
#include <algorithm>
#include <iostream>

namespace crawlscope::application {

/**
 * @struct FanOutResult
 * @brief Successful results keyed by input key, plus the failure count.
 *
 * Completion order is unspecified; callers fold by key, never by position.
 */
template <typename Result>
struct FanOutResult {
    std::unordered_map<std::string, Result> results;
    int failures = 0;
};

/**
 * @brief Runs @p task once per key on at most @p width threads.
 *
 * A task fails by returning nullopt or by throwing; failures are logged under
 * @p tag, counted and left out of the results. The call returns once every
 * key has been processed; there is no cancellation.
 */
template <typename Result, typename Task>
FanOutResult<Result> RunBoundedFanOut(const std::vector<std::string>& keys, int width, Task task, const char* tag) {
    FanOutResult<Result> outcome;
    if (keys.empty()) {
        return outcome;
    }

    std::mutex resultsMutex;
    std::atomic<size_t> nextIndex{0};
    std::atomic<int> failures{0};

    auto worker = [&]() {
        while (true) {
            size_t index = nextIndex.fetch_add(1);
            if (index >= keys.size()) {
                break;
            }
            const std::string& key = keys[index];
            try {
                std::optional<Result> result = task(key);
                if (result) {
                    std::lock_guard<std::mutex> lock(resultsMutex);
                    outcome.results.emplace(key, std::move(*result));
                } else {
                    ++failures;
                }
            } catch (const std::exception& e) {
                std::cerr << "[" << tag << "] Task failed for " << key << ": " << e.what() << std::endl;
                ++failures;
            }
        }
    };

    const size_t threadCount = std::min(keys.size(), static_cast<size_t>(std::max(1, width)));
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    outcome.failures = failures.load();
    return outcome;
}

} // namespace crawlscope::application
