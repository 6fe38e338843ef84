#pragma once
// Parallel evaluation helpers with progress reporting
// Uses std::thread and std::atomic; progress goes to the SDL log

#include <SDL3/SDL_log.h>
#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace massing {
namespace parallel {

// Progress callback: (progress 0.0-1.0, message)
using ProgressCallback = std::function<void(float, const std::string&)>;

// Thread-safe progress tracker for parallel operations
class ProgressTracker {
public:
    ProgressTracker(size_t totalItems, ProgressCallback callback = nullptr,
                    const std::string& taskName = "Processing")
        : total(totalItems)
        , completed(0)
        , callback(std::move(callback))
        , taskName(taskName)
        , lastReportedPercent(-1) {
        // Report every ~10%
        interval = std::max(size_t(1), total / 10);
    }

    // Call when an item is completed (thread-safe)
    void itemCompleted() {
        size_t current = ++completed;
        if (current == total || (current % interval == 0)) {
            report(current);
        }
    }

    void report(size_t current) {
        float progress = static_cast<float>(current) / static_cast<float>(total);
        int percent = static_cast<int>(progress * 100.0f);

        // Avoid duplicate reports for same percentage
        int expected = lastReportedPercent.load();
        if (percent > expected && lastReportedPercent.compare_exchange_strong(expected, percent)) {
            std::string msg = taskName + " " + std::to_string(current) + "/" + std::to_string(total);
            if (callback) {
                callback(progress, msg);
            } else {
                SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Progress: %d%% - %s", percent, msg.c_str());
            }
        }
    }

private:
    size_t total;
    std::atomic<size_t> completed;
    ProgressCallback callback;
    std::string taskName;
    size_t interval;
    std::atomic<int> lastReportedPercent;
};

// Worker count override; 0 means hardware concurrency
inline std::atomic<unsigned int>& threadOverride() {
    static std::atomic<unsigned int> value{0};
    return value;
}

inline void setThreadCount(unsigned int n) {
    threadOverride().store(n);
}

// Get the number of threads to use (respects hardware concurrency)
inline unsigned int getThreadCount() {
    unsigned int n = threadOverride().load();
    if (n == 0) n = std::thread::hardware_concurrency();
    return std::max(1u, n);
}

/**
 * Parallel for loop over [start, end) with progress tracking.
 * Each thread processes a contiguous chunk. The first exception thrown by
 * `func` is rethrown on the calling thread once every worker has joined.
 */
template<typename Func>
void parallel_for_progress(int start, int end, Func&& func,
                           ProgressCallback progressCallback = nullptr,
                           const std::string& taskName = "Processing") {
    if (start >= end) return;

    int total = end - start;
    ProgressTracker tracker(static_cast<size_t>(total), progressCallback, taskName);

    unsigned int numThreads = std::min(getThreadCount(), static_cast<unsigned int>(total));

    if (numThreads <= 1) {
        for (int i = start; i < end; ++i) {
            func(i);
            tracker.itemCompleted();
        }
        return;
    }

    std::exception_ptr firstError;
    std::mutex errorMutex;

    std::vector<std::thread> threads;
    threads.reserve(numThreads);

    int chunkSize = (total + static_cast<int>(numThreads) - 1) / static_cast<int>(numThreads);

    for (unsigned int t = 0; t < numThreads; ++t) {
        int chunkStart = start + static_cast<int>(t) * chunkSize;
        int chunkEnd = std::min(chunkStart + chunkSize, end);

        if (chunkStart < end) {
            threads.emplace_back([=, &func, &tracker, &firstError, &errorMutex] {
                try {
                    for (int i = chunkStart; i < chunkEnd; ++i) {
                        func(i);
                        tracker.itemCompleted();
                    }
                } catch (...) {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!firstError) firstError = std::current_exception();
                }
            });
        }
    }

    for (auto& t : threads) {
        t.join();
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

} // namespace parallel
} // namespace massing
