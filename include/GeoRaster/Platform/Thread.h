#pragma once

/**
 * @file Thread.h
 * @brief Thread pool and parallel execution utilities
 *
 * Tiles and rows of a raster are independent, so every algorithm
 * parallelizes the same way: one ParallelFor over work units, each unit
 * writing only its own output cells. A CancelToken lets the caller stop
 * between units.
 *
 * Usage:
 * @code
 * // One task per tile, abort between tiles when cancelled
 * ParallelFor(0, numTiles, [&](size_t t) {
 *     processTile(t);
 * }, 0, &token);
 * @endcode
 */

#include <GeoRaster/Core/Exception.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace Geo::Raster::Platform {

// ============================================================================
// System Information
// ============================================================================

/**
 * @brief Get number of hardware threads (logical cores)
 * @return Number of threads, minimum 1
 */
size_t GetNumCores();

/**
 * @brief Get recommended number of worker threads
 * @return GetNumCores() - 1, minimum 1
 */
size_t GetRecommendedThreadCount();

/**
 * @brief Worker count used by the global pool
 *
 * GEORASTER_NUM_THREADS if set, GetRecommendedThreadCount() otherwise.
 */
size_t GetConfiguredThreadCount();

// ============================================================================
// Cancellation
// ============================================================================

/**
 * @brief Cooperative cancellation flag shared between a caller and a computation
 *
 * Algorithms check the token between work units (tiles, rows) and throw
 * CancelledException once it is set. A unit that already started runs
 * to completion.
 */
class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void Cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    void Reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }

    bool IsCancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Throw CancelledException if the (optional) token is set
 */
inline void ThrowIfCancelled(const CancelToken* token, const char* funcName) {
    if (token != nullptr && token->IsCancelled()) {
        throw CancelledException(std::string(funcName) + ": cancelled by caller");
    }
}

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * @brief Fixed-size worker pool shared by all raster algorithms
 *
 * Created on first use with GetConfiguredThreadCount() workers and joined
 * at program exit. Jobs run in submission order.
 */
class ThreadPool {
public:
    static ThreadPool& Instance();

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Number of worker threads
    size_t Size() const { return workers_.size(); }

    /// False once shutdown has begun
    bool IsRunning() const { return !stop_; }

    /**
     * @brief Queue a callable
     * @return Future for the result; an exception thrown by f surfaces in get()
     * @throws Exception if the pool is shutting down
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

private:
    explicit ThreadPool(size_t numThreads);

    void RunWorker();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;

    std::mutex mutex_;
    std::condition_variable wake_;
    std::atomic<bool> stop_{false};
};

// ============================================================================
// Parallel For
// ============================================================================

/**
 * @brief Call func(i) for every i in [begin, end)
 * @param grainSize Indices per job (0 = CalculateGrainSize)
 * @param cancel Optional token checked before every index
 *
 * Indices must be independent: func(i) may only write state owned by i.
 * If any call throws, the other jobs still finish and the first
 * exception (in job order) is rethrown to the caller.
 */
template<typename Func>
void ParallelFor(size_t begin, size_t end, Func&& func, size_t grainSize = 0,
                 const CancelToken* cancel = nullptr);

/**
 * @brief Indices per ParallelFor job
 * @return About four jobs per worker, at least minGrain
 */
size_t CalculateGrainSize(size_t totalWork, size_t minGrain = 1);

// ============================================================================
// Template Implementations
// ============================================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using Result = typename std::invoke_result<F, Args...>::type;

    auto job = std::make_shared<std::packaged_task<Result()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<Result> future = job->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw Exception("ThreadPool::Submit: pool is shutting down");
        }
        queue_.emplace([job]() { (*job)(); });
    }
    wake_.notify_one();
    return future;
}

template<typename Func>
void ParallelFor(size_t begin, size_t end, Func&& func, size_t grainSize,
                 const CancelToken* cancel) {
    if (begin >= end) return;

    const auto runRange = [&func, cancel](size_t first, size_t last) {
        for (size_t i = first; i < last; ++i) {
            ThrowIfCancelled(cancel, "ParallelFor");
            func(i);
        }
    };

    const size_t count = end - begin;
    auto& pool = ThreadPool::Instance();
    if (count == 1 || pool.Size() <= 1) {
        runRange(begin, end);
        return;
    }

    if (grainSize == 0) {
        grainSize = CalculateGrainSize(count);
    }

    std::vector<std::future<void>> jobs;
    jobs.reserve((count + grainSize - 1) / grainSize);
    for (size_t first = begin; first < end; first += grainSize) {
        const size_t last = std::min(first + grainSize, end);
        jobs.push_back(pool.Submit(runRange, first, last));
    }

    // Jobs reference func, so every one must finish before we leave
    std::exception_ptr firstError;
    for (auto& job : jobs) {
        try {
            job.get();
        } catch (...) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

} // namespace Geo::Raster::Platform
