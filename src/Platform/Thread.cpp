/**
 * @file Thread.cpp
 * @brief Thread pool and parallel execution implementation
 */

#include <GeoRaster/Platform/Thread.h>
#include <GeoRaster/Platform/Config.h>
#include <GeoRaster/Platform/Log.h>

namespace Geo::Raster::Platform {

// ============================================================================
// System Information
// ============================================================================

size_t GetNumCores() {
    const unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<size_t>(hw);
}

size_t GetRecommendedThreadCount() {
    // Leave one core to the calling thread
    return std::max<size_t>(GetNumCores() - 1, 1);
}

size_t GetConfiguredThreadCount() {
    const size_t configured = GetRuntimeConfig().numThreads;
    return configured == 0 ? GetRecommendedThreadCount() : configured;
}

// ============================================================================
// Thread Pool
// ============================================================================

ThreadPool& ThreadPool::Instance() {
    static ThreadPool pool(GetConfiguredThreadCount());
    return pool;
}

ThreadPool::ThreadPool(size_t numThreads) {
    numThreads = std::max<size_t>(numThreads, 1);
    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back([this] { RunWorker(); });
    }
    Logger()->debug("ThreadPool: {} worker(s)", numThreads);
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    wake_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::RunWorker() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            // Drain queued jobs before exiting
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop();
        }
        // Submit wraps jobs in packaged_task, which stores any exception
        job();
    }
}

// ============================================================================
// Utility Functions
// ============================================================================

size_t CalculateGrainSize(size_t totalWork, size_t minGrain) {
    const size_t workers = ThreadPool::Instance().Size();
    if (workers <= 1) {
        return std::max(totalWork, minGrain);
    }
    const size_t jobs = workers * 4;
    return std::max((totalWork + jobs - 1) / jobs, minGrain);
}

} // namespace Geo::Raster::Platform
