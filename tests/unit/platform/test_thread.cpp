/**
 * @file test_thread.cpp
 * @brief Unit tests for Platform/Thread.h
 */

#include <GeoRaster/Platform/Thread.h>
#include <gtest/gtest.h>

#include <atomic>
#include <numeric>
#include <stdexcept>
#include <vector>
#include <cmath>

using namespace Geo::Raster;
using namespace Geo::Raster::Platform;

class ThreadTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Ensure thread pool is initialized
        ThreadPool::Instance();
    }
};

// ============================================================================
// System Information Tests
// ============================================================================

TEST_F(ThreadTest, GetNumCoresReturnsPositive) {
    EXPECT_GE(GetNumCores(), 1u);
}

TEST_F(ThreadTest, GetRecommendedThreadCountReturnsPositive) {
    size_t threads = GetRecommendedThreadCount();
    EXPECT_GE(threads, 1u);
    EXPECT_LE(threads, GetNumCores());
}

TEST_F(ThreadTest, ConfiguredThreadCountSizesPool) {
    EXPECT_GE(GetConfiguredThreadCount(), 1u);
    EXPECT_EQ(ThreadPool::Instance().Size(), GetConfiguredThreadCount());
}

// ============================================================================
// Thread Pool Basic Tests
// ============================================================================

TEST_F(ThreadTest, ThreadPoolIsRunning) {
    auto& pool = ThreadPool::Instance();
    EXPECT_GT(pool.Size(), 0u);
    EXPECT_TRUE(pool.IsRunning());
}

TEST_F(ThreadTest, ThreadPoolSubmitWithArgs) {
    auto& pool = ThreadPool::Instance();

    auto future = pool.Submit([](int a, int b) {
        return a + b;
    }, 10, 20);

    EXPECT_EQ(future.get(), 30);
}

TEST_F(ThreadTest, ThreadPoolSubmitPropagatesException) {
    auto& pool = ThreadPool::Instance();
    auto future = pool.Submit([]() -> int {
        throw std::runtime_error("boom");
    });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(ThreadTest, ThreadPoolManyJobs) {
    auto& pool = ThreadPool::Instance();
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.Submit([i]() {
            return i * i;
        }));
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

// ============================================================================
// ParallelFor Tests
// ============================================================================

TEST_F(ThreadTest, ParallelForEmptyRange) {
    std::atomic<int> counter{0};

    ParallelFor(0, 0, [&counter](size_t) {
        ++counter;
    });

    EXPECT_EQ(counter.load(), 0);
}

TEST_F(ThreadTest, ParallelForAllIndicesProcessed) {
    const size_t n = 1000;
    std::vector<std::atomic<int>> flags(n);

    for (size_t i = 0; i < n; ++i) {
        flags[i] = 0;
    }

    ParallelFor(0, n, [&flags](size_t i) {
        flags[i]++;
    });

    for (size_t i = 0; i < n; ++i) {
        EXPECT_EQ(flags[i].load(), 1) << "Index " << i << " not processed exactly once";
    }
}

TEST_F(ThreadTest, ParallelForWithOffset) {
    const size_t begin = 100;
    const size_t end = 200;
    std::vector<std::atomic<int>> flags(end);

    for (size_t i = 0; i < end; ++i) {
        flags[i] = 0;
    }

    ParallelFor(begin, end, [&flags](size_t i) {
        flags[i]++;
    });

    for (size_t i = 0; i < begin; ++i) {
        EXPECT_EQ(flags[i].load(), 0);
    }
    for (size_t i = begin; i < end; ++i) {
        EXPECT_EQ(flags[i].load(), 1);
    }
}

TEST_F(ThreadTest, ParallelForWithGrainSize) {
    const size_t n = 1000;
    std::atomic<int> sum{0};

    ParallelFor(0, n, [&sum](size_t i) {
        sum += static_cast<int>(i);
    }, 100);  // Grain size 100

    int expected = static_cast<int>((n - 1) * n / 2);
    EXPECT_EQ(sum.load(), expected);
}

TEST_F(ThreadTest, ParallelForComputation) {
    const size_t n = 10000;
    std::vector<double> output(n);

    ParallelFor(0, n, [&output](size_t i) {
        output[i] = std::sqrt(static_cast<double>(i)) * 2.0;
    });

    for (size_t i = 0; i < n; ++i) {
        EXPECT_DOUBLE_EQ(output[i], std::sqrt(static_cast<double>(i)) * 2.0);
    }
}

TEST_F(ThreadTest, ParallelForRethrowsAfterAllTasksFinish) {
    const size_t n = 2000;
    std::atomic<size_t> processed{0};

    EXPECT_THROW(ParallelFor(0, n, [&processed](size_t i) {
        if (i == 7) {
            throw InvalidArgumentException("index 7");
        }
        ++processed;
    }, 10), InvalidArgumentException);

    // Only the failing task stops early: indices 7, 8 and 9 are never counted
    if (ThreadPool::Instance().Size() > 1) {
        EXPECT_EQ(processed.load(), n - 3);
    }
}

// ============================================================================
// Cancellation Tests
// ============================================================================

TEST_F(ThreadTest, CancelTokenState) {
    CancelToken token;
    EXPECT_FALSE(token.IsCancelled());
    token.Cancel();
    EXPECT_TRUE(token.IsCancelled());
    token.Reset();
    EXPECT_FALSE(token.IsCancelled());
}

TEST_F(ThreadTest, ThrowIfCancelled) {
    CancelToken token;
    EXPECT_NO_THROW(ThrowIfCancelled(nullptr, "Test"));
    EXPECT_NO_THROW(ThrowIfCancelled(&token, "Test"));
    token.Cancel();
    EXPECT_THROW(ThrowIfCancelled(&token, "Test"), CancelledException);
}

TEST_F(ThreadTest, ParallelForCancelledBeforeStart) {
    CancelToken token;
    token.Cancel();
    std::atomic<int> counter{0};

    EXPECT_THROW(ParallelFor(0, 100, [&counter](size_t) {
        ++counter;
    }, 0, &token), CancelledException);
    EXPECT_EQ(counter.load(), 0);
}

TEST_F(ThreadTest, ParallelForCancelledMidway) {
    CancelToken token;
    std::atomic<int> counter{0};

    EXPECT_THROW(ParallelFor(0, 10000, [&counter, &token](size_t i) {
        if (i == 0) {
            token.Cancel();
        }
        ++counter;
    }, 1, &token), CancelledException);
    EXPECT_LT(counter.load(), 10000);
}

// ============================================================================
// Utility Function Tests
// ============================================================================

TEST_F(ThreadTest, CalculateGrainSizePositive) {
    EXPECT_GT(CalculateGrainSize(10000), 0u);
}

TEST_F(ThreadTest, CalculateGrainSizeRespectsMinimum) {
    EXPECT_GE(CalculateGrainSize(100, 50), 50u);
}

TEST_F(ThreadTest, ParallelSumCorrectness) {
    const size_t n = 100000;
    std::vector<int> data(n);

    for (size_t i = 0; i < n; ++i) {
        data[i] = static_cast<int>(i % 100);
    }

    int seqSum = std::accumulate(data.begin(), data.end(), 0);

    std::atomic<int> parSum{0};
    ParallelFor(0, n, [&data, &parSum](size_t i) {
        parSum += data[i];
    });

    EXPECT_EQ(parSum.load(), seqSum);
}
