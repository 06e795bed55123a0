/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for WorkerPool
 */

#include <gtest/gtest.h>
#include "nego_worker_pool.hpp"
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace nego;

TEST(WorkerPoolTest, SubmitReturnsResult) {
    WorkerPool pool(2);
    auto f = pool.submit([] { return 21 * 2; });
    EXPECT_EQ(f.get(), 42);
    EXPECT_EQ(pool.size(), 2u);
}

TEST(WorkerPoolTest, ZeroWorkersMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(WorkerPoolTest, MapPreservesOrder) {
    WorkerPool pool(4);
    std::vector<int> in;
    for (int i = 0; i < 100; ++i) in.push_back(i);

    auto out = pool.map(in, [](const int& v) { return v * v; });
    ASSERT_EQ(out.size(), in.size());
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(out[i], i * i);
    }
}

TEST(WorkerPoolTest, MapRethrowsJobException) {
    WorkerPool pool(3);
    std::atomic<int> ran{0};
    std::vector<int> in = {1, 2, 3, 4};

    EXPECT_THROW(pool.map(in, [&ran](const int& v) {
        ++ran;
        if (v == 3) throw std::invalid_argument("three");
        return v;
    }), std::invalid_argument);
    EXPECT_EQ(ran.load(), 4);
}

TEST(WorkerPoolTest, SubmitAfterShutdownThrows) {
    WorkerPool pool(1);
    pool.shutdown();
    EXPECT_THROW(pool.submit([] { return 1; }), std::runtime_error);
}
