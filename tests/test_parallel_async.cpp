#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <vector>

#include <moebius/params/numeric_range.hpp>
#include <moebius/search/grid_iterator.hpp>
#include <moebius/search/parallel_async.hpp>

using moebius::params::GridValue;
using moebius::params::NumericRange;
using moebius::search::GridIterator;

TEST(ParallelAsync, preserves_order_and_reports_progress) {
    std::atomic<std::size_t> lastDone{0};

    auto grid = GridIterator::of({NumericRange::unit(10, 109)});
    auto out = moebius::search::parallelDrainAsync(
        grid.split(4),
        [](GridValue v) { return static_cast<int>(v[0].scalar() * 2); },
        8,
        [&](std::size_t done, std::size_t total) {
            EXPECT_EQ(total, 4u);
            lastDone.store(done, std::memory_order_relaxed);
        }
    );

    ASSERT_EQ(out.size(), 4u);

    std::vector<int> flat;
    for (const auto& part : out) flat.insert(flat.end(), part.begin(), part.end());

    ASSERT_EQ(flat.size(), 100u);
    EXPECT_EQ(flat.front(), 20);
    EXPECT_EQ(flat.back(), 218);
    for (std::size_t i = 1; i < flat.size(); ++i) EXPECT_EQ(flat[i], flat[i - 1] + 2);

    EXPECT_EQ(lastDone.load(std::memory_order_relaxed), 4u);
}

TEST(ParallelAsync, more_partitions_than_threads) {
    auto grid = GridIterator::of({NumericRange::unit(0, 9), NumericRange::unit(0, 1)});
    auto out = moebius::search::parallelDrainAsync(
        grid.split(10), [](GridValue v) { return v.flatten(); }, 3);

    ASSERT_EQ(out.size(), 10u);
    for (std::size_t p = 0; p < out.size(); ++p) {
        ASSERT_EQ(out[p].size(), 2u);
        EXPECT_DOUBLE_EQ(out[p][0][0], static_cast<double>(p));
    }
}

TEST(ParallelAsync, zero_threads_fall_back_to_one) {
    auto grid = GridIterator::of({NumericRange::unit(0, 3)});
    auto out = moebius::search::parallelDrainAsync(grid.split(2), [](GridValue) { return 1; }, 0);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].size() + out[1].size(), 4u);
}

TEST(ParallelAsync, no_partitions_no_results) {
    auto out = moebius::search::parallelDrainAsync(std::vector<GridIterator>{}, [](GridValue) { return 0; });
    EXPECT_TRUE(out.empty());
}

TEST(ParallelAsync, worker_exception_is_rethrown) {
    auto grid = GridIterator::of({NumericRange::unit(0, 7)});

    EXPECT_THROW(
        (void)moebius::search::parallelDrainAsync(
            grid.split(4),
            [](GridValue v) {
                if (v[0].scalar() == 5.0) throw std::runtime_error("boom");
                return 0;
            },
            2),
        std::runtime_error);
}
