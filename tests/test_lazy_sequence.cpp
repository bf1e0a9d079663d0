#include <gtest/gtest.h>

#include <list>
#include <optional>
#include <vector>

#include <moebius/gen/grid_sequence.hpp>
#include <moebius/gen/lazy_sequence.hpp>
#include <moebius/params/numeric_range.hpp>
#include <moebius/search/grid_iterator.hpp>

using moebius::gen::ConstantSequence;
using moebius::gen::GridSequence;
using moebius::gen::IterableSequence;
using moebius::params::GridValue;
using moebius::params::NumericRange;
using moebius::search::GridIterator;

namespace {

// сумма координат каждой комбинации решётки
class CoordinateSum final : public GridSequence<double> {
   public:
    using GridSequence::GridSequence;

   protected:
    double supply(const GridValue& raw) override {
        double s = 0.0;
        for (const double v : raw.flatten()) s += v;
        return s;
    }
};

GridIterator binaryGrid() { return GridIterator::of({NumericRange::unit(0, 1), NumericRange::unit(0, 1)}); }

} // namespace

TEST(LazySequence, constant_unbounded_never_ends) {
    ConstantSequence<int> seq(7);
    EXPECT_FALSE(seq.isBounded());

    for (int i = 0; i < 100; ++i) EXPECT_EQ(seq.next().value_or(-1), 7);
    EXPECT_EQ(seq.getCount(), 100u);
}

TEST(LazySequence, bounded_sequence_stops_after_max_count) {
    ConstantSequence<int> seq(1, 3);
    EXPECT_TRUE(seq.isBounded());

    EXPECT_TRUE(seq.next().has_value());
    EXPECT_TRUE(seq.next().has_value());
    EXPECT_TRUE(seq.next().has_value());
    EXPECT_FALSE(seq.next().has_value());
    EXPECT_FALSE(seq.next().has_value());
}

TEST(LazySequence, reset_count_allows_another_batch) {
    auto seq = IterableSequence<int>::fromContainer({1, 2, 3, 4, 5}, 2);

    EXPECT_EQ(*seq.next(), 1);
    EXPECT_EQ(*seq.next(), 2);
    EXPECT_FALSE(seq.next().has_value());

    // источник не перематывается
    seq.resetCount();
    EXPECT_EQ(*seq.next(), 3);
    EXPECT_EQ(*seq.next(), 4);
    EXPECT_FALSE(seq.next().has_value());
}

TEST(LazySequence, finite_source_ends_before_bound) {
    auto seq = IterableSequence<int>::fromContainer({1, 2}, 10);

    EXPECT_EQ(*seq.next(), 1);
    EXPECT_EQ(*seq.next(), 2);
    EXPECT_FALSE(seq.next().has_value());
    EXPECT_EQ(seq.getCount(), 2u);
}

TEST(LazySequence, max_count_can_be_changed) {
    ConstantSequence<double> seq(0.5, 1);
    (void)seq.next();
    EXPECT_FALSE(seq.next().has_value());

    seq.setMaxCount(std::nullopt);
    EXPECT_FALSE(seq.getMaxCount().has_value());
    EXPECT_TRUE(seq.next().has_value());
}

TEST(LazySequence, from_range_and_callable) {
    const std::list<int> items{10, 20, 30};
    auto seq = IterableSequence<int>::fromRange(items.begin(), items.end());

    EXPECT_EQ(*seq.next(), 10);
    EXPECT_EQ(*seq.next(), 20);
    EXPECT_EQ(*seq.next(), 30);
    EXPECT_FALSE(seq.next().has_value());

    int n = 0;
    IterableSequence<int> squares([&n]() -> std::optional<int> { ++n; return n * n; }, 3);
    EXPECT_EQ(*squares.next(), 1);
    EXPECT_EQ(*squares.next(), 4);
    EXPECT_EQ(*squares.next(), 9);
    EXPECT_FALSE(squares.next().has_value());
}

TEST(GridSequence, values_follow_grid_enumeration) {
    CoordinateSum seq(binaryGrid());

    std::vector<double> got;
    while (auto v = seq.next()) got.push_back(*v);
    EXPECT_EQ(got, (std::vector<double>{0, 1, 1, 2}));
}

TEST(GridSequence, bound_and_restart) {
    CoordinateSum seq(binaryGrid(), 2);

    EXPECT_EQ(*seq.next(), 0.0);
    EXPECT_EQ(*seq.next(), 1.0);
    EXPECT_FALSE(seq.next().has_value());

    seq.resetCount();
    EXPECT_EQ(*seq.next(), 1.0);
    EXPECT_EQ(*seq.next(), 2.0);

    seq.resetCount();
    EXPECT_FALSE(seq.next().has_value());

    seq.restart();
    EXPECT_EQ(*seq.next(), 0.0);
}
