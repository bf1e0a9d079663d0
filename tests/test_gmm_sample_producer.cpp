#include <gtest/gtest.h>

#include <vector>

#include <moebius/gen/gmm_sample_producer.hpp>
#include <moebius/params/numeric_range.hpp>
#include <moebius/search/constrained_grid_iterator.hpp>
#include <moebius/search/grid_iterator.hpp>
#include <moebius/stats/normal_density.hpp>

using moebius::gen::GmmSample;
using moebius::gen::GmmSampleProducer;
using moebius::params::NumericRange;
using moebius::search::ConstrainedGridIterator;
using moebius::search::GridIterator;

namespace {

constexpr double kTol = 1e-4;
constexpr double kSeparatedRate = 0.21077243773848037;

// одномерные смеси из двух компонент, второе среднее пробегает 2, 3, 4
GridIterator meanSweep() {
    return GridIterator::of({
        {NumericRange::constant(0.5), NumericRange::constant(0.5)},
        {NumericRange::constant(5), NumericRange::unit(2, 4)},
        {NumericRange::constant(0.5), NumericRange::constant(0.5)},
    });
}

template <class Producer>
std::vector<GmmSample> drain(Producer& p) {
    std::vector<GmmSample> out;
    while (auto s = p.next()) out.push_back(std::move(*s));
    return out;
}

} // namespace

TEST(GmmSampleProducer, labels_every_grid_combination) {
    GmmSampleProducer producer(meanSweep());
    const auto samples = drain(producer);

    ASSERT_EQ(samples.size(), 3u);
    EXPECT_DOUBLE_EQ(samples[0].parameters.means[1](0), 2.0);
    EXPECT_DOUBLE_EQ(samples[2].parameters.means[1](0), 4.0);

    // средние на расстоянии 3: два пика
    EXPECT_NEAR(samples[0].overlapRate, kSeparatedRate, kTol);
    // расстояние 2: пики ближе, седло выше
    EXPECT_GT(samples[1].overlapRate, samples[0].overlapRate);
    EXPECT_LT(samples[1].overlapRate, 1.0);
    // расстояние 1: одномодальная смесь
    EXPECT_DOUBLE_EQ(samples[2].overlapRate, 1.0);
}

TEST(GmmSampleProducer, respects_max_count) {
    GmmSampleProducer producer(meanSweep(), {}, 2);

    EXPECT_EQ(drain(producer).size(), 2u);
    EXPECT_EQ(producer.getCount(), 2u);
}

TEST(GmmSampleProducer, constrained_weights_nested_in_grid) {
    auto weights = ConstrainedGridIterator::create(
        GridIterator::of({NumericRange(0.25, 0.75, 0.25), NumericRange(0.25, 0.75, 0.25)}), 1.0);
    ASSERT_TRUE(weights.has_value());

    GmmSampleProducer producer(GridIterator::of({
        *weights,
        {NumericRange::constant(5), NumericRange::constant(2)},
        {NumericRange::constant(0.5), NumericRange::constant(0.5)},
    }));
    const auto samples = drain(producer);

    ASSERT_EQ(samples.size(), 3u);
    for (const auto& s : samples) {
        EXPECT_DOUBLE_EQ(s.parameters.weights[0] + s.parameters.weights[1], 1.0);
    }
    EXPECT_DOUBLE_EQ(samples[1].parameters.weights[0], 0.5);
    EXPECT_NEAR(samples[1].overlapRate, kSeparatedRate, kTol);
}

TEST(GmmSampleProducer, split_partitions_give_same_samples) {
    GmmSampleProducer whole(meanSweep());
    const auto expected = drain(whole);

    auto parts = GmmSampleProducer(meanSweep()).split(3);
    ASSERT_EQ(parts.size(), 3u);

    std::vector<double> rates;
    for (auto& p : parts) {
        EXPECT_FALSE(p.isBounded());
        for (const auto& s : drain(p)) rates.push_back(s.overlapRate);
    }

    ASSERT_EQ(rates.size(), expected.size());
    for (std::size_t i = 0; i < rates.size(); ++i) EXPECT_DOUBLE_EQ(rates[i], expected[i].overlapRate);
}

TEST(GmmSampleProducer, driven_by_constrained_enumerator) {
    // сумма всех листьев равна 9 только при втором среднем 2
    auto it = ConstrainedGridIterator::create(meanSweep(), 9.0);
    ASSERT_TRUE(it.has_value());

    GmmSampleProducer<ConstrainedGridIterator> producer(std::move(*it));
    auto parts = std::move(producer).split(4);
    ASSERT_EQ(parts.size(), 1u);

    const auto samples = drain(parts[0]);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_NEAR(samples[0].overlapRate, kSeparatedRate, kTol);
}

TEST(GmmSampleProducer, density_error_reaches_caller) {
    GmmSampleProducer producer(GridIterator::of({
        {NumericRange::constant(0.2), NumericRange::constant(0.2)},
        {NumericRange::constant(6), NumericRange::constant(11)},
        {NumericRange::constant(-0.006577556145946767), NumericRange::constant(0.5448831829968969)},
    }));

    EXPECT_THROW((void)producer.next(), moebius::stats::DensityError);
}

TEST(GmmSampleProducer, keeps_overlap_options) {
    GmmSampleProducer producer(meanSweep(), moebius::stats::OverlapOptions{moebius::stats::OverlapPath::Fallback});
    EXPECT_EQ(producer.getOptions().path, moebius::stats::OverlapPath::Fallback);

    const auto samples = drain(producer);
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_NEAR(samples[0].overlapRate, kSeparatedRate, kTol);
}
