#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include <moebius/stats/mixture_parameters.hpp>
#include <moebius/stats/normal_density.hpp>
#include <moebius/stats/overlap_rate.hpp>

using moebius::stats::DensityError;
using moebius::stats::MixtureParameters;
using moebius::stats::OverlapOptions;
using moebius::stats::OverlapPath;
using moebius::stats::overlapRate;
using moebius::stats::overlapRates;

namespace {

constexpr double kTol = 1e-4;

Eigen::MatrixXd mat2(double a, double b, double c, double d) {
    Eigen::MatrixXd m(2, 2);
    m << a, b, c, d;
    return m;
}

Eigen::VectorXd vec2(double x, double y) {
    Eigen::VectorXd v(2);
    v << x, y;
    return v;
}

MixtureParameters oneDimensional(std::vector<double> w, std::vector<double> m, std::vector<double> v) {
    MixtureParameters p;
    p.weights = std::move(w);
    for (const double x : m) p.means.push_back(Eigen::VectorXd::Constant(1, x));
    for (const double x : v) p.covariances.push_back(Eigen::MatrixXd::Constant(1, 1, x));
    return p;
}

MixtureParameters twoDimensional() {
    MixtureParameters p;
    p.weights = {0.52194, 0.47806};
    p.means = {vec2(1.1987, 1.1542), vec2(4.1592, 4.1487)};
    p.covariances = {mat2(1.9455, -9.1612e-04, -9.1612e-04, 1.9703), mat2(1.5160, 1.1011, 1.1011, 1.5178)};
    return p;
}

} // namespace

TEST(OverlapRate, two_dimensional_reference) {
    const auto rates = overlapRates(twoDimensional());
    ASSERT_EQ(rates.size(), 1u);
    EXPECT_NEAR(rates[0], 0.9205257521646449, kTol);
}

TEST(OverlapRate, one_dimensional_reference) {
    const auto p = oneDimensional({0.5, 0.5}, {5.0, 2.0}, {0.5, 0.5});
    EXPECT_NEAR(overlapRate(p), 0.21077243773848037, kTol);
}

TEST(OverlapRate, three_components_in_pair_order) {
    auto p = twoDimensional();
    p.weights.push_back(0.52194);
    p.means.push_back(vec2(4.1592, 4.1487));
    p.covariances.push_back(mat2(1.5160, 1.1009, 1.1009, 1.5178));

    const auto rates = overlapRates(p);
    ASSERT_EQ(rates.size(), 3u);
    EXPECT_NEAR(rates[0], 0.9205257521646449, kTol);
    EXPECT_NEAR(rates[1], 0.9464977842655895, kTol);
    // совпадающие средние: профиль постоянен, пиков нет
    EXPECT_DOUBLE_EQ(rates[2], 1.0);

    EXPECT_NEAR(overlapRate(p), (0.9205257521646449 + 0.9464977842655895 + 1.0) / 3.0, kTol);
}

TEST(OverlapRate, symmetric_in_component_order) {
    auto p = twoDimensional();
    auto q = p;
    std::swap(q.weights[0], q.weights[1]);
    std::swap(q.means[0], q.means[1]);
    std::swap(q.covariances[0], q.covariances[1]);

    EXPECT_NEAR(overlapRate(p), overlapRate(q), 1e-6);
}

TEST(OverlapRate, identical_components_fully_overlap) {
    const auto p = oneDimensional({0.3, 0.7}, {1.0, 1.0}, {2.0, 2.0});
    EXPECT_DOUBLE_EQ(overlapRate(p), 1.0);
}

TEST(OverlapRate, close_components_are_unimodal) {
    const auto p = oneDimensional({0.5, 0.5}, {0.0, 1.0}, {1.0, 1.0});
    EXPECT_DOUBLE_EQ(overlapRate(p), 1.0);
}

TEST(OverlapRate, separated_components_barely_overlap) {
    const auto p = oneDimensional({0.5, 0.5}, {0.0, 12.0}, {1.0, 1.0});
    const double rate = overlapRate(p);

    EXPECT_GT(rate, 0.0);
    EXPECT_LT(rate, 1e-6);
}

TEST(OverlapRate, fast_and_fallback_paths_agree) {
    const auto p = twoDimensional();
    const double fast = overlapRate(p, OverlapOptions{OverlapPath::Fast});
    const double fallback = overlapRate(p, OverlapOptions{OverlapPath::Fallback});

    EXPECT_NEAR(fast, fallback, 1e-9);
}

TEST(OverlapRate, singular_covariance_matches_projected_problem) {
    MixtureParameters p;
    p.weights = {0.5, 0.5};
    p.means = {vec2(0.0, 0.0), vec2(3.0, 3.0)};
    p.covariances = {mat2(1, 1, 1, 1), mat2(1, 1, 1, 1)};

    // та же смесь на прямой x = y: N(0, 2) и N(3 * sqrt(2), 2)
    const auto line = oneDimensional({0.5, 0.5}, {0.0, 3.0 * std::sqrt(2.0)}, {2.0, 2.0});

    const double rate = overlapRate(p);
    EXPECT_LT(rate, 1.0);
    EXPECT_NEAR(rate, overlapRate(line), 1e-9);

    EXPECT_THROW((void)overlapRate(p, OverlapOptions{OverlapPath::Fast}), DensityError);
}

TEST(OverlapRate, singular_covariance_away_from_origin_matches_projected_problem) {
    struct Case {
        double x;
        double y;
        double dx;
        double reference;
    };
    const std::vector<Case> cases = {
        {17.3, 42.1, 3.3, 0.510423},
        {117.3, -42.1, 5.0, 0.0878735},
    };

    for (const auto& c : cases) {
        MixtureParameters p;
        p.weights = {0.5, 0.5};
        p.means = {vec2(c.x, c.y), vec2(c.x + c.dx, c.y + c.dx)};
        p.covariances = {mat2(1, 1, 1, 1), mat2(1, 1, 1, 1)};

        const auto line = oneDimensional({0.5, 0.5}, {0.0, c.dx * std::sqrt(2.0)}, {2.0, 2.0});

        const double rate = overlapRate(p);
        EXPECT_NEAR(rate, overlapRate(line), 1e-6) << "mean (" << c.x << ", " << c.y << ")";
        EXPECT_NEAR(rate, c.reference, kTol) << "mean (" << c.x << ", " << c.y << ")";
    }
}

TEST(OverlapRate, negative_variance_is_a_density_error) {
    const auto p = oneDimensional({0.2, 0.2}, {6.0, 11.0}, {-0.006577556145946767, 0.5448831829968969});
    EXPECT_THROW((void)overlapRates(p), DensityError);
}

TEST(OverlapRate, fewer_than_two_components) {
    const auto p = oneDimensional({1.0}, {0.0}, {1.0});

    EXPECT_TRUE(overlapRates(p).empty());
    EXPECT_THROW((void)overlapRate(p), std::invalid_argument);
}

TEST(OverlapRate, invalid_inputs) {
    EXPECT_THROW((void)overlapRates(oneDimensional({0.0, 0.0}, {0.0, 3.0}, {1.0, 1.0})), std::invalid_argument);
    EXPECT_THROW((void)overlapRates(oneDimensional({0.5, 0.5}, {0.0}, {1.0, 1.0})), std::invalid_argument);
}

TEST(OverlapRate, from_flat_vector) {
    const auto rates = moebius::stats::overlapRatesFromFlat(2, 1, {0.5, 0.5, 5.0, 2.0, 0.5, 0.5});
    ASSERT_EQ(rates.size(), 1u);
    EXPECT_NEAR(rates[0], 0.21077243773848037, kTol);
}

TEST(OverlapProfile, peaks_and_saddles) {
    using moebius::stats::detail::scoreProfile;

    Eigen::VectorXd twoPeaks(5);
    twoPeaks << 0.0, 2.0, 1.0, 4.0, 0.0;
    EXPECT_DOUBLE_EQ(scoreProfile(twoPeaks), 0.5);

    Eigen::VectorXd onePeak(3);
    onePeak << 0.0, 1.0, 0.0;
    EXPECT_DOUBLE_EQ(scoreProfile(onePeak), 1.0);

    // плато между пиками не даёт седла
    Eigen::VectorXd plateau(6);
    plateau << 0.0, 1.0, 0.5, 0.5, 1.0, 0.0;
    EXPECT_DOUBLE_EQ(scoreProfile(plateau), 1.0);

    EXPECT_DOUBLE_EQ(scoreProfile(Eigen::VectorXd::Constant(10, 0.3)), 1.0);
}

TEST(OverlapProfile, geometry) {
    using moebius::stats::ProfileGeometry;

    const auto points = moebius::stats::detail::profilePoints(vec2(0.0, 0.0), vec2(1.0, 2.0));
    ASSERT_EQ(points.cols(), ProfileGeometry::kProfilePoints);
    EXPECT_NEAR(points(0, 0), -0.01, 1e-12);
    EXPECT_NEAR(points(1, 0), -0.02, 1e-12);
    EXPECT_NEAR(points(0, ProfileGeometry::kLeadSteps), 0.0, 1e-12);
    EXPECT_NEAR(points(1, ProfileGeometry::kLeadSteps + ProfileGeometry::kDivisions), 2.0, 1e-12);
}
