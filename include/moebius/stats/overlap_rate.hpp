#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include <moebius/stats/mixture_parameters.hpp>
#include <moebius/stats/normal_density.hpp>

namespace moebius::stats {

/// Путь вычисления плотностей смеси.
enum class OverlapPath {
    Automatic,  ///< Fast, если все ковариации положительно определены, иначе Fallback.
    Fast,       ///< Пакетное вычисление через Холецкого; при вырожденной ковариации DensityError.
    Fallback    ///< Поточечное обобщённое вычисление, допускает вырожденные ковариации.
};

struct OverlapOptions {
    OverlapPath path = OverlapPath::Automatic;
};

/**
 * @brief Геометрия профиля плотности между средними двух компонент.
 *
 * Отрезок между средними делится на kDivisions шагов; профиль начинается
 * за kLeadSteps шагов до первого среднего и содержит kProfilePoints точек.
 */
struct ProfileGeometry {
    static constexpr int kDivisions = 1000;
    static constexpr int kLeadSteps = 10;
    static constexpr int kProfilePoints = 1031;
};

namespace detail {

/// Точки профиля (столбцы d x kProfilePoints) на прямой через @p from и @p to.
[[nodiscard]] inline Eigen::MatrixXd profilePoints(const Eigen::VectorXd& from, const Eigen::VectorXd& to) {
    const Eigen::VectorXd delta = (to - from) / static_cast<double>(ProfileGeometry::kDivisions);

    Eigen::MatrixXd points(from.size(), ProfileGeometry::kProfilePoints);
    Eigen::VectorXd p = from - static_cast<double>(ProfileGeometry::kLeadSteps) * delta;
    points.col(0) = p;

    // p_k = p_{k-1} + delta, накопительно
    for (Eigen::Index k = 1; k < points.cols(); ++k) {
        p += delta;
        points.col(k) = p;
    }
    return points;
}

/**
 * @brief Оценка перекрытия по профилю плотности.
 *
 * Внутренняя точка — пик, если плотность строго больше обеих соседних, и
 * седло, если строго меньше. Один пик (или ни одного пика, или ни одного
 * седла) даёт 1; иначе значение первого седла, делённое на минимальный пик.
 */
[[nodiscard]] inline double scoreProfile(const Eigen::VectorXd& pdf) {
    std::vector<double> peaks;
    std::vector<double> saddles;

    for (Eigen::Index k = 1; k + 1 < pdf.size(); ++k) {
        const double prev = pdf(k - 1);
        const double cur = pdf(k);
        const double next = pdf(k + 1);

        if (cur > prev && cur > next) peaks.push_back(cur);
        if (cur < prev && cur < next) saddles.push_back(cur);
    }

    if (peaks.size() <= 1 || saddles.empty()) return 1.0;
    return saddles.front() / *std::min_element(peaks.begin(), peaks.end());
}

inline bool allPositiveDefinite(const std::vector<Eigen::MatrixXd>& covariances) {
    return std::all_of(covariances.begin(), covariances.end(),
                       [](const Eigen::MatrixXd& c) { return isPositiveDefinite(c); });
}

}  // namespace detail

/**
 * @brief Overlap rate каждой пары компонент смеси.
 *
 * Для пары (i, j) веса перенормируются (w_i / (w_i + w_j) и остаток),
 * плотность смеси двух компонент вычисляется в точках профиля между
 * средними, и профиль оценивается через detail::scoreProfile.
 *
 * @return Оценки в порядке (0,1), (0,2), ..., (n-2,n-1); пустой вектор при n < 2.
 *
 * @throws std::invalid_argument если параметры несогласованы или веса пары в сумме дают 0.
 * @throws DensityError если ковариация не положительно полуопределена
 *         (или не положительно определена при OverlapPath::Fast).
 */
[[nodiscard]] inline std::vector<double> overlapRates(const MixtureParameters& params,
                                                      const OverlapOptions& options = {}) {
    params.validate();

    const std::size_t n = params.components();
    std::vector<double> out;
    if (n < 2) return out;

    if (params.dimensions() == 0) throw std::invalid_argument("overlapRates: components must have dimension >= 1");

    bool fast = false;
    switch (options.path) {
        case OverlapPath::Automatic:
            fast = detail::allPositiveDefinite(params.covariances);
            break;
        case OverlapPath::Fast:
            if (!detail::allPositiveDefinite(params.covariances)) {
                throw DensityError("overlapRates: fast path requires positive definite covariances");
            }
            fast = true;
            break;
        case OverlapPath::Fallback:
            break;
    }

    std::vector<NormalDensity> normal;
    std::vector<GeneralizedNormalDensity> generalized;
    for (std::size_t i = 0; i < n; ++i) {
        if (fast) {
            normal.emplace_back(params.means[i], params.covariances[i]);
        } else {
            generalized.emplace_back(params.means[i], params.covariances[i]);
        }
    }

    out.reserve(n * (n - 1) / 2);
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            const double sum = params.weights[i] + params.weights[j];
            if (!(sum > 0.0)) {
                throw std::invalid_argument("overlapRates: weights of components " + std::to_string(i) + " and " +
                                            std::to_string(j) + " sum to zero");
            }
            const double w1 = params.weights[i] / sum;
            const double w2 = 1.0 - w1;

            const Eigen::MatrixXd points = detail::profilePoints(params.means[i], params.means[j]);
            Eigen::VectorXd pdf(points.cols());

            if (fast) {
                pdf = w1 * normal[i].evaluate(points) + w2 * normal[j].evaluate(points);
            } else {
                for (Eigen::Index k = 0; k < points.cols(); ++k) {
                    const Eigen::VectorXd x = points.col(k);
                    pdf(k) = w1 * generalized[i](x) + w2 * generalized[j](x);
                }
            }

            out.push_back(detail::scoreProfile(pdf));
        }
    }

    return out;
}

/**
 * @brief Overlap rate всей смеси: среднее по всем парам компонент.
 *
 * @throws std::invalid_argument если компонент меньше двух.
 */
[[nodiscard]] inline double overlapRate(const MixtureParameters& params, const OverlapOptions& options = {}) {
    const auto rates = overlapRates(params, options);
    if (rates.empty()) throw std::invalid_argument("overlapRate: at least two components are required");

    return std::accumulate(rates.begin(), rates.end(), 0.0) / static_cast<double>(rates.size());
}

/// overlapRates для плоского вектора (см. MixtureParameters::fromFlat).
[[nodiscard]] inline std::vector<double> overlapRatesFromFlat(std::size_t components, std::size_t dims,
                                                              const std::vector<double>& data,
                                                              const OverlapOptions& options = {}) {
    return overlapRates(MixtureParameters::fromFlat(components, dims, data), options);
}

}  // namespace moebius::stats
