#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include <moebius/params/grid_value.hpp>

namespace moebius::stats {

/**
 * @brief Параметры гауссовой смеси: веса, средние и ковариации компонент.
 *
 * Инварианты (проверяются validate()):
 *  - weights.size() == means.size() == covariances.size(),
 *  - все средние имеют одну размерность d, все ковариации размера d x d,
 *  - веса конечны и неотрицательны.
 *
 * Нормировка весов не требуется, но ожидается, что их сумма равна 1.
 */
struct MixtureParameters {
    std::vector<double> weights;
    std::vector<Eigen::VectorXd> means;
    std::vector<Eigen::MatrixXd> covariances;

    [[nodiscard]] std::size_t components() const noexcept { return weights.size(); }

    /// Размерность компонент (0 для пустой смеси).
    [[nodiscard]] std::size_t dimensions() const noexcept {
        return means.empty() ? 0 : static_cast<std::size_t>(means.front().size());
    }

    /// @throws std::invalid_argument при нарушении инвариантов.
    void validate() const {
        const std::size_t n = weights.size();
        if (means.size() != n || covariances.size() != n) {
            throw std::invalid_argument("MixtureParameters: got " + std::to_string(n) + " weights, " +
                                        std::to_string(means.size()) + " means and " +
                                        std::to_string(covariances.size()) + " covariances");
        }

        const auto d = static_cast<Eigen::Index>(dimensions());
        for (std::size_t i = 0; i < n; ++i) {
            if (!std::isfinite(weights[i]) || weights[i] < 0.0) {
                throw std::invalid_argument("MixtureParameters: weight " + std::to_string(i) +
                                            " must be finite and non-negative");
            }
            if (means[i].size() != d) {
                throw std::invalid_argument("MixtureParameters: mean " + std::to_string(i) +
                                            " has dimension " + std::to_string(means[i].size()) +
                                            ", expected " + std::to_string(d));
            }
            if (covariances[i].rows() != d || covariances[i].cols() != d) {
                throw std::invalid_argument("MixtureParameters: covariance " + std::to_string(i) + " must be " +
                                            std::to_string(d) + "x" + std::to_string(d));
            }
        }
    }

    /**
     * @brief Разобрать плоский вектор вида weights(n) | means(n*d) | covariances(n*d*d).
     *
     * Ковариации записаны построчно.
     *
     * @throws std::out_of_range если данных меньше, чем n + n*d + n*d*d.
     */
    [[nodiscard]] static MixtureParameters fromFlat(std::size_t components, std::size_t dims,
                                                    const std::vector<double>& data) {
        const std::size_t need = components * (1 + dims + dims * dims);
        if (data.size() < need) {
            throw std::out_of_range("MixtureParameters::fromFlat: expected at least " + std::to_string(need) +
                                    " values, got " + std::to_string(data.size()));
        }

        const auto d = static_cast<Eigen::Index>(dims);
        MixtureParameters out;
        std::size_t pos = 0;

        out.weights.assign(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(components));
        pos += components;

        for (std::size_t i = 0; i < components; ++i) {
            Eigen::VectorXd m(d);
            for (Eigen::Index k = 0; k < d; ++k) m(k) = data[pos++];
            out.means.push_back(std::move(m));
        }

        for (std::size_t i = 0; i < components; ++i) {
            Eigen::MatrixXd c(d, d);
            for (Eigen::Index r = 0; r < d; ++r) {
                for (Eigen::Index k = 0; k < d; ++k) c(r, k) = data[pos++];
            }
            out.covariances.push_back(std::move(c));
        }

        return out;
    }

    /**
     * @brief Разобрать снимок решётки [weights, means, covariances].
     *
     * Веса — список чисел (возможно вложенный, берутся листья по порядку).
     * Каждое среднее: список из d чисел или число при d == 1. Каждая
     * ковариация: d списков по d чисел (построчно), при d == 1 также
     * допускается число.
     *
     * @throws std::invalid_argument если форма снимка не соответствует смеси.
     */
    [[nodiscard]] static MixtureParameters fromGridValue(const params::GridValue& raw) {
        if (!raw.isList() || raw.size() != 3) {
            throw std::invalid_argument("MixtureParameters::fromGridValue: expected [weights, means, covariances]");
        }

        MixtureParameters out;
        out.weights = raw[0].flatten();

        const std::size_t n = out.weights.size();
        if (raw[1].size() != n || raw[2].size() != n) {
            throw std::invalid_argument("MixtureParameters::fromGridValue: " + std::to_string(n) +
                                        " weights, but means/covariances have " + std::to_string(raw[1].size()) +
                                        "/" + std::to_string(raw[2].size()) + " components");
        }

        for (std::size_t i = 0; i < n; ++i) {
            const auto m = raw[1][i].flatten();
            out.means.push_back(Eigen::Map<const Eigen::VectorXd>(m.data(), static_cast<Eigen::Index>(m.size())));
        }

        const auto d = static_cast<Eigen::Index>(out.dimensions());
        for (std::size_t i = 0; i < n; ++i) {
            const auto c = raw[2][i].flatten();
            if (static_cast<Eigen::Index>(c.size()) != d * d) {
                throw std::invalid_argument("MixtureParameters::fromGridValue: covariance " + std::to_string(i) +
                                            " has " + std::to_string(c.size()) + " entries, expected " +
                                            std::to_string(d * d));
            }
            out.covariances.push_back(
                Eigen::Map<const Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>(c.data(), d, d));
        }

        out.validate();
        return out;
    }
};

/// Отразить нижний треугольник матрицы на верхний.
[[nodiscard]] inline Eigen::MatrixXd symmetrized(const Eigen::MatrixXd& m) {
    Eigen::MatrixXd out = m;
    for (Eigen::Index i = 0; i < out.rows(); ++i) {
        for (Eigen::Index j = i + 1; j < out.cols(); ++j) out(i, j) = out(j, i);
    }
    return out;
}

}  // namespace moebius::stats
