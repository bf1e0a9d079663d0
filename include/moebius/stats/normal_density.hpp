#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <Eigen/Dense>

namespace moebius::stats {

/// Невосстановимая численная ошибка вычисления плотности.
class DensityError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

namespace detail {

inline constexpr double kLog2Pi = 1.8378770664093454835606594728112;

template <typename Derived>
void requireFinite(const Eigen::DenseBase<Derived>& m, const char* what) {
    if (!m.allFinite()) throw DensityError(std::string(what) + " contains non-finite values");
}

inline void requireShape(const Eigen::VectorXd& mean, const Eigen::MatrixXd& cov) {
    if (cov.rows() != cov.cols() || cov.rows() != mean.size()) {
        throw DensityError("normal density: covariance is " + std::to_string(cov.rows()) + "x" +
                           std::to_string(cov.cols()) + ", mean has dimension " + std::to_string(mean.size()));
    }
}

}  // namespace detail

/**
 * @brief Проверка положительной определённости через разложение Холецкого.
 *
 * Матрица должна быть квадратной, конечной и симметричной (с относительным
 * допуском 1e-12), а LLT-разложение — успешным. Используется для выбора
 * быстрого пути вычисления overlap rate.
 */
[[nodiscard]] inline bool isPositiveDefinite(const Eigen::MatrixXd& m) {
    if (m.rows() != m.cols() || m.rows() == 0 || !m.allFinite()) return false;

    const double scale = m.cwiseAbs().maxCoeff();
    if (!((m - m.transpose()).cwiseAbs().maxCoeff() <= 1e-12 * scale)) return false;

    Eigen::LLT<Eigen::MatrixXd> llt(m);
    return llt.info() == Eigen::Success;
}

/**
 * @brief Плотность невырожденного многомерного нормального распределения.
 *
 * Ковариация раскладывается один раз (LLT), после чего плотность можно
 * вычислять как в отдельных точках, так и пакетно по столбцам матрицы.
 */
class NormalDensity {
   public:
    /// @throws DensityError если ковариация не положительно определена или формы не совпадают.
    NormalDensity(Eigen::VectorXd mean, const Eigen::MatrixXd& cov) : mean_(std::move(mean)) {
        detail::requireShape(mean_, cov);
        if (!isPositiveDefinite(cov)) throw DensityError("NormalDensity: covariance is not positive definite");

        llt_.compute(cov);
        const auto d = static_cast<double>(mean_.size());
        logNorm_ = -0.5 * (d * detail::kLog2Pi) - llt_.matrixLLT().diagonal().array().log().sum();
    }

    [[nodiscard]] Eigen::Index dimensions() const noexcept { return mean_.size(); }

    [[nodiscard]] double operator()(const Eigen::VectorXd& x) const {
        if (x.size() != mean_.size()) throw DensityError("NormalDensity: point dimension mismatch");

        const Eigen::VectorXd z = llt_.matrixL().solve(x - mean_);
        return std::exp(logNorm_ - 0.5 * z.squaredNorm());
    }

    /// Плотности во всех точках-столбцах @p points (d x N).
    [[nodiscard]] Eigen::VectorXd evaluate(const Eigen::MatrixXd& points) const {
        if (points.rows() != mean_.size()) throw DensityError("NormalDensity: point dimension mismatch");

        const Eigen::MatrixXd z = llt_.matrixL().solve(points.colwise() - mean_);
        return (logNorm_ - 0.5 * z.colwise().squaredNorm().array()).exp().matrix().transpose();
    }

   private:
    Eigen::VectorXd mean_;
    Eigen::LLT<Eigen::MatrixXd> llt_;
    double logNorm_{0.0};
};

/**
 * @brief Обобщённая плотность нормального распределения с вырожденной ковариацией.
 *
 * Ковариация раскладывается на собственные значения s. Значения не больше
 * eps = 1e6 * machine_eps * max|s| считаются нулевыми; ранг r равен числу
 * остальных. Плотность считается относительно меры на аффинном
 * подпространстве mean + span(собственные векторы ненулевых s):
 *
 *   log p(x) = -0.5 * (r * log(2*pi) + sum(log s_k) + sum((u_k^T (x - mean))^2 / s_k))
 *
 * Вне подпространства плотность равна 0. Точка считается лежащей вне него,
 * если норма проекции x - mean на ядро не меньше
 * 1e6 * machine_eps * max(1, |x|, |mean|, sqrt(max|s|)) (нормы по максимуму
 * модуля). Для невырожденной ковариации результат совпадает с обычной
 * плотностью.
 */
class GeneralizedNormalDensity {
   public:
    /// @throws DensityError если ковариация не положительно полуопределена, не конечна или формы не совпадают.
    GeneralizedNormalDensity(Eigen::VectorXd mean, const Eigen::MatrixXd& cov) : mean_(std::move(mean)) {
        detail::requireShape(mean_, cov);
        detail::requireFinite(cov, "GeneralizedNormalDensity: covariance");
        detail::requireFinite(mean_, "GeneralizedNormalDensity: mean");

        const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig(cov);
        if (eig.info() != Eigen::Success) throw DensityError("GeneralizedNormalDensity: eigen decomposition failed");

        const Eigen::VectorXd& s = eig.eigenvalues();
        const Eigen::MatrixXd& u = eig.eigenvectors();

        const double maxAbs = s.size() ? s.cwiseAbs().maxCoeff() : 0.0;
        const double eps = 1e6 * std::numeric_limits<double>::epsilon() * maxAbs;
        if (s.size() && s.minCoeff() < -eps) {
            throw DensityError("GeneralizedNormalDensity: covariance must be positive semi-definite");
        }

        Eigen::Index rank = 0;
        for (Eigen::Index k = 0; k < s.size(); ++k) rank += (s(k) > eps) ? 1 : 0;

        whiten_.resize(mean_.size(), rank);
        null_.resize(mean_.size(), s.size() - rank);

        double logPdet = 0.0;
        Eigen::Index a = 0;
        Eigen::Index b = 0;
        for (Eigen::Index k = 0; k < s.size(); ++k) {
            if (s(k) > eps) {
                whiten_.col(a++) = u.col(k) / std::sqrt(s(k));
                logPdet += std::log(s(k));
            } else {
                null_.col(b++) = u.col(k);
            }
        }

        rank_ = rank;
        scale_ = std::max({1.0, mean_.size() ? mean_.cwiseAbs().maxCoeff() : 0.0, std::sqrt(maxAbs)});
        logNorm_ = -0.5 * (static_cast<double>(rank) * detail::kLog2Pi + logPdet);
    }

    [[nodiscard]] Eigen::Index rank() const noexcept { return rank_; }

    [[nodiscard]] double operator()(const Eigen::VectorXd& x) const {
        if (x.size() != mean_.size()) throw DensityError("GeneralizedNormalDensity: point dimension mismatch");

        const Eigen::VectorXd dev = x - mean_;
        if (null_.cols() > 0 && (null_.transpose() * dev).norm() >= supportTolerance(x)) return 0.0;

        return std::exp(logNorm_ - 0.5 * (whiten_.transpose() * dev).squaredNorm());
    }

    /// Относительный множитель допуска принадлежности носителю.
    static constexpr double kSupportTolerance = 1e6 * std::numeric_limits<double>::epsilon();

    /// Допуск для точки @p x: растёт с масштабом координат и ковариации.
    [[nodiscard]] double supportTolerance(const Eigen::VectorXd& x) const {
        const double xAbs = x.size() ? x.cwiseAbs().maxCoeff() : 0.0;
        return kSupportTolerance * std::max(scale_, xAbs);
    }

   private:
    Eigen::VectorXd mean_;
    Eigen::MatrixXd whiten_;  // d x r
    Eigen::MatrixXd null_;    // d x (d - r)
    Eigen::Index rank_{0};
    double scale_{1.0};
    double logNorm_{0.0};
};

/**
 * @brief Взвешенная плотность одной компоненты в точке.
 *
 * Ковариация может быть вырожденной.
 *
 * @throws DensityError при несовпадении размерностей или не положительно полуопределённой ковариации.
 */
[[nodiscard]] inline double densityAt(const Eigen::VectorXd& point, double weight, const Eigen::VectorXd& mean,
                                      const Eigen::MatrixXd& cov) {
    return weight * GeneralizedNormalDensity(mean, cov)(point);
}

}  // namespace moebius::stats
