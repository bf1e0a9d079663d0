#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <moebius/evol/graph.hpp>
#include <moebius/params/grid_value.hpp>

namespace moebius::evol {

namespace detail {

/// Выборка из Dir(alpha, ..., alpha) через нормировку гамма-величин.
inline std::vector<double> dirichlet(std::size_t n, double alpha, RandomEngine& rng) {
    std::vector<double> out(n);
    if (n == 0) return out;

    std::gamma_distribution<double> gamma(alpha, 1.0);
    double sum = 0.0;
    for (auto& v : out) {
        v = gamma(rng);
        sum += v;
    }
    // все гамма-величины могли округлиться в 0 при очень малом alpha
    if (!(sum > 0.0)) {
        out.assign(n, 0.0);
        out[std::uniform_int_distribution<std::size_t>(0, n - 1)(rng)] = 1.0;
        return out;
    }
    for (auto& v : out) v /= sum;
    return out;
}

inline void requireOrdered(double min, double max, const char* who) {
    if (min > max) throw std::invalid_argument(std::string(who) + ": min must be less or equal than max");
}

}  // namespace detail

class WeightsInitializer {
   public:
    virtual ~WeightsInitializer() = default;

    /// Начальные веса [w_0, ..., w_{n-1}] узла @p nodeName.
    [[nodiscard]] virtual params::GridValue createInitialWeights(const std::string& nodeName, std::size_t nComp,
                                                                 RandomEngine& rng) const = 0;
};

/// Равные веса 1/n.
class AvgWeightsInitializer final : public WeightsInitializer {
   public:
    params::GridValue createInitialWeights(const std::string&, std::size_t nComp, RandomEngine&) const override {
        return params::GridValue::fromScalars(std::vector<double>(nComp, 1.0 / static_cast<double>(nComp)));
    }
};

/// Случайные U(0, 1) веса, нормированные к сумме 1.
class RandomWeightsInitializer final : public WeightsInitializer {
   public:
    params::GridValue createInitialWeights(const std::string&, std::size_t nComp, RandomEngine& rng) const override {
        std::uniform_real_distribution<double> u(0.0, 1.0);

        std::vector<double> w(nComp);
        double sum = 0.0;
        for (auto& v : w) {
            v = u(rng);
            sum += v;
        }
        for (auto& v : w) v /= sum;
        return params::GridValue::fromScalars(w);
    }
};

/// Веса из распределения Дирихле с параметром multiplier для каждой компоненты.
class DirichletWeightsInitializer final : public WeightsInitializer {
   public:
    explicit DirichletWeightsInitializer(double multiplier = 1.0) : multiplier_(multiplier) {
        if (!(multiplier > 0.0)) throw std::invalid_argument("DirichletWeightsInitializer: multiplier must be positive");
    }

    params::GridValue createInitialWeights(const std::string&, std::size_t nComp, RandomEngine& rng) const override {
        return params::GridValue::fromScalars(detail::dirichlet(nComp, multiplier_, rng));
    }

   private:
    double multiplier_;
};

class MeansInitializer {
   public:
    virtual ~MeansInitializer() = default;

    /// Начальные средние [[m_0], ..., [m_{n-1}]] узла @p nodeName.
    [[nodiscard]] virtual params::GridValue createInitialMeans(const std::string& nodeName, std::size_t nComp,
                                                               RandomEngine& rng) const = 0;
};

/// Целые средние, равномерно из [min, max].
class RandomMeansInitializer final : public MeansInitializer {
   public:
    RandomMeansInitializer(int min, int max) : min_(min), max_(max) {
        detail::requireOrdered(min, max, "RandomMeansInitializer");
    }

    params::GridValue createInitialMeans(const std::string&, std::size_t nComp, RandomEngine& rng) const override {
        std::uniform_int_distribution<int> u(min_, max_);

        params::GridValue::list_type out;
        for (std::size_t i = 0; i < nComp; ++i) out.push_back(params::GridValue::fromScalars({double(u(rng))}));
        return params::GridValue(std::move(out));
    }

   private:
    int min_;
    int max_;
};

/// Средние, заданные заранее для каждого имени узла.
class ConstantMeansInitializer final : public MeansInitializer {
   public:
    explicit ConstantMeansInitializer(std::map<std::string, params::GridValue> means) : means_(std::move(means)) {}

    /// @throws std::invalid_argument если для узла нет средних.
    params::GridValue createInitialMeans(const std::string& nodeName, std::size_t, RandomEngine&) const override {
        const auto it = means_.find(nodeName);
        if (it == means_.end()) throw std::invalid_argument("ConstantMeansInitializer: no means for " + nodeName);
        return it->second;
    }

   private:
    std::map<std::string, params::GridValue> means_;
};

class CovariancesInitializer {
   public:
    virtual ~CovariancesInitializer() = default;

    /// Начальные ковариации [[[v_0]], ..., [[v_{n-1}]]] узла @p nodeName.
    [[nodiscard]] virtual params::GridValue createInitialCovariances(const std::string& nodeName, std::size_t nComp,
                                                                     RandomEngine& rng) const = 0;
};

/// Целые дисперсии, равномерно из [min, max].
class RandomCovariancesInitializer final : public CovariancesInitializer {
   public:
    RandomCovariancesInitializer(int min, int max) : min_(min), max_(max) {
        detail::requireOrdered(min, max, "RandomCovariancesInitializer");
    }

    params::GridValue createInitialCovariances(const std::string&, std::size_t nComp,
                                               RandomEngine& rng) const override {
        std::uniform_int_distribution<int> u(min_, max_);

        params::GridValue::list_type out;
        for (std::size_t i = 0; i < nComp; ++i) {
            params::GridValue row = params::GridValue::fromScalars({double(u(rng))});
            out.push_back(params::GridValue(params::GridValue::list_type{row}));
        }
        return params::GridValue(std::move(out));
    }

   private:
    int min_;
    int max_;
};

/// Ковариации, заданные заранее для каждого имени узла.
class ConstantCovariancesInitializer final : public CovariancesInitializer {
   public:
    explicit ConstantCovariancesInitializer(std::map<std::string, params::GridValue> covariances)
        : covariances_(std::move(covariances)) {}

    /// @throws std::invalid_argument если для узла нет ковариаций.
    params::GridValue createInitialCovariances(const std::string& nodeName, std::size_t,
                                               RandomEngine&) const override {
        const auto it = covariances_.find(nodeName);
        if (it == covariances_.end()) {
            throw std::invalid_argument("ConstantCovariancesInitializer: no covariances for " + nodeName);
        }
        return it->second;
    }

   private:
    std::map<std::string, params::GridValue> covariances_;
};

/// Набор инициализаторов параметров смеси.
struct GmmParametersInitializer {
    std::shared_ptr<const WeightsInitializer> weights;
    std::shared_ptr<const MeansInitializer> means;
    std::shared_ptr<const CovariancesInitializer> covariances;
};

/**
 * @brief Граф из @p nDim узлов "Comp_i" без рёбер с начальными параметрами смесей.
 *
 * @throws std::invalid_argument если не задан какой-либо инициализатор или nComp == 0.
 */
[[nodiscard]] inline GeneratorModel createGeneratorModel(std::size_t nDim, std::size_t nComp,
                                                         const GmmParametersInitializer& initializer,
                                                         RandomEngine& rng) {
    if (!initializer.weights || !initializer.means || !initializer.covariances) {
        throw std::invalid_argument("createGeneratorModel: every initializer must be set");
    }
    if (nComp == 0) throw std::invalid_argument("createGeneratorModel: at least one component is required");

    std::vector<GeneratorNode> nodes;
    nodes.reserve(nDim);
    for (std::size_t i = 0; i < nDim; ++i) {
        GeneratorNode node;
        node.name = generatorNodeName(i);
        node.weights = initializer.weights->createInitialWeights(node.name, nComp, rng);
        node.means = initializer.means->createInitialMeans(node.name, nComp, rng);
        node.covariances = initializer.covariances->createInitialCovariances(node.name, nComp, rng);
        nodes.push_back(std::move(node));
    }
    return GeneratorModel(std::move(nodes));
}

}  // namespace moebius::evol
