#pragma once

#include <algorithm>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <moebius/params/grid_value.hpp>
#include <moebius/stats/mixture_parameters.hpp>

namespace moebius::evol {

/// Источник случайности для операторов эволюционного поиска.
using RandomEngine = std::mt19937_64;

/// Поле параметров узла, с которым работает оператор.
enum class ParamField { Weights, Means, Covariances };

/**
 * @brief Узел графа-генератора: одна переменная (измерение) с одномерной смесью.
 *
 * Поля хранятся деревьями значений:
 *  - weights: [w_0, ..., w_{n-1}],
 *  - means: [[m_0], ..., [m_{n-1}]],
 *  - covariances: [[[v_0]], ..., [[v_{n-1}]]].
 */
struct GeneratorNode {
    static constexpr std::string_view kNamePrefix = "Comp_";

    std::string name;
    params::GridValue weights;
    params::GridValue means;
    params::GridValue covariances;

    /// Индексы родительских узлов в GeneratorModel.
    std::vector<std::size_t> parents;

    [[nodiscard]] params::GridValue& field(ParamField f) {
        switch (f) {
            case ParamField::Weights: return weights;
            case ParamField::Means: return means;
            case ParamField::Covariances: return covariances;
        }
        throw std::invalid_argument("GeneratorNode::field: unknown field");
    }

    [[nodiscard]] const params::GridValue& field(ParamField f) const {
        return const_cast<GeneratorNode&>(*this).field(f);
    }

    /// Число компонент смеси узла.
    [[nodiscard]] std::size_t components() const noexcept { return weights.size(); }

    /// Смесь узла в виде MixtureParameters.
    [[nodiscard]] stats::MixtureParameters toMixture() const {
        return stats::MixtureParameters::fromGridValue(params::GridValue{weights, means, covariances});
    }
};

/// Имя узла для i-го измерения: "Comp_<i>".
[[nodiscard]] inline std::string generatorNodeName(std::size_t i) {
    return std::string(GeneratorNode::kNamePrefix) + std::to_string(i);
}

/**
 * @brief Индекс измерения по имени узла.
 *
 * @throws std::invalid_argument если имя не вида "Comp_<число>".
 */
[[nodiscard]] inline std::size_t extractIndexFromNodeName(std::string_view name) {
    const auto prefix = GeneratorNode::kNamePrefix;
    if (name.size() <= prefix.size() || name.substr(0, prefix.size()) != prefix) {
        throw std::invalid_argument("extractIndexFromNodeName: unexpected node name '" + std::string(name) + "'");
    }

    std::size_t index = 0;
    for (const char c : name.substr(prefix.size())) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("extractIndexFromNodeName: unexpected node name '" + std::string(name) + "'");
        }
        index = index * 10 + static_cast<std::size_t>(c - '0');
    }
    return index;
}

/**
 * @brief Граф-генератор: узлы-переменные и рёбра "родитель -> потомок".
 *
 * Копируемое значение: операторы эволюционного поиска изменяют переданный
 * им граф и не имеют другого состояния.
 */
class GeneratorModel {
   public:
    GeneratorModel() = default;

    explicit GeneratorModel(std::vector<GeneratorNode> nodes) : nodes_(std::move(nodes)) {}

    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }

    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    [[nodiscard]] std::vector<GeneratorNode>& nodes() noexcept { return nodes_; }

    [[nodiscard]] const std::vector<GeneratorNode>& nodes() const noexcept { return nodes_; }

    /// Узел по имени или nullptr.
    [[nodiscard]] GeneratorNode* findNode(std::string_view name) noexcept {
        auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const GeneratorNode& n) { return n.name == name; });
        return it == nodes_.end() ? nullptr : &*it;
    }

    [[nodiscard]] const GeneratorNode* findNode(std::string_view name) const noexcept {
        auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const GeneratorNode& n) { return n.name == name; });
        return it == nodes_.end() ? nullptr : &*it;
    }

    /**
     * @brief Добавить ребро parent -> child.
     *
     * Повторное ребро игнорируется.
     *
     * @throws std::invalid_argument если индексы вне графа или совпадают.
     */
    void addEdge(std::size_t parent, std::size_t child) {
        if (parent >= nodes_.size() || child >= nodes_.size() || parent == child) {
            throw std::invalid_argument("GeneratorModel::addEdge: invalid edge " + std::to_string(parent) + " -> " +
                                        std::to_string(child));
        }

        auto& ps = nodes_[child].parents;
        if (std::find(ps.begin(), ps.end(), parent) == ps.end()) ps.push_back(parent);
    }

    /// Удалить все рёбра.
    void clearEdges() noexcept {
        for (auto& node : nodes_) node.parents.clear();
    }

   private:
    std::vector<GeneratorNode> nodes_;
};

/// Перестройка структуры графа.
class GraphShuffler {
   public:
    virtual ~GraphShuffler() = default;

    [[nodiscard]] virtual GeneratorModel shuffle(GeneratorModel graph, RandomEngine& rng) const = 0;
};

/**
 * @brief Случайная ациклическая структура G(n, p).
 *
 * Каждое ребро u -> v (u < v) появляется с вероятностью p; граф
 * перегенерируется, пока каждый узел не окажется задет хотя бы одним ребром.
 * Число попыток ограничено maxAttempts. Найденные рёбра заменяют прежних
 * родителей узлов.
 *
 * При p < kProbabilityEpsilon, а также для графа из менее чем двух узлов
 * граф возвращается без изменений.
 */
class ProbabilisticGraphShuffler final : public GraphShuffler {
   public:
    static constexpr double kProbabilityEpsilon = 0.01;
    static constexpr std::size_t kDefaultMaxAttempts = 1000;

    /// @throws std::invalid_argument если probOfEdges вне [0, 1] или maxAttempts == 0.
    explicit ProbabilisticGraphShuffler(double probOfEdges, std::size_t maxAttempts = kDefaultMaxAttempts)
        : probOfEdges_(probOfEdges), maxAttempts_(maxAttempts) {
        if (!(probOfEdges >= 0.0 && probOfEdges <= 1.0)) {
            throw std::invalid_argument("ProbabilisticGraphShuffler: probability of edges must be within [0, 1]");
        }
        if (maxAttempts == 0) {
            throw std::invalid_argument("ProbabilisticGraphShuffler: maxAttempts must be positive");
        }
    }

    [[nodiscard]] double getProbability() const noexcept { return probOfEdges_; }

    [[nodiscard]] std::size_t getMaxAttempts() const noexcept { return maxAttempts_; }

    /// @throws std::runtime_error если за maxAttempts попыток не нашлось графа, задевающего все узлы.
    [[nodiscard]] GeneratorModel shuffle(GeneratorModel graph, RandomEngine& rng) const override {
        const std::size_t n = graph.size();
        if (probOfEdges_ < kProbabilityEpsilon || n < 2) return graph;

        std::bernoulli_distribution edge(probOfEdges_);
        std::vector<std::pair<std::size_t, std::size_t>> edges;
        std::vector<bool> touched(n);

        for (std::size_t attempt = 0; attempt < maxAttempts_; ++attempt) {
            edges.clear();
            std::fill(touched.begin(), touched.end(), false);

            for (std::size_t u = 0; u < n; ++u) {
                for (std::size_t v = u + 1; v < n; ++v) {
                    if (!edge(rng)) continue;
                    edges.emplace_back(u, v);
                    touched[u] = touched[v] = true;
                }
            }

            if (std::all_of(touched.begin(), touched.end(), [](bool t) { return t; })) {
                graph.clearEdges();
                for (const auto& [u, v] : edges) graph.addEdge(u, v);
                return graph;
            }
        }

        throw std::runtime_error("ProbabilisticGraphShuffler: no structure touching all " + std::to_string(n) +
                                 " nodes after " + std::to_string(maxAttempts_) + " attempts");
    }

   private:
    double probOfEdges_;
    std::size_t maxAttempts_;
};

}  // namespace moebius::evol
