#pragma once

#include <functional>
#include <numeric>
#include <vector>

#include <moebius/evol/graph.hpp>
#include <moebius/stats/mixture_parameters.hpp>
#include <moebius/stats/normal_density.hpp>
#include <moebius/stats/overlap_rate.hpp>

namespace moebius::evol {

/// Значение метрики, если оценщик не вернул ни одного overlap rate.
inline constexpr double kEmptyScorePenalty = 100.0;

/// Overlap rate, подставляемый при невычислимой плотности.
inline constexpr double kInfinitelyLargeOlr = 100.0;

/// Оценщик графа: набор overlap rate, по которому считается метрика.
using OverlapScorer = std::function<std::vector<double>(const GeneratorModel&)>;

/**
 * @brief Overlap rate смесей всех узлов графа, подряд.
 *
 * Ковариации перед оценкой симметризуются. Если плотность какого-либо узла
 * невычислима (DensityError), результат равен {kInfinitelyLargeOlr}.
 */
[[nodiscard]] inline std::vector<double> nodeOverlapRates(const GeneratorModel& graph) {
    std::vector<double> out;
    try {
        for (const auto& node : graph.nodes()) {
            auto mixture = node.toMixture();
            for (auto& c : mixture.covariances) c = stats::symmetrized(c);

            const auto rates = stats::overlapRates(mixture);
            out.insert(out.end(), rates.begin(), rates.end());
        }
    } catch (const stats::DensityError&) {
        return {kInfinitelyLargeOlr};
    }
    return out;
}

/**
 * @brief Целевая функция эволюционного поиска (чем меньше, тем лучше).
 *
 * (mean(scorer(graph)) - targetOlr)^2, или kEmptyScorePenalty, если
 * оценщик ничего не вернул.
 */
[[nodiscard]] inline double optimisationMetric(const GeneratorModel& graph, double targetOlr,
                                               const OverlapScorer& scorer = nodeOverlapRates) {
    const auto rates = scorer(graph);
    if (rates.empty()) return kEmptyScorePenalty;

    const double mean = std::accumulate(rates.begin(), rates.end(), 0.0) / static_cast<double>(rates.size());
    const double d = mean - targetOlr;
    return d * d;
}

}  // namespace moebius::evol
