#include <moebius/Version.hpp>

#include <moebius/evol/crossover.hpp>
#include <moebius/evol/graph.hpp>
#include <moebius/evol/initializer.hpp>
#include <moebius/evol/mutation.hpp>
#include <moebius/evol/objective.hpp>
#include <moebius/evol/parameters.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <utility>
#include <vector>

namespace ex {

using namespace moebius::evol;

struct Individual {
    GeneratorModel graph;
    double fitness{0.0};
};

EvolutionaryConfiguration makeConfiguration() {
    auto meansDelta = std::make_shared<RandomDeltaNodeMutator>(ParamField::Means, BoundSpec(Bounds{-1.0, 1.0}));
    auto covDelta = std::make_shared<RandomDeltaNodeMutator>(ParamField::Covariances, BoundSpec(Bounds{-0.5, 0.5}));
    auto covClamped = std::make_shared<ClampNodeDecoratedMutator>(ParamField::Covariances, covDelta,
                                                                  BoundSpec(Bounds{0.1, 5.0}));
    auto weights = std::make_shared<DirichletValuesSumTo1NodeMutator>(ParamField::Weights, 2.0);

    EvolutionaryConfiguration cfg;
    cfg.setPopulationSize(12)
        .setMaxPopulationSize(40)
        .setCrossoverProbability(0.7)
        .setMutationProbability(0.9)
        .appendMutationType(mutation(meansDelta))
        .appendMutationType(mutation(covClamped))
        .appendMutationType(mutation(weights))
        .appendCrossoverType(ExchangeCrossover(ParamField::Means, ExchangeCrossover::Scope::SingleComponent))
        .appendCrossoverType(ExchangeCrossover(ParamField::Weights, ExchangeCrossover::Scope::Whole));
    return cfg;
}

}  // namespace ex

int main() {
    using namespace ex;

    std::cout << "moebius " << moebius::version_major << '.' << moebius::version_minor << '.'
              << moebius::version_patch << "\n";

    constexpr double targetOlr = 0.5;
    constexpr std::size_t dims = 3;
    constexpr std::size_t components = 3;
    constexpr int generations = 30;

    try {
        RandomEngine rng(2024);
        const auto cfg = makeConfiguration();

        const GmmParametersInitializer init{
            std::make_shared<DirichletWeightsInitializer>(),
            std::make_shared<RandomMeansInitializer>(0, 10),
            std::make_shared<RandomCovariancesInitializer>(1, 3),
        };

        // --- Initial population ---
        std::vector<Individual> population;
        for (std::size_t i = 0; i < cfg.getPopulationSize(); ++i) {
            auto graph = createGeneratorModel(dims, components, init, rng);
            const double f = optimisationMetric(graph, targetOlr);
            population.push_back({std::move(graph), f});
        }

        std::bernoulli_distribution doCrossover(cfg.getCrossoverProbability());
        std::bernoulli_distribution doMutation(cfg.getMutationProbability());
        std::uniform_int_distribution<std::size_t> pickMutation(0, cfg.getMutationTypes().size() - 1);
        std::uniform_int_distribution<std::size_t> pickCrossover(0, cfg.getCrossoverTypes().size() - 1);

        auto byFitness = [](const Individual& a, const Individual& b) { return a.fitness < b.fitness; };

        // --- (mu + lambda) ---
        for (int gen = 0; gen < generations; ++gen) {
            std::vector<Individual> offspring;
            std::uniform_int_distribution<std::size_t> pickParent(0, population.size() - 1);

            while (population.size() + offspring.size() + 2 <= cfg.getMaxPopulationSize()) {
                auto a = population[pickParent(rng)].graph;
                auto b = population[pickParent(rng)].graph;

                if (doCrossover(rng)) cfg.getCrossoverTypes()[pickCrossover(rng)].apply(a, b, rng);
                if (doMutation(rng)) cfg.getMutationTypes()[pickMutation(rng)].apply(a, rng);
                if (doMutation(rng)) cfg.getMutationTypes()[pickMutation(rng)].apply(b, rng);

                for (auto* g : {&a, &b}) {
                    const double f = optimisationMetric(*g, targetOlr);
                    offspring.push_back({std::move(*g), f});
                }
            }

            population.insert(population.end(), std::make_move_iterator(offspring.begin()),
                              std::make_move_iterator(offspring.end()));
            std::sort(population.begin(), population.end(), byFitness);
            population.resize(cfg.getPopulationSize());

            std::cout << "gen " << std::setw(2) << gen << "  best metric " << std::scientific
                      << std::setprecision(3) << population.front().fitness << "\n";
        }

        // --- Best individual: structure and mean overlap rates ---
        const auto best = ProbabilisticGraphShuffler(0.4).shuffle(population.front().graph, rng);
        const auto rates = nodeOverlapRates(best);

        std::cout << std::defaultfloat << std::setprecision(6);
        for (std::size_t i = 0; i < best.size(); ++i) {
            const auto& node = best.nodes()[i];
            std::cout << node.name << ": weights " << node.weights << " means " << node.means << " parents [";
            for (std::size_t k = 0; k < node.parents.size(); ++k) {
                std::cout << (k ? ", " : "") << generatorNodeName(node.parents[k]);
            }
            std::cout << "]\n";
        }
        std::cout << "overlap rates:";
        for (const double r : rates) std::cout << ' ' << r;
        std::cout << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
