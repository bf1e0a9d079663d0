#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <moebius/evol/crossover.hpp>
#include <moebius/evol/mutation.hpp>

namespace moebius::evol {

/**
 * @brief Настройки внешнего эволюционного оптимизатора.
 *
 * Сеттеры проверяют значения и возвращают *this, что позволяет
 * собирать конфигурацию цепочкой:
 *
 * @code
 * auto cfg = EvolutionaryConfiguration{}
 *     .setPopulationSize(20)
 *     .setMutationProbability(0.5)
 *     .appendMutationType(mutation(mutator));
 * @endcode
 */
class EvolutionaryConfiguration {
   public:
    static constexpr std::size_t kDefaultPopulationSize = 10;
    static constexpr std::size_t kDefaultMaxPopulationSize = 55;
    static constexpr double kDefaultCrossoverProbability = 0.8;
    static constexpr double kDefaultMutationProbability = 0.9;

    /// @throws std::invalid_argument если size == 0.
    EvolutionaryConfiguration& setPopulationSize(std::size_t size) {
        if (size == 0) throw std::invalid_argument("EvolutionaryConfiguration: population size must be positive");
        populationSize_ = size;
        return *this;
    }

    /// @throws std::invalid_argument если size == 0.
    EvolutionaryConfiguration& setMaxPopulationSize(std::size_t size) {
        if (size == 0) throw std::invalid_argument("EvolutionaryConfiguration: max population size must be positive");
        maxPopulationSize_ = size;
        return *this;
    }

    /// @throws std::invalid_argument если p вне [0, 1].
    EvolutionaryConfiguration& setCrossoverProbability(double p) {
        requireProbability(p, "crossover probability");
        crossoverProbability_ = p;
        return *this;
    }

    /// @throws std::invalid_argument если p вне [0, 1].
    EvolutionaryConfiguration& setMutationProbability(double p) {
        requireProbability(p, "mutation probability");
        mutationProbability_ = p;
        return *this;
    }

    EvolutionaryConfiguration& setMutationTypes(std::vector<Mutation> types) {
        mutationTypes_ = std::move(types);
        return *this;
    }

    EvolutionaryConfiguration& appendMutationType(Mutation type) {
        mutationTypes_.push_back(std::move(type));
        return *this;
    }

    EvolutionaryConfiguration& setCrossoverTypes(std::vector<ExchangeCrossover> types) {
        crossoverTypes_ = std::move(types);
        return *this;
    }

    EvolutionaryConfiguration& appendCrossoverType(ExchangeCrossover type) {
        crossoverTypes_.push_back(type);
        return *this;
    }

    [[nodiscard]] std::size_t getPopulationSize() const noexcept { return populationSize_; }

    [[nodiscard]] std::size_t getMaxPopulationSize() const noexcept { return maxPopulationSize_; }

    [[nodiscard]] double getCrossoverProbability() const noexcept { return crossoverProbability_; }

    [[nodiscard]] double getMutationProbability() const noexcept { return mutationProbability_; }

    [[nodiscard]] const std::vector<Mutation>& getMutationTypes() const noexcept { return mutationTypes_; }

    [[nodiscard]] const std::vector<ExchangeCrossover>& getCrossoverTypes() const noexcept { return crossoverTypes_; }

   private:
    static void requireProbability(double p, const char* what) {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw std::invalid_argument(std::string("EvolutionaryConfiguration: ") + what + " must be within [0, 1]");
        }
    }

    std::size_t populationSize_{kDefaultPopulationSize};
    std::size_t maxPopulationSize_{kDefaultMaxPopulationSize};
    double crossoverProbability_{kDefaultCrossoverProbability};
    double mutationProbability_{kDefaultMutationProbability};
    std::vector<Mutation> mutationTypes_;
    std::vector<ExchangeCrossover> crossoverTypes_;
};

}  // namespace moebius::evol
