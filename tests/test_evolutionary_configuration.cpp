#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include <moebius/evol/crossover.hpp>
#include <moebius/evol/mutation.hpp>
#include <moebius/evol/parameters.hpp>

using moebius::evol::EvolutionaryConfiguration;
using moebius::evol::ExchangeCrossover;
using moebius::evol::ParamField;

TEST(EvolutionaryConfiguration, defaults) {
    const EvolutionaryConfiguration cfg;

    EXPECT_EQ(cfg.getPopulationSize(), 10u);
    EXPECT_EQ(cfg.getMaxPopulationSize(), 55u);
    EXPECT_DOUBLE_EQ(cfg.getCrossoverProbability(), 0.8);
    EXPECT_DOUBLE_EQ(cfg.getMutationProbability(), 0.9);
    EXPECT_TRUE(cfg.getMutationTypes().empty());
    EXPECT_TRUE(cfg.getCrossoverTypes().empty());
}

TEST(EvolutionaryConfiguration, chained_setters) {
    auto mutator = std::make_shared<moebius::evol::RandomValuesSumTo1NodeMutator>(ParamField::Weights);

    EvolutionaryConfiguration cfg;
    cfg.setPopulationSize(20)
        .setMaxPopulationSize(100)
        .setCrossoverProbability(0.0)
        .setMutationProbability(1.0)
        .appendMutationType(moebius::evol::mutation(mutator))
        .appendMutationType(moebius::evol::mutation(mutator))
        .appendCrossoverType(ExchangeCrossover(ParamField::Means, ExchangeCrossover::Scope::Whole));

    EXPECT_EQ(cfg.getPopulationSize(), 20u);
    EXPECT_EQ(cfg.getMaxPopulationSize(), 100u);
    EXPECT_DOUBLE_EQ(cfg.getCrossoverProbability(), 0.0);
    EXPECT_DOUBLE_EQ(cfg.getMutationProbability(), 1.0);
    EXPECT_EQ(cfg.getMutationTypes().size(), 2u);
    ASSERT_EQ(cfg.getCrossoverTypes().size(), 1u);
    EXPECT_EQ(cfg.getCrossoverTypes()[0].getScope(), ExchangeCrossover::Scope::Whole);

    cfg.setMutationTypes({});
    EXPECT_TRUE(cfg.getMutationTypes().empty());
    cfg.setCrossoverTypes({ExchangeCrossover(ParamField::Weights, ExchangeCrossover::Scope::SingleComponent)});
    EXPECT_EQ(cfg.getCrossoverTypes()[0].getField(), ParamField::Weights);
}

TEST(EvolutionaryConfiguration, invalid_values_are_rejected) {
    EvolutionaryConfiguration cfg;

    EXPECT_THROW(cfg.setPopulationSize(0), std::invalid_argument);
    EXPECT_THROW(cfg.setMaxPopulationSize(0), std::invalid_argument);
    EXPECT_THROW(cfg.setCrossoverProbability(-0.1), std::invalid_argument);
    EXPECT_THROW(cfg.setMutationProbability(1.01), std::invalid_argument);

    // неудачный сеттер не меняет значение
    EXPECT_EQ(cfg.getPopulationSize(), 10u);
    EXPECT_DOUBLE_EQ(cfg.getMutationProbability(), 0.9);
}
