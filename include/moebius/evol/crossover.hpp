#pragma once

#include <cstddef>
#include <random>
#include <stdexcept>
#include <utility>

#include <moebius/evol/graph.hpp>

namespace moebius::evol {

/**
 * @brief Кроссовер обменом поля между случайными узлами двух графов.
 *
 * Scope::Whole меняет поле целиком, Scope::SingleComponent меняет только
 * значение одной случайной компоненты (индекс в [0, n), n равно числу
 * компонент узла первого графа). Изменяются только два выбранных узла.
 */
class ExchangeCrossover {
   public:
    enum class Scope { Whole, SingleComponent };

    ExchangeCrossover(ParamField field, Scope scope) : field_(field), scope_(scope) {}

    [[nodiscard]] ParamField getField() const noexcept { return field_; }

    [[nodiscard]] Scope getScope() const noexcept { return scope_; }

    /// @throws std::invalid_argument если граф пуст или у узлов не хватает компонент.
    void apply(GeneratorModel& first, GeneratorModel& second, RandomEngine& rng) const {
        if (first.empty() || second.empty()) throw std::invalid_argument("ExchangeCrossover: graphs must have nodes");

        auto& a = first.nodes()[std::uniform_int_distribution<std::size_t>(0, first.size() - 1)(rng)];
        auto& b = second.nodes()[std::uniform_int_distribution<std::size_t>(0, second.size() - 1)(rng)];

        auto& va = a.field(field_);
        auto& vb = b.field(field_);

        if (scope_ == Scope::Whole) {
            std::swap(va, vb);
            return;
        }

        const std::size_t n = a.components();
        if (n == 0 || !va.isList() || !vb.isList() || va.size() < n || vb.size() < n) {
            throw std::invalid_argument("ExchangeCrossover: nodes do not have enough components to exchange");
        }

        const std::size_t idx = std::uniform_int_distribution<std::size_t>(0, n - 1)(rng);
        std::swap(va[idx], vb[idx]);
    }

   private:
    ParamField field_;
    Scope scope_;
};

}  // namespace moebius::evol
