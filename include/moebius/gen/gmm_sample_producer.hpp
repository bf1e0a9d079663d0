#pragma once

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <moebius/gen/grid_sequence.hpp>
#include <moebius/params/grid_value.hpp>
#include <moebius/search/grid_enumerator.hpp>
#include <moebius/search/grid_iterator.hpp>
#include <moebius/stats/mixture_parameters.hpp>
#include <moebius/stats/overlap_rate.hpp>

namespace moebius::gen {

/// Размеченный образец: параметры смеси и их overlap rate.
struct GmmSample {
    stats::MixtureParameters parameters;
    double overlapRate{0.0};
};

/**
 * @brief Генератор размеченных смесей по решётке параметров.
 *
 * Каждая комбинация решётки имеет вид [weights, means, covariances]
 * (см. MixtureParameters::fromGridValue) и превращается в пару
 * (параметры, overlapRate(параметры)).
 *
 * @code
 * auto weights = ConstrainedGridIterator::create(
 *     GridIterator::of({NumericRange(0.1, 0.9, 0.1), NumericRange(0.1, 0.9, 0.1)}), 1.0);
 * auto grid = GridIterator::of({
 *     *weights,                                                       // weights
 *     {NumericRange::constant(0), NumericRange(1, 5, 0.5)},           // means
 *     {NumericRange::constant(1), NumericRange::constant(1)}});       // covariances
 * GmmSampleProducer producer(std::move(grid));
 * while (auto sample = producer.next()) use(sample->parameters, sample->overlapRate);
 * @endcode
 *
 * Ошибки вычисления (DensityError, std::invalid_argument) пробрасываются
 * из next() вызывающему.
 */
template <search::GridEnumerator Iter = search::GridIterator>
class GmmSampleProducer final : public GridSequence<GmmSample, Iter> {
   public:
    explicit GmmSampleProducer(Iter iterator, stats::OverlapOptions options = {},
                               std::optional<std::size_t> maxCount = std::nullopt)
        : GridSequence<GmmSample, Iter>(std::move(iterator), maxCount), options_(options) {}

    [[nodiscard]] const stats::OverlapOptions& getOptions() const noexcept { return options_; }

    /**
     * @brief Разбить генератор на @p n независимых генераторов.
     *
     * Разбивается перечислитель (см. GridIterator::split и
     * ConstrainedGridIterator::split); полученные генераторы не ограничены.
     */
    [[nodiscard]] std::vector<GmmSampleProducer> split(std::size_t n) && {
        std::vector<GmmSampleProducer> out;
        for (auto& part : splitIterator(n)) out.emplace_back(std::move(part), options_);
        return out;
    }

   protected:
    GmmSample supply(const params::GridValue& raw) override {
        auto parameters = stats::MixtureParameters::fromGridValue(raw);
        const double rate = stats::overlapRate(parameters, options_);
        return GmmSample{std::move(parameters), rate};
    }

   private:
    std::vector<Iter> splitIterator(std::size_t n) {
        if constexpr (std::is_same_v<Iter, search::GridIterator>) {
            return this->iterator_.split(n);
        } else {
            return std::move(this->iterator_).split(n);
        }
    }

    stats::OverlapOptions options_;
};

}  // namespace moebius::gen
