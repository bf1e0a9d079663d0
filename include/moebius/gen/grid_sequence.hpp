#pragma once

#include <optional>
#include <utility>

#include <moebius/gen/lazy_sequence.hpp>
#include <moebius/params/grid_value.hpp>
#include <moebius/search/grid_enumerator.hpp>
#include <moebius/search/grid_iterator.hpp>

namespace moebius::gen {

/**
 * @brief Последовательность, управляемая перебором решётки.
 *
 * Каждое значение — очередная комбинация перечислителя, преобразованная
 * наследником через supply(raw). Исчерпание перечислителя означает
 * исчерпание последовательности.
 *
 * @tparam T    Тип значения последовательности.
 * @tparam Iter Перечислитель (GridIterator или ConstrainedGridIterator).
 */
template <typename T, search::GridEnumerator Iter = search::GridIterator>
class GridSequence : public BoundedLazySequence<T> {
   public:
    explicit GridSequence(Iter iterator, std::optional<std::size_t> maxCount = std::nullopt)
        : BoundedLazySequence<T>(maxCount), iterator_(std::move(iterator)) {}

    [[nodiscard]] const Iter& getIterator() const noexcept { return iterator_; }

    /// Начать перебор решётки заново (счётчик не сбрасывается).
    void restart() { iterator_.reset(); }

   protected:
    std::optional<T> produce() override {
        auto raw = iterator_.next();
        if (!raw) return std::nullopt;
        return supply(*raw);
    }

    /// Преобразовать комбинацию решётки в значение последовательности.
    [[nodiscard]] virtual T supply(const params::GridValue& raw) = 0;

    Iter iterator_;
};

}  // namespace moebius::gen
