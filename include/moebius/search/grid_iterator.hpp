#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <moebius/params/grid_axis.hpp>
#include <moebius/params/grid_value.hpp>
#include <moebius/params/numeric_range.hpp>

namespace moebius::search {

/**
 * @brief Порядок, в котором одометр распространяет перенос по осям.
 *
 * Forward: оси в заданном порядке, быстрее всех меняется первая ось.
 * Reversed: оси в обратном порядке, быстрее всех меняется последняя ось.
 */
enum class EnumerationDirection { Forward, Reversed };

/**
 * @brief Описание оси для GridIterator::of: ось-прототип или группа осей.
 *
 * Прототип (NumericRange, ConstrainedGridIterator, ...) копируется через
 * clone() при построении итератора. Группа (вложенный список) превращается
 * во вложенный GridIterator, который перебирается как одна ось, например
 * все параметры одной компоненты смеси.
 *
 * @code
 * auto it = GridIterator::of({NumericRange::unit(0, 1), {NumericRange::unit(0, 2), NumericRange::constant(5)}});
 * @endcode
 *
 * @warning `AxisSpec{x}` строит группу из одного элемента; для одной оси пишите `AxisSpec(x)`.
 */
struct AxisSpec {
    std::variant<std::shared_ptr<const params::GridAxis>, std::vector<AxisSpec>> node;

    AxisSpec(const params::GridAxis& prototype) : node(std::shared_ptr<const params::GridAxis>(prototype.clone())) {}

    AxisSpec(std::initializer_list<AxisSpec> group) : node(std::vector<AxisSpec>(group)) {}

    AxisSpec(std::vector<AxisSpec> group) : node(std::move(group)) {}
};

/**
 * @brief Многомерный одометр над осями (диапазонами или вложенными одометрами).
 *
 * Шаг одометра (step):
 *  - оси обходятся в порядке EnumerationDirection,
 *  - первая ось, которая ещё within(), делает шаг, и возвращается новый снимок,
 *  - все пропущенные до неё (исчерпанные) оси сбрасываются в начало, это перенос,
 *  - если ни одна ось не within(), перебор завершён (std::nullopt).
 *
 * Использование:
 *  - вызывать next() до std::nullopt; первый next() возвращает начальный
 *    снимок без шага (одометр стартует с "нулей"),
 *  - reset() начинает перебор заново.
 *
 * Итератор владеет своими осями и не копируется: один одометр нельзя отдать
 * нескольким потребителям. Для параллельной работы используйте split(n).
 */
class GridIterator final : public params::GridAxis {
   public:
    using value_type = params::GridValue;

    explicit GridIterator(std::vector<std::unique_ptr<params::GridAxis>> axes,
                          EnumerationDirection direction = EnumerationDirection::Reversed)
        : axes_(std::move(axes)), direction_(direction) {
        for (const auto& axis : axes_) {
            if (!axis) throw std::invalid_argument("GridIterator: axis must not be null");
        }
    }

    GridIterator(const GridIterator&) = delete;
    GridIterator& operator=(const GridIterator&) = delete;
    GridIterator(GridIterator&&) noexcept = default;
    GridIterator& operator=(GridIterator&&) noexcept = default;

    /**
     * @brief Построить (возможно вложенный) одометр из описаний осей.
     *
     * Вложенные группы рекурсивно становятся вложенными GridIterator
     * с тем же направлением перебора.
     */
    [[nodiscard]] static GridIterator of(const std::vector<AxisSpec>& axes,
                                         EnumerationDirection direction = EnumerationDirection::Reversed) {
        std::vector<std::unique_ptr<params::GridAxis>> built;
        built.reserve(axes.size());

        for (const auto& spec : axes) {
            if (const auto* prototype = std::get_if<std::shared_ptr<const params::GridAxis>>(&spec.node)) {
                built.push_back((*prototype)->clone());
            } else {
                built.push_back(std::make_unique<GridIterator>(of(std::get<std::vector<AxisSpec>>(spec.node), direction)));
            }
        }

        return GridIterator(std::move(built), direction);
    }

    /// @brief true, если хотя бы одна ось ещё может шагнуть.
    [[nodiscard]] bool within() const override {
        for (const auto& axis : axes_) {
            if (axis->within()) return true;
        }
        return false;
    }

    /// @brief Упорядоченный снимок текущих значений всех осей.
    [[nodiscard]] params::GridValue getValue() const {
        params::GridValue::list_type out;
        out.reserve(axes_.size());
        for (const auto& axis : axes_) out.push_back(axis->snapshot());
        return params::GridValue(std::move(out));
    }

    /**
     * @brief Шаг одометра с переносом.
     *
     * @return Новый снимок или std::nullopt, если перебор завершён.
     */
    std::optional<params::GridValue> step() {
        if (finished_) return std::nullopt;

        const std::size_t n = axes_.size();
        for (std::size_t k = 0; k < n; ++k) {
            auto& axis = *axes_[axisAt(k)];

            if (axis.within()) {
                axis.advance();
                return getValue();
            }
            axis.reset();  // перенос
        }

        finished_ = true;
        return std::nullopt;
    }

    /**
     * @brief Следующая комбинация.
     *
     * @return Начальный снимок при первом вызове, затем результат step().
     */
    [[nodiscard]] std::optional<params::GridValue> next() {
        if (finished_) return std::nullopt;

        if (first_) {
            first_ = false;
            return getValue();
        }
        return step();
    }

    void reset() override {
        for (auto& axis : axes_) axis->reset();
        first_ = true;
        finished_ = false;
    }

    [[nodiscard]] bool finished() const noexcept { return finished_; }

    [[nodiscard]] std::size_t dimensions() const noexcept { return axes_.size(); }

    [[nodiscard]] EnumerationDirection getDirection() const noexcept { return direction_; }

    /// Ось по индексу (в порядке задания).
    [[nodiscard]] const params::GridAxis& getRange(std::size_t idx) const { return *axes_.at(idx); }

    /// Новый итератор над копиями тех же осей, в начальном состоянии.
    [[nodiscard]] GridIterator fresh() const {
        std::vector<std::unique_ptr<params::GridAxis>> axes;
        axes.reserve(axes_.size());
        for (const auto& axis : axes_) axes.push_back(axis->clone());
        return GridIterator(std::move(axes), direction_);
    }

    /**
     * @brief Разбить перебор на @p n независимых под-одометров.
     *
     * Делится одна ось: самая медленная (в порядке переноса) из тех, что
     * допускают @p n частей (partitionCapacity() >= n). Остальные оси
     * копируются в каждую часть целиком. Части не пересекаются, вместе дают
     * ровно тот же набор комбинаций, что и исходный перебор, не разделяют
     * состояние и начинают с начала. Если делится самая медленная ось,
     * конкатенация частей повторяет исходный порядок перебора.
     *
     * @throws std::invalid_argument если n == 0 или ни одну ось нельзя разбить на n частей.
     */
    [[nodiscard]] std::vector<GridIterator> split(std::size_t n) const {
        if (n == 0) throw std::invalid_argument("GridIterator::split: number of partitions must be positive");

        std::vector<GridIterator> out;
        out.reserve(n);
        if (n == 1) {
            out.push_back(fresh());
            return out;
        }

        const auto chosen = splittableAxis(n);
        if (!chosen) {
            throw std::invalid_argument("GridIterator::split: no axis can be split into " + std::to_string(n) +
                                        " partitions");
        }

        auto parts = axes_[*chosen]->splitAxis(n);
        for (std::size_t j = 0; j < n; ++j) {
            std::vector<std::unique_ptr<params::GridAxis>> axes;
            axes.reserve(axes_.size());
            for (std::size_t k = 0; k < axes_.size(); ++k) {
                axes.push_back(k == *chosen ? std::move(parts[j]) : axes_[k]->clone());
            }
            out.emplace_back(std::move(axes), direction_);
        }
        return out;
    }

    [[nodiscard]] params::GridValue snapshot() const override { return getValue(); }

    void advance() override { (void)step(); }

    [[nodiscard]] std::vector<std::unique_ptr<params::GridAxis>> splitAxis(std::size_t n) const override {
        std::vector<std::unique_ptr<params::GridAxis>> out;
        for (auto& part : split(n)) out.push_back(std::make_unique<GridIterator>(std::move(part)));
        return out;
    }

    [[nodiscard]] std::size_t partitionCapacity() const override {
        std::size_t capacity = 1;
        for (const auto& axis : axes_) capacity = std::max(capacity, axis->partitionCapacity());
        return capacity;
    }

    [[nodiscard]] std::unique_ptr<params::GridAxis> clone() const override {
        return std::make_unique<GridIterator>(fresh());
    }

    void print(std::ostream& os) const override {
        os << "GridIterator(";
        for (std::size_t i = 0; i < axes_.size(); ++i) {
            if (i) os << ", ";
            axes_[i]->print(os);
        }
        os << ")";
    }

   private:
    // k-я ось в порядке переноса (от самой быстрой к самой медленной)
    [[nodiscard]] std::size_t axisAt(std::size_t k) const noexcept {
        return direction_ == EnumerationDirection::Reversed ? axes_.size() - 1 - k : k;
    }

    [[nodiscard]] std::optional<std::size_t> splittableAxis(std::size_t n) const {
        for (std::size_t k = axes_.size(); k-- > 0;) {
            const std::size_t idx = axisAt(k);
            if (axes_[idx]->partitionCapacity() >= n) return idx;
        }
        return std::nullopt;
    }

    std::vector<std::unique_ptr<params::GridAxis>> axes_;
    EnumerationDirection direction_;
    bool first_{true};
    bool finished_{false};
};

}  // namespace moebius::search
