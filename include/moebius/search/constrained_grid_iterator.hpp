#pragma once

#include <cmath>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <moebius/params/grid_axis.hpp>
#include <moebius/params/grid_value.hpp>
#include <moebius/search/grid_iterator.hpp>

namespace moebius::search {

/**
 * @brief Перебор решётки с ограничением на сумму значений.
 *
 * Оборачивает GridIterator и выдаёт только комбинации, у которых
 * |sumDeep(value) - target| < kSumTolerance. Типичное применение — веса
 * компонент смеси, которые вместе должны давать 1.
 *
 * Итератор всегда знает следующую подходящую комбинацию заранее, поэтому
 * within() честно отвечает, можно ли ещё шагнуть, и итератор можно
 * вкладывать в GridIterator как обычную ось:
 *
 * @code
 * auto weights = ConstrainedGridIterator::create(
 *     GridIterator::of({NumericRange(0, 1, 0.25), NumericRange(0, 1, 0.25)}), 1.0);
 * auto grid = GridIterator::of({*weights, {means...}, {covariances...}});
 * @endcode
 *
 * Оборачиваемая решётка конечна, поэтому поиск подходящей комбинации
 * всегда завершается.
 */
class ConstrainedGridIterator final : public params::GridAxis {
   public:
    static constexpr double kSumTolerance = 1e-9;

    /**
     * @brief Обернуть @p grid и найти первую подходящую комбинацию.
     *
     * @return std::nullopt, если в решётке нет ни одной комбинации с суммой @p target.
     */
    [[nodiscard]] static std::optional<ConstrainedGridIterator> create(GridIterator grid, double target) {
        ConstrainedGridIterator it(std::move(grid), target);
        if (!it.rewind()) return std::nullopt;
        return it;
    }

    ConstrainedGridIterator(ConstrainedGridIterator&&) noexcept = default;
    ConstrainedGridIterator& operator=(ConstrainedGridIterator&&) noexcept = default;

    /// Рекурсивная сумма всех листьев значения.
    [[nodiscard]] static double sumDeep(const params::GridValue& v) {
        if (v.isScalar()) return v.scalar();

        double s = 0.0;
        for (const auto& item : v.list()) s += sumDeep(item);
        return s;
    }

    /// @brief true, если после текущей есть ещё подходящая комбинация.
    [[nodiscard]] bool within() const override { return pending_.has_value(); }

    /// Текущая (подходящая) комбинация.
    [[nodiscard]] params::GridValue getValue() const { return current_; }

    [[nodiscard]] double getTarget() const noexcept { return target_; }

    /**
     * @brief Следующая подходящая комбинация.
     *
     * @return std::nullopt, если подходящих комбинаций больше нет.
     */
    std::optional<params::GridValue> step() {
        if (!pending_) {
            finished_ = true;
            return std::nullopt;
        }

        current_ = std::move(*pending_);
        lookahead();
        return current_;
    }

    /// Первый вызов отдаёт комбинацию, найденную при создании.
    [[nodiscard]] std::optional<params::GridValue> next() {
        if (finished_) return std::nullopt;

        if (first_) {
            first_ = false;
            return current_;
        }
        return step();
    }

    /// Вернуться к первой подходящей комбинации.
    void reset() override { (void)rewind(); }

    /**
     * @brief "Разбиение" ограниченного перебора.
     *
     * Разбиение осей потеряло бы подходящие комбинации на стыках частей,
     * поэтому перебор не делится: результат содержит один этот итератор.
     */
    [[nodiscard]] std::vector<ConstrainedGridIterator> split(std::size_t) && {
        std::vector<ConstrainedGridIterator> out;
        out.push_back(std::move(*this));
        return out;
    }

    [[nodiscard]] params::GridValue snapshot() const override { return current_; }

    void advance() override { (void)step(); }

    /// Как ось делится только на одну часть (свою копию).
    [[nodiscard]] std::vector<std::unique_ptr<params::GridAxis>> splitAxis(std::size_t n) const override {
        if (n != 1) throw std::invalid_argument("ConstrainedGridIterator: a constrained axis cannot be partitioned");

        std::vector<std::unique_ptr<params::GridAxis>> out;
        out.push_back(clone());
        return out;
    }

    [[nodiscard]] std::size_t partitionCapacity() const override { return 1; }

    [[nodiscard]] std::unique_ptr<params::GridAxis> clone() const override {
        ConstrainedGridIterator copy(grid_.fresh(), target_);
        (void)copy.rewind();
        return std::make_unique<ConstrainedGridIterator>(std::move(copy));
    }

    void print(std::ostream& os) const override {
        os << "ConstrainedGridIterator(";
        grid_.print(os);
        os << ", sum = " << target_ << ")";
    }

   private:
    ConstrainedGridIterator(GridIterator grid, double target) : grid_(std::move(grid)), target_(target) {}

    [[nodiscard]] bool satisfies(const params::GridValue& v) const {
        return std::abs(sumDeep(v) - target_) < kSumTolerance;
    }

    // Следующая подходящая комбинация решётки после текущей.
    void lookahead() {
        auto value = grid_.step();
        while (value && !satisfies(*value)) value = grid_.step();
        pending_ = std::move(value);
    }

    // Встать на первую подходящую комбинацию; false, если её нет.
    bool rewind() {
        grid_.reset();
        first_ = true;

        auto value = grid_.next();
        while (value && !satisfies(*value)) value = grid_.step();

        finished_ = !value;
        if (!value) {
            pending_.reset();
            return false;
        }

        current_ = std::move(*value);
        lookahead();
        return true;
    }

    GridIterator grid_;
    double target_;
    params::GridValue current_;
    std::optional<params::GridValue> pending_;
    bool first_{true};
    bool finished_{false};
};

}  // namespace moebius::search
