#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <moebius/params/grid_axis.hpp>

namespace moebius::params {

/// Направление арифметической прогрессии диапазона.
enum class RangeDirection { Incremental, Decremental };

/**
 * @brief Ограниченный направленный числовой диапазон (start/end/step).
 *
 * Представляет последовательность значений:
 *   start, start ± step, start ± 2*step, ..., end
 *
 * Направление определяется границами: Incremental при start <= end, иначе
 * Decremental. Шаг всегда положителен. Последний шаг не перескакивает end:
 * если очередное значение выходит за end или совпадает с ним с точностью
 * до относительного допуска 1e-9, оно прижимается к end. После каждого шага
 * значение округляется до @ref roundDigits знаков после запятой.
 *
 * Использование в одометре:
 *  - getValue(): текущее значение,
 *  - within(): можно ли ещё шагнуть (end ещё не достигнут),
 *  - step(): шагнуть и вернуть новое значение,
 *  - reset(): вернуться к start.
 */
class NumericRange final : public GridAxis {
   public:
    /// Число знаков после запятой, до которого округляется значение после шага.
    static constexpr int kDefaultRoundDigits = 9;

    /// Максимально допустимая точность округления.
    static constexpr int kMaxRoundDigits = 15;

    /**
     * @param start       Начальное значение.
     * @param end         Граница (достигается ровно).
     * @param step        Шаг (> 0).
     * @param roundDigits Число знаков округления (0..15).
     *
     * @throws std::invalid_argument если step <= 0, границы не конечны, шаг
     *         меньше 10^-roundDigits или roundDigits вне диапазона.
     */
    NumericRange(double start, double end, double step, int roundDigits = kDefaultRoundDigits)
        : start_(start), end_(end), step_(step), roundDigits_(roundDigits), value_(start) {
        if (!(step > 0.0) || !std::isfinite(step)) {
            throw std::invalid_argument("NumericRange: step must be a positive number");
        }
        if (!std::isfinite(start) || !std::isfinite(end)) {
            throw std::invalid_argument("NumericRange: bounds must be finite");
        }
        if (roundDigits < 0 || roundDigits > kMaxRoundDigits) {
            throw std::invalid_argument("NumericRange: roundDigits must be within [0, 15]");
        }
        // шаг, который округление может съесть, зациклил бы перебор
        if (step < std::pow(10.0, -roundDigits)) {
            throw std::invalid_argument("NumericRange: step is below the rounding resolution");
        }

        direction_ = (start <= end) ? RangeDirection::Incremental : RangeDirection::Decremental;
    }

    /// Диапазон [a, b] с шагом 1.
    [[nodiscard]] static NumericRange unit(double a, double b) { return NumericRange(a, b, 1.0); }

    /// Вырожденный диапазон из одного значения.
    [[nodiscard]] static NumericRange constant(double c) { return unit(c, c); }

    [[nodiscard]] double getValue() const noexcept { return value_; }

    [[nodiscard]] double getInitialValue() const noexcept { return start_; }

    [[nodiscard]] double getStart() const noexcept { return start_; }

    [[nodiscard]] double getEnd() const noexcept { return end_; }

    [[nodiscard]] double getStep() const noexcept { return step_; }

    [[nodiscard]] RangeDirection getDirection() const noexcept { return direction_; }

    [[nodiscard]] bool isDegenerate() const noexcept { return start_ == end_; }

    /**
     * @brief true, пока текущее значение не достигло end.
     *
     * Incremental: start <= value < end; Decremental: end < value <= start.
     * Вырожденный диапазон никогда не within().
     */
    [[nodiscard]] bool within() const noexcept override {
        if (direction_ == RangeDirection::Incremental) {
            return value_ >= start_ && value_ < end_;
        }
        return value_ > end_ && value_ <= start_;
    }

    /**
     * @brief Шагнуть в направлении диапазона.
     * @return Новое текущее значение (не дальше end).
     * @throws std::runtime_error если на этих величинах шаг теряется при округлении.
     */
    double step() {
        const double previous = value_;

        // округление до прижатия: иначе end с лишними знаками никогда не был бы достигнут
        if (direction_ == RangeDirection::Incremental) {
            value_ = round(value_ + step_);
            if (value_ > end_ || isClose(value_, end_)) value_ = end_;
        } else {
            value_ = round(value_ - step_);
            if (value_ < end_ || isClose(value_, end_)) value_ = end_;
        }

        if (value_ == previous && value_ != end_) {
            throw std::runtime_error("NumericRange: step " + std::to_string(step_) + " makes no progress at value " +
                                     std::to_string(previous));
        }
        return value_;
    }

    void reset() noexcept override { value_ = start_; }

    /// Число значений диапазона от start до end (вместе с обоими концами).
    [[nodiscard]] std::size_t count() const {
        NumericRange probe(start_, end_, step_, roundDigits_);
        std::size_t n = 1;
        while (probe.within()) {
            probe.step();
            ++n;
        }
        return n;
    }

    /// Все значения диапазона от start до end.
    [[nodiscard]] std::vector<double> values() const {
        NumericRange probe(start_, end_, step_, roundDigits_);
        std::vector<double> out{probe.getValue()};
        while (probe.within()) out.push_back(probe.step());
        return out;
    }

    /**
     * @brief Разбить диапазон на @p n смежных поддиапазонов.
     *
     * Каждый поддиапазон получает floor(count / n) подряд идущих значений
     * исходного диапазона, остаток достаётся последнему. Поддиапазоны не
     * пересекаются, сохраняют направление и вместе дают ровно те же значения.
     * Вырожденный диапазон разбивается на @p n своих копий.
     *
     * @throws std::invalid_argument если n == 0 или n больше числа значений.
     */
    [[nodiscard]] std::vector<NumericRange> split(std::size_t n) const {
        if (n == 0) throw std::invalid_argument("NumericRange::split: number of partitions must be positive");

        if (isDegenerate()) {
            return std::vector<NumericRange>(n, NumericRange(start_, end_, step_, roundDigits_));
        }

        const std::size_t total = count();
        if (n > total) {
            throw std::invalid_argument("NumericRange::split: " + std::to_string(n) +
                                        " partitions requested, but the range has only " + std::to_string(total) +
                                        " values");
        }

        const std::size_t chunk = total / n;

        // один проход: запоминаются только границы поддиапазонов
        std::vector<NumericRange> out;
        out.reserve(n);
        NumericRange probe(start_, end_, step_, roundDigits_);
        std::size_t index = 0;
        double first = probe.getValue();
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t last = (i + 1 == n) ? total - 1 : (i + 1) * chunk - 1;
            while (index < last) {
                probe.step();
                ++index;
            }
            out.emplace_back(first, probe.getValue(), step_, roundDigits_);
            if (i + 1 < n) {
                first = probe.step();
                ++index;
            }
        }
        return out;
    }

    [[nodiscard]] GridValue snapshot() const override { return GridValue(value_); }

    void advance() override { step(); }

    [[nodiscard]] std::vector<std::unique_ptr<GridAxis>> splitAxis(std::size_t n) const override {
        std::vector<std::unique_ptr<GridAxis>> out;
        for (auto& r : split(n)) out.push_back(std::make_unique<NumericRange>(std::move(r)));
        return out;
    }

    [[nodiscard]] std::size_t partitionCapacity() const override { return isDegenerate() ? 1 : count(); }

    [[nodiscard]] std::unique_ptr<GridAxis> clone() const override {
        return std::make_unique<NumericRange>(start_, end_, step_, roundDigits_);
    }

    void print(std::ostream& os) const override {
        os << "NumericRange(" << start_ << ", " << end_ << ", " << step_ << ")";
    }

   private:
    // math.isclose с rel_tol = 1e-9
    static bool isClose(double a, double b) noexcept {
        return std::abs(a - b) <= 1e-9 * std::max(std::abs(a), std::abs(b));
    }

    [[nodiscard]] double round(double v) const noexcept {
        const double scale = std::pow(10.0, roundDigits_);
        return std::round(v * scale) / scale;
    }

    double start_;
    double end_;
    double step_;
    int roundDigits_;
    double value_;
    RangeDirection direction_{RangeDirection::Incremental};
};

}  // namespace moebius::params
