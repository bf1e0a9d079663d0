#pragma once

#include <cstddef>
#include <memory>
#include <ostream>
#include <vector>

#include <moebius/params/grid_value.hpp>

namespace moebius::params {

/**
 * @brief Ось перебора: независимо шагаемое измерение решётки.
 *
 * Ось хранит текущее значение и умеет:
 *  - отдавать снимок текущего значения (snapshot),
 *  - сообщать, можно ли ещё сделать шаг (within),
 *  - сделать шаг (advance) и вернуться к началу (reset),
 *  - разбиться на n независимых осей (splitAxis) для параллельного перебора,
 *  - создать свою копию в начальном состоянии (clone).
 *
 * Оси принадлежат ровно одному владельцу (GridIterator хранит их через
 * std::unique_ptr), поэтому состояние оси не разделяется между потребителями.
 *
 * Реализации: @ref moebius::params::NumericRange (скалярная ось),
 * @ref moebius::search::GridIterator (вложенный одометр как одна ось) и
 * @ref moebius::search::ConstrainedGridIterator (группа осей с ограничением на сумму).
 */
class GridAxis {
   public:
    virtual ~GridAxis() = default;

    /// @brief Снимок текущего значения оси (скаляр или список для вложенной решётки).
    [[nodiscard]] virtual GridValue snapshot() const = 0;

    /// @brief true, пока ось не дошла до своей границы и может сделать шаг.
    [[nodiscard]] virtual bool within() const = 0;

    /// @brief Сделать один шаг. Вызывается только если within() == true.
    virtual void advance() = 0;

    /// @brief Вернуть ось в начальное состояние.
    virtual void reset() = 0;

    /**
     * @brief Разбить ось на @p n независимых осей.
     *
     * @return Ровно @p n осей; каждая начинает с собственного начального значения.
     * @throws std::invalid_argument если разбиение невозможно.
     */
    [[nodiscard]] virtual std::vector<std::unique_ptr<GridAxis>> splitAxis(std::size_t n) const = 0;

    /**
     * @brief На сколько непересекающихся частей ось можно разбить без повторов.
     *
     * 1 означает, что ось не делится (вырожденный диапазон, ограниченный перебор).
     */
    [[nodiscard]] virtual std::size_t partitionCapacity() const = 0;

    /// @brief Копия оси в начальном состоянии.
    [[nodiscard]] virtual std::unique_ptr<GridAxis> clone() const = 0;

    virtual void print(std::ostream& os) const = 0;

    friend std::ostream& operator<<(std::ostream& os, const GridAxis& axis) {
        axis.print(os);
        return os;
    }
};

}  // namespace moebius::params
