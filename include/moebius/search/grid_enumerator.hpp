#pragma once

#include <concepts>
#include <optional>

#include <moebius/params/grid_value.hpp>

namespace moebius::search {

/**
 * @brief Концепт перечислителя комбинаций решётки.
 *
 * Перечислитель является *stateful*:
 *  - многократно вызывается next(),
 *  - next() возвращает следующую комбинацию или std::nullopt,
 *    если перебор завершён,
 *  - reset() начинает перебор заново.
 *
 * Модели: GridIterator (полный перебор) и ConstrainedGridIterator
 * (перебор с ограничением на сумму).
 *
 * @tparam E Тип перечислителя.
 */
template <class E>
concept GridEnumerator =
    std::movable<E> &&
    requires(E e) {
        // Получение следующей комбинации
        { e.next() } -> std::same_as<std::optional<params::GridValue>>;

        // Перезапуск перебора
        { e.reset() } -> std::same_as<void>;
    };

} // namespace moebius::search
