#pragma once

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

namespace moebius::params {

/**
 * @brief Значение узла решётки: число или упорядоченный список значений.
 *
 * Снимок одной оси (NumericRange) — скаляр, снимок GridIterator — список
 * снимков его осей (рекурсивно для вложенных итераторов). Та же структура
 * используется как "дерево значений" параметров смеси (веса, средние,
 * ковариации) в операторах эволюционного поиска.
 *
 * @warning Фигурные скобки строят список: `GridValue{1.0}` это список из
 *          одного числа. Для скаляра используйте `GridValue(1.0)`.
 *          Исключение: `GridValue{v}` для GridValue v копирует v; список
 *          из одного такого элемента строится как `GridValue(GridValue::list_type{v})`.
 */
class GridValue {
   public:
    using list_type = std::vector<GridValue>;

    /// Скаляр 0.0.
    GridValue() noexcept : data_(0.0) {}

    GridValue(double v) noexcept : data_(v) {}

    GridValue(list_type items) : data_(std::move(items)) {}

    GridValue(std::initializer_list<GridValue> items) : data_(list_type(items)) {}

    /// Список скаляров из вектора чисел.
    [[nodiscard]] static GridValue fromScalars(const std::vector<double>& values) {
        list_type items;
        items.reserve(values.size());
        for (const double v : values) items.emplace_back(v);
        return GridValue(std::move(items));
    }

    [[nodiscard]] bool isScalar() const noexcept { return std::holds_alternative<double>(data_); }

    [[nodiscard]] bool isList() const noexcept { return std::holds_alternative<list_type>(data_); }

    [[nodiscard]] double scalar() const {
        if (!isScalar()) throw std::invalid_argument("GridValue::scalar: value is a list");
        return std::get<double>(data_);
    }

    [[nodiscard]] const list_type& list() const {
        if (!isList()) throw std::invalid_argument("GridValue::list: value is a scalar");
        return std::get<list_type>(data_);
    }

    [[nodiscard]] list_type& list() {
        if (!isList()) throw std::invalid_argument("GridValue::list: value is a scalar");
        return std::get<list_type>(data_);
    }

    /// Число элементов списка (для скаляра 0).
    [[nodiscard]] std::size_t size() const noexcept {
        return isList() ? std::get<list_type>(data_).size() : 0;
    }

    /// Элемент списка с проверкой границ.
    [[nodiscard]] const GridValue& operator[](std::size_t i) const { return list().at(i); }

    [[nodiscard]] GridValue& operator[](std::size_t i) { return list().at(i); }

    /// Листья дерева в порядке обхода в глубину.
    [[nodiscard]] std::vector<double> flatten() const {
        std::vector<double> out;
        collect(out);
        return out;
    }

    friend bool operator==(const GridValue& a, const GridValue& b) { return a.data_ == b.data_; }

    friend bool operator!=(const GridValue& a, const GridValue& b) { return !(a == b); }

    friend std::ostream& operator<<(std::ostream& os, const GridValue& v) {
        if (v.isScalar()) return os << std::get<double>(v.data_);

        os << '[';
        const auto& items = std::get<list_type>(v.data_);
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) os << ", ";
            os << items[i];
        }
        return os << ']';
    }

   private:
    void collect(std::vector<double>& out) const {
        if (isScalar()) {
            out.push_back(std::get<double>(data_));
            return;
        }
        for (const auto& item : std::get<list_type>(data_)) item.collect(out);
    }

    std::variant<double, list_type> data_;
};

}  // namespace moebius::params
