#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace moebius::gen {

/**
 * @brief Ленивая последовательность значений, которые вытягивает потребитель.
 *
 * Единственная операция next() возвращает очередное значение или
 * std::nullopt, если источник исчерпан. Бесконечные последовательности
 * никогда не возвращают std::nullopt: останавливать их должен вызывающий.
 */
template <typename T>
class LazySequence {
   public:
    using value_type = T;

    virtual ~LazySequence() = default;

    [[nodiscard]] virtual std::optional<T> next() = 0;
};

/**
 * @brief Последовательность с необязательным ограничением на число значений.
 *
 * После max_count успешных next() последовательность сообщает об исчерпании,
 * даже если источник ещё не пуст. resetCount() обнуляет счётчик, не трогая
 * сам источник, и разрешает получить ещё max_count значений.
 *
 * Наследники реализуют produce(), получение значения из источника.
 */
template <typename T>
class BoundedLazySequence : public LazySequence<T> {
   public:
    explicit BoundedLazySequence(std::optional<std::size_t> maxCount = std::nullopt) : maxCount_(maxCount) {}

    void setMaxCount(std::optional<std::size_t> maxCount) noexcept { maxCount_ = maxCount; }

    [[nodiscard]] std::optional<std::size_t> getMaxCount() const noexcept { return maxCount_; }

    [[nodiscard]] bool isBounded() const noexcept { return maxCount_.has_value(); }

    void resetCount() noexcept { count_ = 0; }

    /// Число значений, выданных с последнего resetCount().
    [[nodiscard]] std::size_t getCount() const noexcept { return count_; }

    [[nodiscard]] std::optional<T> next() final {
        if (maxCount_ && count_ >= *maxCount_) return std::nullopt;

        auto value = produce();
        if (value) ++count_;
        return value;
    }

   protected:
    [[nodiscard]] virtual std::optional<T> produce() = 0;

   private:
    std::optional<std::size_t> maxCount_;
    std::size_t count_{0};
};

/// Всегда одно и то же значение (с учётом ограничения).
template <typename T>
class ConstantSequence final : public BoundedLazySequence<T> {
   public:
    explicit ConstantSequence(T value, std::optional<std::size_t> maxCount = std::nullopt)
        : BoundedLazySequence<T>(maxCount), value_(std::move(value)) {}

   protected:
    std::optional<T> produce() override { return value_; }

   private:
    T value_;
};

/**
 * @brief Обёртка над существующим источником (конечным или бесконечным).
 *
 * Источник — callable, возвращающий std::optional<T>; std::nullopt означает
 * исчерпание источника.
 */
template <typename T>
class IterableSequence final : public BoundedLazySequence<T> {
   public:
    using source_type = std::function<std::optional<T>()>;

    explicit IterableSequence(source_type source, std::optional<std::size_t> maxCount = std::nullopt)
        : BoundedLazySequence<T>(maxCount), source_(std::move(source)) {}

    /// Последовательность элементов контейнера в исходном порядке.
    [[nodiscard]] static IterableSequence fromContainer(std::vector<T> items,
                                                        std::optional<std::size_t> maxCount = std::nullopt) {
        auto data = std::make_shared<std::vector<T>>(std::move(items));
        auto pos = std::make_shared<std::size_t>(0);

        return IterableSequence(
            [data, pos]() -> std::optional<T> {
                if (*pos >= data->size()) return std::nullopt;
                return (*data)[(*pos)++];
            },
            maxCount);
    }

    /// Последовательность по паре итераторов [first, last); диапазон должен пережить последовательность.
    template <typename It>
    [[nodiscard]] static IterableSequence fromRange(It first, It last,
                                                    std::optional<std::size_t> maxCount = std::nullopt) {
        return IterableSequence(
            [first, last]() mutable -> std::optional<T> {
                if (first == last) return std::nullopt;
                return T(*first++);
            },
            maxCount);
    }

   protected:
    std::optional<T> produce() override { return source_(); }

   private:
    source_type source_;
};

}  // namespace moebius::gen
