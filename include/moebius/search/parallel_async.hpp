#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace moebius::search {

/**
 * @brief Параллельно исчерпать набор независимых разбиений перебора с помощью std::async.
 *
 * Каждое разбиение — объект с next() -> std::optional<T> (например, результат
 * GridIterator::split(n) или GmmSampleProducer::split(n)). Разбиения
 * распределяются по чанкам, по одной async-задаче на чанк; внутри чанка
 * разбиения исчерпываются последовательно. Каждое разбиение обрабатывается
 * ровно одной задачей, поэтому разделяемого изменяемого состояния нет.
 *
 * @tparam Partition   Тип разбиения (перемещаемый, с next()).
 * @tparam Worker      Callable вида Result(T&&), где T — тип значения разбиения.
 * @tparam OnProgress  Callable вида void(std::size_t done, std::size_t total).
 *
 * @param partitions    Разбиения; передаются во владение драйверу.
 * @param worker        Функция обработки одного значения.
 * @param threadCount   Число параллельных задач (по умолчанию hardware_concurrency()).
 * @param onProgress    Опциональный callback прогресса по разбиениям (можно передать nullptr).
 *
 * @return По вектору результатов на каждое разбиение, в исходном порядке разбиений.
 *
 * @note Если worker бросает исключение, оно пробросится при get() соответствующего future.
 */
template <typename Partition, typename Worker, typename OnProgress = std::nullptr_t>
auto parallelDrainAsync(std::vector<Partition> partitions,
                        Worker&& worker,
                        std::size_t threadCount = std::thread::hardware_concurrency(),
                        OnProgress onProgress = nullptr)
    -> std::vector<std::vector<std::invoke_result_t<Worker&, typename decltype(std::declval<Partition&>().next())::value_type&&>>>
{
    using Value = typename decltype(std::declval<Partition&>().next())::value_type;
    using Result = std::invoke_result_t<Worker&, Value&&>;

    const std::size_t total = partitions.size();
    std::vector<std::vector<Result>> results(total);

    if (total == 0) return results;

    if (threadCount == 0) threadCount = 1;
    threadCount = std::min(threadCount, total);

    // Размер чанка: равномерно распределяем разбиения
    const std::size_t chunk = (total + threadCount - 1) / threadCount;

    std::atomic<std::size_t> done{0};
    std::vector<std::future<void>> futs;
    futs.reserve(threadCount);

    for (std::size_t t = 0; t < threadCount; ++t) {
        const std::size_t chunkBegin = t * chunk;
        const std::size_t chunkEnd = std::min(total, chunkBegin + chunk);
        if (chunkBegin >= chunkEnd) break;

        futs.push_back(std::async(std::launch::async,
            [&, chunkBegin, chunkEnd]() {
                for (std::size_t p = chunkBegin; p < chunkEnd; ++p) {
                    while (auto value = partitions[p].next()) {
                        results[p].push_back(worker(std::move(*value)));
                    }

                    const std::size_t now = done.fetch_add(1, std::memory_order_relaxed) + 1;
                    if constexpr (!std::is_same_v<OnProgress, std::nullptr_t>) {
                        onProgress(now, total);
                    }
                }
            }
        ));
    }

    // дождаться всех задач, затем пробросить первое исключение
    for (auto& f : futs) f.wait();
    for (auto& f : futs) f.get();
    return results;
}

} // namespace moebius::search
