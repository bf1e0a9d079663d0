#include <moebius/Version.hpp>

#include <moebius/gen/gmm_sample_producer.hpp>
#include <moebius/params/numeric_range.hpp>
#include <moebius/search/constrained_grid_iterator.hpp>
#include <moebius/search/grid_iterator.hpp>
#include <moebius/search/parallel_async.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace ex {

using moebius::params::NumericRange;
using moebius::search::ConstrainedGridIterator;
using moebius::search::GridIterator;

// Двумерные смеси из двух компонент: второе среднее пробегает квадрат
// [0.5, 5]^2, дисперсия второй компоненты по оси y пробегает [0.5, 2].
GridIterator makeGrid() {
    auto weights = ConstrainedGridIterator::create(
        GridIterator::of({NumericRange(0.2, 0.8, 0.1), NumericRange(0.2, 0.8, 0.1)}), 1.0);
    if (!weights) throw std::runtime_error("no weight combination sums to 1");

    return GridIterator::of({
        *weights,
        {
            {NumericRange::constant(0.0), NumericRange::constant(0.0)},
            {NumericRange(0.5, 5.0, 0.25), NumericRange(0.5, 5.0, 0.25)},
        },
        {
            {{NumericRange::constant(1.0), NumericRange::constant(0.0)},
             {NumericRange::constant(0.0), NumericRange::constant(1.0)}},
            {{NumericRange::constant(1.0), NumericRange::constant(0.0)},
             {NumericRange::constant(0.0), NumericRange(0.5, 2.0, 0.5)}},
        },
    });
}

}  // namespace ex

int main() {
    std::cout << "moebius " << moebius::version_major << '.' << moebius::version_minor << '.'
              << moebius::version_patch << "\n";

    try {
        std::size_t threadCount = std::thread::hardware_concurrency();
        if (threadCount == 0) threadCount = 1;

        // --- Partitions: по одной на поток (насколько позволяет решётка) ---
        auto grid = ex::makeGrid();
        const std::size_t parts = std::min(threadCount, grid.partitionCapacity());
        auto producers = moebius::gen::GmmSampleProducer(std::move(grid)).split(parts);

        std::mutex io;
        const auto t0 = std::chrono::steady_clock::now();

        auto results = moebius::search::parallelDrainAsync(
            std::move(producers),
            [](moebius::gen::GmmSample s) { return s.overlapRate; },
            threadCount,
            [&](std::size_t done, std::size_t total) {
                std::lock_guard<std::mutex> lock(io);
                std::cout << "\rPartitions: " << done << "/" << total << std::flush;
            });

        const auto t1 = std::chrono::steady_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();

        // --- Histogram of overlap rates ---
        std::array<std::size_t, 10> bins{};
        std::size_t total = 0;
        for (const auto& part : results) {
            for (const double olr : part) {
                const auto b = std::min<std::size_t>(bins.size() - 1, static_cast<std::size_t>(olr * 10.0));
                ++bins[b];
                ++total;
            }
        }

        std::cout << "\nSamples: " << total << " in " << ms << " ms (" << parts << " partitions)\n";
        for (std::size_t b = 0; b < bins.size(); ++b) {
            std::cout << "  [" << std::fixed << std::setprecision(1) << b / 10.0 << ", " << (b + 1) / 10.0
                      << ") " << std::string(total ? 60 * bins[b] / total : 0, '#') << " " << bins[b] << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "\nerror: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
