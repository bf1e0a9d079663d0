#include <moebius/Version.hpp>

#include <moebius/gen/gmm_sample_producer.hpp>
#include <moebius/params/numeric_range.hpp>
#include <moebius/search/constrained_grid_iterator.hpp>
#include <moebius/search/grid_iterator.hpp>
#include <moebius/stats/normal_density.hpp>

#include <cstddef>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <stdexcept>

namespace ex {

using moebius::params::NumericRange;
using moebius::search::ConstrainedGridIterator;
using moebius::search::GridIterator;

// Решётка одномерных смесей из двух компонент:
//  - веса (w0, w1) с шагом 0.1 и w0 + w1 = 1,
//  - первое среднее в 0, второе пробегает [1, 4],
//  - дисперсии из {0.5, 1.0}.
GridIterator makeGrid() {
    auto weights = ConstrainedGridIterator::create(
        GridIterator::of({NumericRange(0.1, 0.9, 0.1), NumericRange(0.1, 0.9, 0.1)}), 1.0);
    if (!weights) throw std::runtime_error("no weight combination sums to 1");

    return GridIterator::of({
        *weights,
        {NumericRange::constant(0.0), NumericRange(1.0, 4.0, 0.5)},
        {NumericRange(0.5, 1.0, 0.5), NumericRange(0.5, 1.0, 0.5)},
    });
}

void writeRow(std::ostream& os, const moebius::gen::GmmSample& s) {
    const auto& p = s.parameters;
    os << p.weights[0] << ',' << p.weights[1] << ','
       << p.means[0](0) << ',' << p.means[1](0) << ','
       << p.covariances[0](0, 0) << ',' << p.covariances[1](0, 0) << ','
       << s.overlapRate << '\n';
}

}  // namespace ex

int main(int argc, char** argv) {
    std::cerr << "moebius " << moebius::version_major << '.' << moebius::version_minor << '.'
              << moebius::version_patch << "\n";

    // --- Output: файл из argv[1] или stdout ---
    std::ofstream file;
    if (argc > 1) {
        file.open(argv[1]);
        if (!file) {
            std::cerr << "cannot open " << argv[1] << "\n";
            return 1;
        }
    }
    std::ostream& out = file.is_open() ? file : std::cout;

    try {
        moebius::gen::GmmSampleProducer producer(ex::makeGrid());

        out << std::setprecision(10);
        out << "w0,w1,m0,m1,v0,v1,olr\n";

        std::size_t n = 0;
        while (auto sample = producer.next()) {
            ex::writeRow(out, *sample);
            ++n;
        }
        std::cerr << "Samples: " << n << "\n";
    } catch (const moebius::stats::DensityError& e) {
        std::cerr << "density error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
