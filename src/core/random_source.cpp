#include "core/random_source.h"
#include "core/types.h"
#include <cmath>

namespace syncfield {

double RandomSource::next_normal(double mean, double std_dev) {
    // Box-Muller needs u1 strictly positive for the log
    double u1 = next_uniform();
    while (u1 <= 0.0) u1 = next_uniform();
    double u2 = next_uniform();
    double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(TWO_PI * u2);
    return z0 * std_dev + mean;
}

size_t RandomSource::next_index(size_t n) {
    if (n == 0) return 0;
    size_t idx = static_cast<size_t>(std::floor(next_uniform() * static_cast<double>(n)));
    return idx < n ? idx : n - 1;
}

double MersenneSource::next_uniform() {
    return unit_(rng_);
}

} // namespace syncfield
