/**
 * @file zipf.cpp
 * @brief ZipfGenerator implementation
 */

#include "workload/zipf.hpp"

#include <cmath>

namespace tessera {

ZipfGenerator::ZipfGenerator(uint64_t n, double theta) : n_(n == 0 ? 1 : n), theta_(theta) {
    if (theta_ <= 0.0) {
        theta_ = 0.0;
        return;
    }
    zetan_ = zeta(n_, theta_);
    alpha_ = 1.0 / (1.0 - theta_);
    const double zeta2 = zeta(2, theta_);
    eta_ = (1.0 - std::pow(2.0 / static_cast<double>(n_), 1.0 - theta_)) /
           (1.0 - zeta2 / zetan_);
}

double ZipfGenerator::zeta(uint64_t n, double theta) {
    double sum = 0.0;
    for (uint64_t i = 1; i <= n; ++i) {
        sum += 1.0 / std::pow(static_cast<double>(i), theta);
    }
    return sum;
}

uint64_t ZipfGenerator::next(std::mt19937_64& rng) {
    if (theta_ == 0.0) {
        return std::uniform_int_distribution<uint64_t>(0, n_ - 1)(rng);
    }

    const double u = unit_(rng);
    const double uz = u * zetan_;
    if (uz < 1.0) {
        return 0;
    }
    if (uz < 1.0 + std::pow(0.5, theta_)) {
        return n_ > 1 ? 1 : 0;
    }
    auto value = static_cast<uint64_t>(static_cast<double>(n_) *
                                       std::pow(eta_ * u - eta_ + 1.0, alpha_));
    return value < n_ ? value : n_ - 1;
}

}  // namespace tessera
