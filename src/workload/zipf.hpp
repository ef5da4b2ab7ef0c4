#pragma once

/**
 * @file zipf.hpp
 * @brief Zipfian integer generator (Gray et al., "Quickly generating
 *        billion-record synthetic databases")
 */

#include <cstdint>
#include <random>

namespace tessera {

/**
 * @brief Draws integers in [0, n) where small values are the hot ones
 *
 * theta == 0 is uniform; theta close to 1 concentrates draws on a few
 * values. theta must be in [0, 1).
 */
class ZipfGenerator {
public:
    ZipfGenerator(uint64_t n, double theta);

    [[nodiscard]] uint64_t next(std::mt19937_64& rng);

    [[nodiscard]] uint64_t n() const noexcept { return n_; }
    [[nodiscard]] double theta() const noexcept { return theta_; }

private:
    static double zeta(uint64_t n, double theta);

    uint64_t n_;
    double theta_;
    double alpha_ = 0.0;
    double zetan_ = 0.0;
    double eta_ = 0.0;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

}  // namespace tessera
