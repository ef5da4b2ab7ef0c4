/**
 * @file parallelism.cpp
 * @brief Parallelism report implementation
 */

#include "execution/parallelism.hpp"

#include <algorithm>
#include <cmath>

namespace tessera {

std::vector<size_t> dependency_levels(const DependencyTracker& tracker) {
    std::vector<size_t> levels(tracker.size(), 0);
    for (txn_idx_t idx = 0; idx < tracker.size(); ++idx) {
        for (txn_idx_t source : tracker.read_from(idx)) {
            if (source < idx) {
                levels[idx] = std::max(levels[idx], levels[source] + 1);
            }
        }
    }
    return levels;
}

ParallelismReport compute_parallelism(const DependencyTracker& tracker) {
    ParallelismReport report;
    report.total_txns = tracker.size();
    if (report.total_txns == 0) {
        return report;
    }

    std::vector<size_t> levels = dependency_levels(tracker);
    report.depth = *std::max_element(levels.begin(), levels.end()) + 1;

    std::vector<size_t> widths(report.depth, 0);
    for (size_t level : levels) {
        ++widths[level];
    }

    report.max_width = *std::max_element(widths.begin(), widths.end());
    report.average_width =
        static_cast<double>(report.total_txns) / static_cast<double>(report.depth);

    double variance = 0.0;
    for (size_t width : widths) {
        double diff = static_cast<double>(width) - report.average_width;
        variance += diff * diff;
    }
    report.width_std_dev = std::sqrt(variance / static_cast<double>(report.depth));
    return report;
}

}  // namespace tessera
