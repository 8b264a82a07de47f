// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_STATS_H
#define FRAUDSCORE_STATS_H

#include <cmath>
#include <cstdint>
#include <vector>

namespace fraudscore {

/** Map NaN and +/-Infinity to 0 */
inline double SanitizeValue(double value)
{
    return std::isfinite(value) ? value : 0.0;
}

/** Clamp to [0,1]; non-finite input becomes 0 */
inline double Clamp01(double value)
{
    if (!std::isfinite(value)) return 0.0;
    if (value < 0.0) return 0.0;
    if (value > 1.0) return 1.0;
    return value;
}

double CalculateMean(const std::vector<double>& values);

/** Population standard deviation; 0 for fewer than two values */
double CalculateStdDev(const std::vector<double>& values, double mean);

/**
 * Mean gap between consecutive entries of the ascending-sorted timestamps,
 * in seconds. 0 when fewer than two timestamps.
 */
double AverageGapSeconds(std::vector<int64_t> timestamps);

/** Gaps between consecutive entries of an ascending-sorted list */
std::vector<double> ConsecutiveGaps(const std::vector<int64_t>& sortedTimestamps);

} // namespace fraudscore

#endif // FRAUDSCORE_STATS_H
