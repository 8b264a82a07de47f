// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/stats.h>

#include <algorithm>
#include <numeric>

namespace fraudscore {

double CalculateMean(const std::vector<double>& values)
{
    if (values.empty()) return 0;
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return SanitizeValue(sum / values.size());
}

double CalculateStdDev(const std::vector<double>& values, double mean)
{
    if (values.size() < 2) return 0;

    double variance = 0;
    for (double val : values) {
        variance += (val - mean) * (val - mean);
    }
    variance /= values.size();

    return SanitizeValue(std::sqrt(variance));
}

std::vector<double> ConsecutiveGaps(const std::vector<int64_t>& sortedTimestamps)
{
    std::vector<double> gaps;
    if (sortedTimestamps.size() < 2) return gaps;
    gaps.reserve(sortedTimestamps.size() - 1);
    for (size_t i = 1; i < sortedTimestamps.size(); ++i) {
        gaps.push_back(static_cast<double>(sortedTimestamps[i] - sortedTimestamps[i - 1]));
    }
    return gaps;
}

double AverageGapSeconds(std::vector<int64_t> timestamps)
{
    if (timestamps.size() < 2) return 0;
    std::sort(timestamps.begin(), timestamps.end());
    return CalculateMean(ConsecutiveGaps(timestamps));
}

} // namespace fraudscore
