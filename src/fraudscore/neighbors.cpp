// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/neighbors.h>
#include <fraudscore/stats.h>

#include <algorithm>
#include <cmath>

namespace fraudscore {

std::string FraudLabelName(FraudLabel label)
{
    switch (label) {
        case FraudLabel::FRAUD: return "Fraud";
        case FraudLabel::NOT_FRAUD: return "Not_Fraud";
        case FraudLabel::UNDECIDED: return "Undecided";
    }
    return "Undecided";
}

NeighborAnalysis AnalyzeNeighbors(const std::vector<NeighborEvidence>& neighbors, double epsilon)
{
    NeighborAnalysis result;
    if (!(epsilon > 0)) {
        epsilon = DEFAULT_DISTANCE_EPSILON;
    }

    double weightSum = 0;
    double fraudWeight = 0;
    double distanceSum = 0;
    int fraudCount = 0;
    int total = 0;
    for (const NeighborEvidence& n : neighbors) {
        // An infinite or NaN distance is no measurement at all
        if (!std::isfinite(n.distance)) {
            continue;
        }
        double distance = n.distance > 0 ? n.distance : 0.0;
        bool isFraud = n.label != 0;
        double weight = 1.0 / (distance + epsilon);
        weightSum += weight;
        if (isFraud) {
            fraudWeight += weight;
            ++fraudCount;
        }
        distanceSum += distance;
        ++total;
    }
    if (total == 0) {
        return result;
    }

    result.totalCount = total;
    result.fraudCount = fraudCount;
    result.fraudProbability = weightSum > 0 ? Clamp01(fraudWeight / weightSum) : 0.5;
    result.simpleProbability = Clamp01(static_cast<double>(fraudCount) / total);
    result.avgDistance = SanitizeValue(distanceSum / total);

    double distanceConfidence = 1.0 / (1.0 + result.avgDistance);
    double agreement = static_cast<double>(std::max(fraudCount, total - fraudCount)) / total;
    result.confidence = Clamp01((distanceConfidence + agreement) / 2.0);
    return result;
}

FraudLabel ClassifyProbability(double probability, double confidence, double threshold, double confidenceFloor)
{
    if (!(confidence >= confidenceFloor)) {
        return FraudLabel::UNDECIDED;
    }
    if (probability >= threshold) {
        return FraudLabel::FRAUD;
    }
    if (probability < 1.0 - threshold) {
        return FraudLabel::NOT_FRAUD;
    }
    return FraudLabel::UNDECIDED;
}

} // namespace fraudscore
