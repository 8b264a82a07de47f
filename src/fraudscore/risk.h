// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_RISK_H
#define FRAUDSCORE_RISK_H

#include <fraudscore/patterns.h>

#include <string>

namespace fraudscore {

/**
 * Detector weights of the behavioral risk score. They sum to 1, so the
 * score stays within [0,1] even when every detector is saturated.
 */
struct RiskWeights {
    double temporal;
    double value;
    double network;
    double token;
    double behavioral;

    RiskWeights() : temporal(0.15), value(0.25), network(0.25), token(0.15), behavioral(0.20) {}

    double Get(DetectorKind kind) const;
};

/** clamp(sum of weight * risk level, 0, 1) */
double AggregateRisk(const PatternReport& report, const RiskWeights& weights = RiskWeights());

/** "HIGH RISK" above 0.6, "MEDIUM RISK" above 0.35, "LOW RISK" otherwise */
std::string DescribeRisk(double behavioralRisk);

} // namespace fraudscore

#endif // FRAUDSCORE_RISK_H
