// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_EDGECASES_H
#define FRAUDSCORE_EDGECASES_H

#include <fraudscore/features.h>
#include <fraudscore/neighbors.h>
#include <fraudscore/patterns.h>

#include <string>
#include <vector>

namespace fraudscore {

struct EdgeCaseThresholds {
    double highVolumeMinTx;
    double minimalBalance;
    double imbalanceHighRatio;
    double imbalanceLowRatio;
    double largeValue;
    double shortSpanMinutes;
    double shortSpanMinTx;
    double lowNeighborConfidence;
    double heavyTokenShare;
    double highRiskPattern;

    EdgeCaseThresholds()
        : highVolumeMinTx(100), minimalBalance(0.1)
        , imbalanceHighRatio(10), imbalanceLowRatio(0.1)
        , largeValue(1000)
        , shortSpanMinutes(1440), shortSpanMinTx(50)
        , lowNeighborConfidence(0.5)
        , heavyTokenShare(0.8)
        , highRiskPattern(0.5)
    {}
};

/**
 * Describe unusual account traits for the reasoning oracle and the final
 * decision. Notes are informational; they never change a label.
 */
std::vector<std::string> DetectEdgeCases(const FeatureMap& features, const NeighborAnalysis& neighbors,
                                         const PatternReport& report,
                                         const EdgeCaseThresholds& thresholds = EdgeCaseThresholds());

} // namespace fraudscore

#endif // FRAUDSCORE_EDGECASES_H
