// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/edgecases.h>

#include <tinyformat.h>

namespace fraudscore {

std::vector<std::string> DetectEdgeCases(const FeatureMap& features, const NeighborAnalysis& neighbors,
                                         const PatternReport& report, const EdgeCaseThresholds& t)
{
    std::vector<std::string> notes;

    const double sentTx = GetFeature(features, FEATURE_SENT_TNX);
    const double receivedTx = GetFeature(features, FEATURE_RECEIVED_TNX);
    const double balance = GetFeature(features, FEATURE_BALANCE);
    const double etherSent = GetFeature(features, FEATURE_TOTAL_ETHER_SENT);
    const double etherReceived = GetFeature(features, FEATURE_TOTAL_ETHER_RECEIVED);

    if (sentTx + receivedTx > t.highVolumeMinTx && balance < t.minimalBalance) {
        notes.push_back("High transaction volume with minimal balance - possible mixer/tumbler");
    }

    if (sentTx > 0 && receivedTx > 0) {
        double ratio = sentTx / receivedTx;
        if (ratio > t.imbalanceHighRatio || ratio < t.imbalanceLowRatio) {
            notes.push_back(tfm::format("Highly imbalanced transaction ratio (%.2f)", ratio));
        }
    }

    if (etherSent > t.largeValue || etherReceived > t.largeValue) {
        notes.push_back("Large value movements detected - high-value account");
    }

    if (GetFeature(features, FEATURE_TIME_SPAN_MINS) < t.shortSpanMinutes && sentTx + receivedTx > t.shortSpanMinTx) {
        notes.push_back("High activity in short time period - possible bot");
    }

    if (neighbors.confidence < t.lowNeighborConfidence) {
        notes.push_back("Neighbor evidence low confidence - unusual account pattern");
    }

    const double tokenTx = GetFeature(features, FEATURE_TOTAL_TOKEN_TNXS);
    const double totalTx = GetFeature(features, FEATURE_TOTAL_TX);
    if (totalTx > 0 && tokenTx / totalTx > t.heavyTokenShare) {
        notes.push_back("Heavy ERC20 usage - DeFi power user");
    }

    for (const PatternFinding& finding : report.Findings()) {
        if (finding.riskLevel > t.highRiskPattern) {
            notes.push_back(tfm::format("High-risk %s detected (score: %.2f)", DetectorKindName(finding.kind), finding.riskLevel));
        }
    }
    return notes;
}

} // namespace fraudscore
