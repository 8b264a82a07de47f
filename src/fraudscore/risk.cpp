// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/risk.h>
#include <fraudscore/stats.h>

namespace fraudscore {

double RiskWeights::Get(DetectorKind kind) const
{
    switch (kind) {
        case DetectorKind::TEMPORAL: return temporal;
        case DetectorKind::VALUE: return value;
        case DetectorKind::NETWORK: return network;
        case DetectorKind::TOKEN: return token;
        case DetectorKind::BEHAVIORAL: return behavioral;
    }
    return 0;
}

double AggregateRisk(const PatternReport& report, const RiskWeights& weights)
{
    double score = 0;
    for (const PatternFinding& finding : report.Findings()) {
        score += weights.Get(finding.kind) * Clamp01(finding.riskLevel);
    }
    return Clamp01(score);
}

std::string DescribeRisk(double behavioralRisk)
{
    if (behavioralRisk > 0.6) return "HIGH RISK";
    if (behavioralRisk > 0.35) return "MEDIUM RISK";
    return "LOW RISK";
}

} // namespace fraudscore
