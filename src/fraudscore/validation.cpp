// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/validation.h>
#include <fraudscore/stats.h>

#include <univalue.h>

#include <cmath>

namespace fraudscore {

std::string QualityTierName(QualityTier tier)
{
    switch (tier) {
        case QualityTier::LOW: return "low";
        case QualityTier::MEDIUM: return "medium";
        case QualityTier::HIGH: return "high";
    }
    return "low";
}

const std::set<PatternTag>& MixerArchetype()
{
    static const std::set<PatternTag> tags = {
        PatternTag::MIXER_VALUE_FLOW, PatternTag::HIGH_ADDRESS_DIVERSITY, PatternTag::DUST_ACCOUNT};
    return tags;
}

const std::set<PatternTag>& WashTradingArchetype()
{
    static const std::set<PatternTag> tags = {
        PatternTag::TOKEN_WASH_TRADING, PatternTag::MATCHING_SEND_RECEIVE};
    return tags;
}

const std::set<PatternTag>& BotArchetype()
{
    static const std::set<PatternTag> tags = {
        PatternTag::REGULAR_INTERVAL, PatternTag::BURST_ACTIVITY};
    return tags;
}

ValidationReport CrossValidate(const NeighborAnalysis& neighbors, const PatternReport& report,
                               double behavioralRisk, const ValidationThresholds& t)
{
    ValidationReport result;
    const double p = Clamp01(neighbors.fraudProbability);
    const double r = Clamp01(behavioralRisk);

    result.alignment = (p > t.alignHighProbability && r > t.alignHighRisk) ||
                       (p < t.alignLowProbability && r < t.alignLowRisk);
    result.confidenceFloorMet = neighbors.confidence >= t.confidenceFloor;

    static const DetectorKind signalKinds[] = {
        DetectorKind::TEMPORAL, DetectorKind::VALUE, DetectorKind::NETWORK, DetectorKind::BEHAVIORAL};
    for (DetectorKind kind : signalKinds) {
        if (report.Get(kind).riskLevel > t.signalRiskLevel) ++result.highRiskSignalCount;
    }
    result.multipleRiskSignals = result.highRiskSignalCount >= t.minRiskSignals;

    result.mixerProfile = report.HasAnyTag(MixerArchetype());
    result.washTrading = report.HasAnyTag(WashTradingArchetype());
    result.botBehavior = report.HasAnyTag(BotArchetype());

    double score = 0.3 * (result.alignment ? 1 : 0) +
                   0.2 * (result.confidenceFloorMet ? 1 : 0) +
                   0.3 * (result.multipleRiskSignals ? 1 : 0) +
                   0.2 * (1.0 - std::fabs(p - r));
    result.overallScore = Clamp01(score);

    if (result.overallScore > t.highTierScore) {
        result.qualityTier = QualityTier::HIGH;
    } else if (result.overallScore > t.mediumTierScore) {
        result.qualityTier = QualityTier::MEDIUM;
    } else {
        result.qualityTier = QualityTier::LOW;
    }
    return result;
}

UniValue ValidationToJSON(const ValidationReport& v)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("alignment", v.alignment);
    obj.pushKV("confidence_floor_met", v.confidenceFloorMet);
    obj.pushKV("multiple_risk_signals", v.multipleRiskSignals);
    obj.pushKV("high_risk_signal_count", v.highRiskSignalCount);
    obj.pushKV("mixer_profile_detected", v.mixerProfile);
    obj.pushKV("wash_trading_detected", v.washTrading);
    obj.pushKV("bot_behavior_detected", v.botBehavior);
    obj.pushKV("overall_validation_score", v.overallScore);
    obj.pushKV("decision_quality", QualityTierName(v.qualityTier));
    return obj;
}

} // namespace fraudscore
