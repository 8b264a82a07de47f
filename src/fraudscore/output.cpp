// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/output.h>

namespace fraudscore {

static UniValue StringsToJSON(const std::vector<std::string>& items)
{
    UniValue arr(UniValue::VARR);
    for (const std::string& item : items) {
        arr.push_back(item);
    }
    return arr;
}

UniValue NeighborToJSON(const NeighborEvidence& neighbor)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", neighbor.address);
    obj.pushKV("flag", neighbor.label);
    obj.pushKV("distance", neighbor.distance);
    return obj;
}

UniValue PatternReportToJSON(const PatternReport& report)
{
    UniValue obj(UniValue::VOBJ);
    for (const PatternFinding& finding : report.Findings()) {
        UniValue entry(UniValue::VOBJ);
        UniValue tags(UniValue::VARR);
        for (PatternTag tag : finding.tags) {
            tags.push_back(PatternTagName(tag));
        }
        entry.pushKV("patterns", tags);
        entry.pushKV("risk_level", finding.riskLevel);
        UniValue metrics(UniValue::VOBJ);
        for (const auto& metric : finding.metrics) {
            metrics.pushKV(metric.first, metric.second);
        }
        entry.pushKV("metrics", metrics);
        obj.pushKV(DetectorKindName(finding.kind), entry);
    }
    return obj;
}

UniValue ScoreDecisionToJSON(const ScoreDecision& decision)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("final_decision", FraudLabelName(decision.label));
    obj.pushKV("confidence", decision.confidence);
    obj.pushKV("reasoning", decision.reasoning);
    obj.pushKV("risk_factors", StringsToJSON(decision.riskFactors));
    obj.pushKV("edge_cases", StringsToJSON(decision.edgeCases));
    obj.pushKV("behavioral_score", decision.behavioralScore);
    obj.pushKV("validation", ValidationToJSON(decision.validation));
    UniValue guardrails(UniValue::VARR);
    for (Guardrail guardrail : decision.guardrailsApplied) {
        guardrails.push_back(GuardrailName(guardrail));
    }
    obj.pushKV("guardrails", guardrails);
    return obj;
}

UniValue ScoreResultToJSON(const ScoreResult& result)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", result.reference);
    obj.pushKV("status", ScoreStatusName(result.status));
    if (!result.message.empty()) {
        obj.pushKV("message", result.message);
    }

    if (result.status == ScoreStatus::OK) {
        const UniValue decision = ScoreDecisionToJSON(result.decision);
        const std::vector<std::string>& keys = decision.getKeys();
        for (size_t i = 0; i < keys.size(); ++i) {
            obj.pushKV(keys[i], decision[keys[i]]);
        }
    }

    UniValue features(UniValue::VOBJ);
    for (const auto& feature : result.features) {
        features.pushKV(feature.first, feature.second);
    }
    obj.pushKV("features", features);

    UniValue neighbors(UniValue::VARR);
    for (const NeighborEvidence& neighbor : result.topNeighbors) {
        neighbors.push_back(NeighborToJSON(neighbor));
    }
    obj.pushKV("top_neighbors", neighbors);

    if (result.neighbors.HasEvidence()) {
        UniValue analysis(UniValue::VOBJ);
        analysis.pushKV("fraud_probability", result.neighbors.fraudProbability);
        analysis.pushKV("simple_probability", result.neighbors.simpleProbability);
        analysis.pushKV("confidence", result.neighbors.confidence);
        analysis.pushKV("avg_distance", result.neighbors.avgDistance);
        analysis.pushKV("fraud_count", result.neighbors.fraudCount);
        analysis.pushKV("total_count", result.neighbors.totalCount);
        analysis.pushKV("label", FraudLabelName(result.neighborLabel));
        obj.pushKV("neighbor_analysis", analysis);
        obj.pushKV("patterns", PatternReportToJSON(result.patterns));
    }

    obj.pushKV("scaler_version", static_cast<int64_t>(result.scalerVersion));
    obj.pushKV("used_fallback", result.usedFallback);
    if (result.usedFallback) {
        obj.pushKV("fallback_reason", result.fallbackReason);
    }
    obj.pushKV("oracle_status", OracleCallStatusName(result.oracleStatus));
    obj.pushKV("oracle_attempts", result.oracleAttempts);
    obj.pushKV("ledger_updated", result.ledgerUpdated);
    return obj;
}

} // namespace fraudscore
