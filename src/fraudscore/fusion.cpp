// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/fusion.h>
#include <fraudscore/stats.h>
#include <util.h>

#include <algorithm>

namespace fraudscore {

std::string GuardrailName(Guardrail guardrail)
{
    switch (guardrail) {
        case Guardrail::LOW_NEIGHBOR_CONFIDENCE: return "low_neighbor_confidence";
        case Guardrail::UNSUPPORTED_FRAUD: return "unsupported_fraud";
        case Guardrail::CONTRADICTED_NOT_FRAUD: return "contradicted_not_fraud";
    }
    return "unknown";
}

ScoreDecision MakeTentativeDecision(const OracleVerdict& verdict)
{
    ScoreDecision decision;
    decision.label = verdict.label;
    decision.confidence = Clamp01(verdict.confidence);
    decision.reasoning = verdict.reasoning;
    decision.riskFactors = verdict.riskFactors;
    decision.edgeCases = verdict.edgeCases;
    return decision;
}

static void Override(ScoreDecision& decision, Guardrail guardrail, double cap, const char* note)
{
    LogPrint(BCLog::SCORING, "Guardrail %s: %s -> Undecided\n", GuardrailName(guardrail), FraudLabelName(decision.label));
    decision.label = FraudLabel::UNDECIDED;
    decision.confidence = std::min(decision.confidence, cap);
    if (!decision.reasoning.empty()) decision.reasoning += " ";
    decision.reasoning += note;
    decision.guardrailsApplied.push_back(guardrail);
}

ScoreDecision FuseDecision(const ScoreDecision& tentative, const NeighborAnalysis& neighbors,
                           double behavioralRisk, const ValidationReport& validation,
                           const FusionThresholds& t)
{
    ScoreDecision result = tentative;
    result.confidence = Clamp01(result.confidence);
    const double p = neighbors.fraudProbability;
    const double r = Clamp01(behavioralRisk);
    const double c = neighbors.confidence;

    if (c < t.minNeighborConfidence && result.label != FraudLabel::UNDECIDED) {
        Override(result, Guardrail::LOW_NEIGHBOR_CONFIDENCE, t.lowConfidenceCap,
                 "[Overridden to Undecided due to very low neighbor confidence]");
    }

    if (result.label == FraudLabel::FRAUD &&
        p < t.fraudMaxProbability && r < t.fraudMaxRisk && c > t.fraudMinNeighborConfidence) {
        Override(result, Guardrail::UNSUPPORTED_FRAUD, t.fraudCap,
                 "[Adjusted to Undecided - weak fraud signals]");
    }

    if (result.label == FraudLabel::NOT_FRAUD &&
        p > t.notFraudMinProbability && r > t.notFraudMinRisk) {
        Override(result, Guardrail::CONTRADICTED_NOT_FRAUD, t.notFraudCap,
                 "[Adjusted to Undecided - strong fraud signals present]");
    }

    result.validation = validation;
    result.behavioralScore = r;
    result.confidence = Clamp01(result.confidence);
    return result;
}

} // namespace fraudscore
