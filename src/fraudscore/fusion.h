// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_FUSION_H
#define FRAUDSCORE_FUSION_H

#include <fraudscore/neighbors.h>
#include <fraudscore/oracle.h>
#include <fraudscore/validation.h>

#include <string>
#include <vector>

namespace fraudscore {

/**
 * Guardrail thresholds. A guardrail can only move a decision to Undecided.
 */
struct FusionThresholds {
    // 1. insufficient neighbor evidence
    double minNeighborConfidence;
    double lowConfidenceCap;
    // 2. fraud call without support
    double fraudMaxProbability;
    double fraudMaxRisk;
    double fraudMinNeighborConfidence;
    double fraudCap;
    // 3. legitimate call contradicted by strong signals
    double notFraudMinProbability;
    double notFraudMinRisk;
    double notFraudCap;

    FusionThresholds()
        : minNeighborConfidence(0.25), lowConfidenceCap(0.4)
        , fraudMaxProbability(0.5), fraudMaxRisk(0.4), fraudMinNeighborConfidence(0.3), fraudCap(0.5)
        , notFraudMinProbability(0.6), notFraudMinRisk(0.6), notFraudCap(0.5)
    {}
};

enum class Guardrail {
    LOW_NEIGHBOR_CONFIDENCE,
    UNSUPPORTED_FRAUD,
    CONTRADICTED_NOT_FRAUD
};

std::string GuardrailName(Guardrail guardrail);

/**
 * Score Decision
 *
 * Final classification handed to the caller.
 */
struct ScoreDecision {
    FraudLabel label;
    double confidence;                          // 0.0-1.0
    std::string reasoning;
    std::vector<std::string> riskFactors;
    std::vector<std::string> edgeCases;
    double behavioralScore;                     // 0.0-1.0
    ValidationReport validation;
    std::vector<Guardrail> guardrailsApplied;

    ScoreDecision() : label(FraudLabel::UNDECIDED), confidence(0), behavioralScore(0) {}
};

/** Wrap a tentative verdict as an unfused decision */
ScoreDecision MakeTentativeDecision(const OracleVerdict& verdict);

/**
 * Apply the guardrails in order:
 *  1. neighbor confidence below the minimum forces Undecided;
 *  2. a Fraud call with low probability and low risk on confident
 *     neighbors becomes Undecided;
 *  3. a NotFraud call against high probability and high risk becomes
 *     Undecided;
 * and attach the validation report and behavioral score. Each override
 * caps the confidence and appends a bracketed note to the reasoning.
 * Applying it to its own output changes nothing.
 */
ScoreDecision FuseDecision(const ScoreDecision& tentative, const NeighborAnalysis& neighbors,
                           double behavioralRisk, const ValidationReport& validation,
                           const FusionThresholds& thresholds = FusionThresholds());

} // namespace fraudscore

#endif // FRAUDSCORE_FUSION_H
