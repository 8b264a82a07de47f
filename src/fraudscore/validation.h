// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_VALIDATION_H
#define FRAUDSCORE_VALIDATION_H

#include <fraudscore/neighbors.h>
#include <fraudscore/patterns.h>

#include <set>
#include <string>

class UniValue;

namespace fraudscore {

enum class QualityTier {
    LOW,
    MEDIUM,
    HIGH
};

/** "low", "medium" or "high" */
std::string QualityTierName(QualityTier tier);

struct ValidationThresholds {
    double alignHighProbability;        // fraud side: p above
    double alignHighRisk;               //             and r above
    double alignLowProbability;         // legit side: p below
    double alignLowRisk;                //             and r below
    double confidenceFloor;
    double signalRiskLevel;             // detector counts as a signal above this
    int minRiskSignals;
    double highTierScore;
    double mediumTierScore;

    ValidationThresholds()
        : alignHighProbability(0.7), alignHighRisk(0.6)
        , alignLowProbability(0.3), alignLowRisk(0.4)
        , confidenceFloor(0.4), signalRiskLevel(0.5), minRiskSignals(2)
        , highTierScore(0.7), mediumTierScore(0.4)
    {}
};

/**
 * Validation Report
 *
 * Agreement between the neighbor evidence and the behavioral detectors.
 */
struct ValidationReport {
    bool alignment;                     // neighbors and behavior point the same way
    bool confidenceFloorMet;
    bool multipleRiskSignals;
    int highRiskSignalCount;
    bool mixerProfile;
    bool washTrading;
    bool botBehavior;
    double overallScore;                // 0.0-1.0
    QualityTier qualityTier;

    ValidationReport() : alignment(false), confidenceFloorMet(false), multipleRiskSignals(false),
                         highRiskSignalCount(0), mixerProfile(false), washTrading(false),
                         botBehavior(false), overallScore(0), qualityTier(QualityTier::LOW) {}
};

/** Tags that make up each fraud archetype */
const std::set<PatternTag>& MixerArchetype();
const std::set<PatternTag>& WashTradingArchetype();
const std::set<PatternTag>& BotArchetype();

/**
 * Cross-check the evidence sources.
 *
 * score = 0.3 * alignment + 0.2 * floor + 0.3 * multiple + 0.2 * (1 - |p - r|)
 *
 * The token detector does not count towards the multiple-signal check.
 */
ValidationReport CrossValidate(const NeighborAnalysis& neighbors, const PatternReport& report,
                               double behavioralRisk,
                               const ValidationThresholds& thresholds = ValidationThresholds());

/** Render a validation report with the field names used in oracle prompts and output */
UniValue ValidationToJSON(const ValidationReport& report);

} // namespace fraudscore

#endif // FRAUDSCORE_VALIDATION_H
