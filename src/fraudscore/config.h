// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_CONFIG_H
#define FRAUDSCORE_CONFIG_H

/**
 * Scoring configuration and its initialization from gArgs (command line
 * and config file).
 */

#include <fraudscore/edgecases.h>
#include <fraudscore/fusion.h>
#include <fraudscore/oracle.h>
#include <fraudscore/patterns.h>
#include <fraudscore/risk.h>
#include <fraudscore/scoreledger.h>
#include <fraudscore/validation.h>

#include <cstdint>
#include <string>

namespace fraudscore {

static const int64_t DEFAULT_KNN = 10;
static const int64_t MAX_KNN = 1000;

/** Every tunable of the scoring pipeline */
struct FraudScoreConfig {
    size_t k;                               // neighbors requested from the index
    double decisionThreshold;
    double decisionConfidenceFloor;
    DetectorThresholds detectors;
    RiskWeights riskWeights;
    ValidationThresholds validation;
    EdgeCaseThresholds edgeCases;
    FusionThresholds fusion;
    ReasoningAdapterConfig oracle;
    std::string oracleUrl;                  // empty = no oracle, fallback voting only
    std::string oracleApiKey;
    double ledgerStep;

    FraudScoreConfig()
        : k(DEFAULT_KNN)
        , decisionThreshold(DEFAULT_DECISION_THRESHOLD)
        , decisionConfidenceFloor(DEFAULT_DECISION_CONFIDENCE_FLOOR)
        , ledgerStep(DEFAULT_LEDGER_STEP)
    {}
};

/**
 * Get help message for the scoring options
 * @return Help message string
 */
std::string GetFraudScoreHelpMessage();

/**
 * Initialize the configuration from gArgs. Options that are not set keep
 * the value already in config.
 * @return false with error naming the offending option on bad input
 */
bool InitFraudScoreConfig(FraudScoreConfig& config, std::string& error);

} // namespace fraudscore

#endif // FRAUDSCORE_CONFIG_H
