// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_OUTPUT_H
#define FRAUDSCORE_OUTPUT_H

#include <fraudscore/pipeline.h>

#include <univalue.h>

namespace fraudscore {

UniValue NeighborToJSON(const NeighborEvidence& neighbor);
UniValue PatternReportToJSON(const PatternReport& report);
UniValue ScoreDecisionToJSON(const ScoreDecision& decision);

/**
 * Caller-facing rendering of one scoring result:
 *
 *   {"address", "status", "message"?, "final_decision", "confidence",
 *    "reasoning", "risk_factors", "edge_cases", "behavioral_score",
 *    "validation", "guardrails", "features", "top_neighbors",
 *    "neighbor_analysis", "patterns", "scaler_version", "used_fallback",
 *    "oracle_status", ...}
 *
 * Decision fields are present only when status is "ok".
 */
UniValue ScoreResultToJSON(const ScoreResult& result);

} // namespace fraudscore

#endif // FRAUDSCORE_OUTPUT_H
