// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_PIPELINE_H
#define FRAUDSCORE_PIPELINE_H

#include <fraudscore/collaborators.h>
#include <fraudscore/config.h>
#include <fraudscore/features.h>
#include <fraudscore/fusion.h>
#include <fraudscore/neighbors.h>
#include <fraudscore/oracle.h>
#include <fraudscore/patterns.h>
#include <fraudscore/reference.h>
#include <fraudscore/validation.h>

#include <memory>
#include <string>
#include <vector>

namespace fraudscore {

/** Number of closest neighbors reported back to the caller */
static const size_t TOP_NEIGHBORS_REPORTED = 5;

enum class PipelineStage {
    FEATURE_BUILD,
    NEIGHBOR_EVIDENCE,
    PATTERN_DETECT,
    AGGREGATE,
    VALIDATE,
    REASON,
    FUSE,
    DONE
};

std::string PipelineStageName(PipelineStage stage);

enum class ScoreStatus {
    OK,
    EVIDENCE_UNAVAILABLE,       // no reference snapshot or no neighbors; never a NotFraud
    CANCELLED                   // abandoned by the caller, nothing persisted
};

std::string ScoreStatusName(ScoreStatus status);

/**
 * Per-request state. Stages never modify a context in place: each takes
 * the previous one and returns an augmented copy with `stage` advanced.
 */
struct ScoringContext {
    PipelineStage stage;
    std::string reference;
    std::shared_ptr<const AccountActivity> activity;
    ReferenceSnapshotRef snapshot;              // scaler and index, captured once per request
    FeatureMap features;
    FeatureVector raw;
    FeatureVector normalized;
    std::vector<NeighborEvidence> neighbors;    // ascending distance, at most k
    NeighborAnalysis neighborAnalysis;
    PatternReport patterns;
    double behavioralRisk;
    ValidationReport validation;
    std::vector<std::string> edgeCases;
    ReasoningOutcome reasoning;
    ScoreDecision decision;

    ScoringContext() : stage(PipelineStage::FEATURE_BUILD), behavioralRisk(0) {}
};

/** Everything the caller gets back for one scoring request */
struct ScoreResult {
    ScoreStatus status;
    std::string message;
    std::string reference;
    ScoreDecision decision;
    FraudLabel neighborLabel;                   // neighbor evidence alone
    FeatureMap features;
    NeighborAnalysis neighbors;
    std::vector<NeighborEvidence> topNeighbors;
    PatternReport patterns;
    uint32_t scalerVersion;
    bool usedFallback;
    std::string fallbackReason;
    OracleCallStatus oracleStatus;
    int oracleAttempts;
    bool ledgerUpdated;

    ScoreResult() : status(ScoreStatus::OK), neighborLabel(FraudLabel::UNDECIDED), scalerVersion(0),
                    usedFallback(false), oracleStatus(OracleCallStatus::OK), oracleAttempts(0),
                    ledgerUpdated(false) {}
};

/**
 * Sequences the scoring stages over one account:
 * FEATURE_BUILD -> NEIGHBOR_EVIDENCE -> PATTERN_DETECT -> AGGREGATE ->
 * VALIDATE -> REASON -> FUSE.
 *
 * The reference snapshot is captured once when the request arrives; a
 * rebuild published meanwhile does not affect it. Pattern detection starts
 * on its own task as soon as the request arrives and is joined at
 * PATTERN_DETECT. Outcomes other than Undecided are
 * written to the ledger, if one is attached.
 */
class ScoringPipeline {
public:
    ScoringPipeline(const ReferenceRegistry& references, ReasoningAdapter& adapter, ScoreLedger* ledger,
                    const FraudScoreConfig& config);

    ScoreResult Score(const std::string& reference, const AccountActivity& activity,
                      const CancellationToken& cancel = CancellationToken());

    /** Fetch the history first; false with error when the source fails */
    bool Score(ActivitySource& source, const std::string& reference, const CancellationToken& cancel,
               ScoreResult& result, std::string& error);

private:
    const ReferenceRegistry& m_references;
    ReasoningAdapter& m_adapter;
    ScoreLedger* m_ledger;
    const FraudScoreConfig m_config;

    ScoringContext BuildFeatures(const ScoringContext& in) const;
    ScoringContext GatherNeighbors(const ScoringContext& in) const;
    ScoringContext CollectPatterns(const ScoringContext& in, PatternReport patterns) const;
    ScoringContext Aggregate(const ScoringContext& in) const;
    ScoringContext Validate(const ScoringContext& in) const;
    ScoringContext Reason(const ScoringContext& in, const CancellationToken& cancel) const;
    ScoringContext Fuse(const ScoringContext& in) const;

    void Persist(const ScoringContext& ctx, ScoreResult& result) const;
};

} // namespace fraudscore

#endif // FRAUDSCORE_PIPELINE_H
