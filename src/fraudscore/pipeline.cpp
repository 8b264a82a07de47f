// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/pipeline.h>
#include <fraudscore/edgecases.h>
#include <fraudscore/risk.h>
#include <util.h>
#include <utiltime.h>

#include <algorithm>
#include <future>

namespace fraudscore {

std::string PipelineStageName(PipelineStage stage)
{
    switch (stage) {
        case PipelineStage::FEATURE_BUILD: return "FEATURE_BUILD";
        case PipelineStage::NEIGHBOR_EVIDENCE: return "NEIGHBOR_EVIDENCE";
        case PipelineStage::PATTERN_DETECT: return "PATTERN_DETECT";
        case PipelineStage::AGGREGATE: return "AGGREGATE";
        case PipelineStage::VALIDATE: return "VALIDATE";
        case PipelineStage::REASON: return "REASON";
        case PipelineStage::FUSE: return "FUSE";
        case PipelineStage::DONE: return "DONE";
    }
    return "UNKNOWN";
}

std::string ScoreStatusName(ScoreStatus status)
{
    switch (status) {
        case ScoreStatus::OK: return "ok";
        case ScoreStatus::EVIDENCE_UNAVAILABLE: return "evidence_unavailable";
        case ScoreStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

ScoringPipeline::ScoringPipeline(const ReferenceRegistry& references, ReasoningAdapter& adapter,
                                 ScoreLedger* ledger, const FraudScoreConfig& config)
    : m_references(references), m_adapter(adapter), m_ledger(ledger), m_config(config)
{
}

ScoringContext ScoringPipeline::BuildFeatures(const ScoringContext& in) const
{
    ScoringContext out = in;
    out.features = BuildFeatureMap(*in.activity);
    out.raw = FeaturesToVector(out.features);
    out.normalized = Normalize(*in.snapshot->scaler, out.raw);
    out.stage = PipelineStage::NEIGHBOR_EVIDENCE;
    return out;
}

ScoringContext ScoringPipeline::GatherNeighbors(const ScoringContext& in) const
{
    ScoringContext out = in;
    std::vector<NeighborEvidence> found = in.snapshot->index->Search(in.normalized, m_config.k);
    std::stable_sort(found.begin(), found.end(),
                     [](const NeighborEvidence& a, const NeighborEvidence& b) { return a.distance < b.distance; });
    if (found.size() > m_config.k) {
        found.resize(m_config.k);
    }
    out.neighbors = found;
    out.neighborAnalysis = AnalyzeNeighbors(found);
    out.stage = PipelineStage::PATTERN_DETECT;
    return out;
}

ScoringContext ScoringPipeline::CollectPatterns(const ScoringContext& in, PatternReport patterns) const
{
    ScoringContext out = in;
    out.patterns = std::move(patterns);
    out.stage = PipelineStage::AGGREGATE;
    return out;
}

ScoringContext ScoringPipeline::Aggregate(const ScoringContext& in) const
{
    ScoringContext out = in;
    out.behavioralRisk = AggregateRisk(in.patterns, m_config.riskWeights);
    out.stage = PipelineStage::VALIDATE;
    return out;
}

ScoringContext ScoringPipeline::Validate(const ScoringContext& in) const
{
    ScoringContext out = in;
    out.validation = CrossValidate(in.neighborAnalysis, in.patterns, in.behavioralRisk, m_config.validation);
    out.edgeCases = DetectEdgeCases(in.features, in.neighborAnalysis, in.patterns, m_config.edgeCases);
    out.stage = PipelineStage::REASON;
    return out;
}

ScoringContext ScoringPipeline::Reason(const ScoringContext& in, const CancellationToken& cancel) const
{
    ScoringContext out = in;
    OracleRequest request;
    request.address = in.reference;
    request.neighbors = in.neighborAnalysis;
    request.features = in.features;
    request.patterns = in.patterns;
    request.behavioralRisk = in.behavioralRisk;
    request.validation = in.validation;
    request.edgeCases = in.edgeCases;
    out.reasoning = m_adapter.Decide(request, cancel);
    out.stage = PipelineStage::FUSE;
    return out;
}

ScoringContext ScoringPipeline::Fuse(const ScoringContext& in) const
{
    ScoringContext out = in;
    out.decision = FuseDecision(MakeTentativeDecision(in.reasoning.verdict), in.neighborAnalysis,
                                in.behavioralRisk, in.validation, m_config.fusion);
    out.stage = PipelineStage::DONE;
    return out;
}

void ScoringPipeline::Persist(const ScoringContext& ctx, ScoreResult& result) const
{
    if (m_ledger == nullptr || ctx.decision.label == FraudLabel::UNDECIDED) {
        return;
    }
    LedgerUpdate update(ctx.reference, ctx.decision.label == FraudLabel::FRAUD, ctx.decision.confidence);
    std::string error;
    if (!m_ledger->RecordOutcome(update, error)) {
        LogPrintf("%s: ledger update for %s failed: %s\n", __func__, ctx.reference, error);
        return;
    }
    result.ledgerUpdated = true;
}

ScoreResult ScoringPipeline::Score(const std::string& reference, const AccountActivity& activity,
                                   const CancellationToken& cancel)
{
    const int64_t start = GetTimeMillis();
    ScoreResult result;
    result.reference = reference;

    ScoringContext ctx;
    ctx.reference = reference;
    ctx.activity = std::make_shared<const AccountActivity>(activity);

    if (cancel.IsCancelled()) {
        result.status = ScoreStatus::CANCELLED;
        result.message = "cancelled before scoring";
        return result;
    }

    ctx.snapshot = m_references.Current();
    if (!ctx.snapshot) {
        result.status = ScoreStatus::EVIDENCE_UNAVAILABLE;
        result.message = "no fitted scaler; load a reference population first";
        LogPrint(BCLog::SCORING, "%s: %s: %s\n", __func__, reference, result.message);
        return result;
    }
    result.scalerVersion = ctx.snapshot->GetVersion();

    // Detectors only read the shared history, so they run beside the
    // feature and neighbor stages.
    const std::shared_ptr<const AccountActivity> history = ctx.activity;
    const DetectorThresholds detectorThresholds = m_config.detectors;
    std::future<PatternReport> patternTask = std::async(std::launch::async, [history, detectorThresholds]() {
        return RunPatternDetectors(*history, detectorThresholds);
    });

    ctx = BuildFeatures(ctx);
    ctx = GatherNeighbors(ctx);
    result.features = ctx.features;

    if (!ctx.neighborAnalysis.HasEvidence()) {
        patternTask.wait();
        result.status = ScoreStatus::EVIDENCE_UNAVAILABLE;
        result.message = ctx.neighbors.empty() ? "similarity index returned no neighbors"
                                               : "no neighbor at a finite distance";
        LogPrint(BCLog::SCORING, "%s: %s: %s\n", __func__, reference, result.message);
        return result;
    }

    ctx = CollectPatterns(ctx, patternTask.get());
    ctx = Aggregate(ctx);
    ctx = Validate(ctx);

    result.neighbors = ctx.neighborAnalysis;
    result.neighborLabel = ClassifyProbability(ctx.neighborAnalysis.fraudProbability, ctx.neighborAnalysis.confidence,
                                               m_config.decisionThreshold, m_config.decisionConfidenceFloor);
    const size_t top = std::min(TOP_NEIGHBORS_REPORTED, ctx.neighbors.size());
    result.topNeighbors.assign(ctx.neighbors.begin(), ctx.neighbors.begin() + top);
    result.patterns = ctx.patterns;

    if (cancel.IsCancelled()) {
        result.status = ScoreStatus::CANCELLED;
        result.message = "cancelled before reasoning";
        return result;
    }

    ctx = Reason(ctx, cancel);
    result.usedFallback = ctx.reasoning.usedFallback;
    result.fallbackReason = ctx.reasoning.fallbackReason;
    result.oracleStatus = ctx.reasoning.lastStatus;
    result.oracleAttempts = ctx.reasoning.attempts;
    if (ctx.reasoning.cancelled || cancel.IsCancelled()) {
        result.status = ScoreStatus::CANCELLED;
        result.message = "cancelled during reasoning";
        LogPrint(BCLog::SCORING, "%s: %s: %s\n", __func__, reference, result.message);
        return result;
    }

    ctx = Fuse(ctx);
    result.decision = ctx.decision;
    result.status = ScoreStatus::OK;

    Persist(ctx, result);

    LogPrint(BCLog::SCORING, "%s: %s -> %s (confidence %.2f, p=%.3f, risk=%.3f, fallback=%d) in %d ms\n",
             __func__, reference, FraudLabelName(ctx.decision.label), ctx.decision.confidence,
             ctx.neighborAnalysis.fraudProbability, ctx.behavioralRisk, result.usedFallback,
             GetTimeMillis() - start);
    return result;
}

bool ScoringPipeline::Score(ActivitySource& source, const std::string& reference, const CancellationToken& cancel,
                            ScoreResult& result, std::string& error)
{
    AccountActivity activity;
    if (!source.FetchActivity(reference, activity, error)) {
        LogPrint(BCLog::SCORING, "%s: fetching %s failed: %s\n", __func__, reference, error);
        return false;
    }
    result = Score(reference, activity, cancel);
    return true;
}

} // namespace fraudscore
