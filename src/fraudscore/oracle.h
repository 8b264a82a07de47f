// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_ORACLE_H
#define FRAUDSCORE_ORACLE_H

#include <fraudscore/collaborators.h>
#include <fraudscore/features.h>
#include <fraudscore/neighbors.h>
#include <fraudscore/oraclebreaker.h>
#include <fraudscore/patterns.h>
#include <fraudscore/validation.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fraudscore {

static const int64_t DEFAULT_ORACLE_TIMEOUT_MS = 30000;
static const int64_t DEFAULT_ORACLE_RETRY_BACKOFF_MS = 1000;

/**
 * Reasoning Oracle
 *
 * External judgment service. Implementations must return within roughly the
 * given timeout and should return CANCELLED promptly once the token fires.
 * The response text is untrusted.
 */
class ReasoningOracle {
public:
    virtual ~ReasoningOracle() {}

    virtual OracleCallStatus Query(const std::string& prompt, int64_t timeoutMs,
                                   const CancellationToken& cancel, std::string& response) = 0;
};

/** Everything the oracle is told about one account */
struct OracleRequest {
    std::string address;
    NeighborAnalysis neighbors;
    FeatureMap features;
    PatternReport patterns;
    double behavioralRisk;
    ValidationReport validation;
    std::vector<std::string> edgeCases;

    OracleRequest() : behavioralRisk(0) {}
};

/** A tentative decision, from the oracle or from fallback voting */
struct OracleVerdict {
    FraudLabel label;
    std::string reasoning;
    double confidence;              // 0.0-1.0
    std::vector<std::string> edgeCases;
    std::vector<std::string> riskFactors;

    OracleVerdict() : label(FraudLabel::UNDECIDED), confidence(0) {}
};

/** Render the request as prompt text including the answer schema */
std::string BuildOraclePrompt(const OracleRequest& request);

/**
 * Pull the JSON object out of free text: the body of a ```json fence, else
 * of a bare ``` fence, else the whole text, narrowed to its outermost
 * {...} span.
 *
 * @return false when no brace-delimited span exists
 */
bool ExtractJSONPayload(const std::string& text, std::string& payload);

/**
 * Parse an oracle answer. final_decision must be Fraud, Not_Fraud/NotFraud
 * or Undecided in any case. A missing or non-numeric confidence reads as
 * 0.5; non-string members of the string arrays are skipped.
 */
bool ParseOracleResponse(const std::string& text, OracleVerdict& verdict, std::string& error);

/**
 * Deterministic vote over the evidence, used whenever no usable oracle
 * answer exists. Three or more votes on one side decide that side with
 * confidence min(0.7, votes / 5); anything else is Undecided at 0.4.
 */
OracleVerdict FallbackVote(const OracleRequest& request);

struct ReasoningAdapterConfig {
    int64_t timeoutMs;
    int64_t retryBackoffMs;
    OracleBreakerConfig breaker;

    ReasoningAdapterConfig() : timeoutMs(DEFAULT_ORACLE_TIMEOUT_MS), retryBackoffMs(DEFAULT_ORACLE_RETRY_BACKOFF_MS) {}
};

/** Result of one Decide() call */
struct ReasoningOutcome {
    bool cancelled;
    bool usedFallback;
    int attempts;                   // oracle calls actually made
    OracleCallStatus lastStatus;
    std::string fallbackReason;
    OracleVerdict verdict;

    ReasoningOutcome() : cancelled(false), usedFallback(false), attempts(0), lastStatus(OracleCallStatus::OK) {}
};

/**
 * Reasoning Adapter
 *
 * Calls the oracle with a bounded timeout, retries once after a backoff on
 * TIMEOUT or TRANSPORT_ERROR, never retries an answer that failed to parse,
 * and falls back to FallbackVote() when no answer can be used. A circuit
 * breaker skips the oracle entirely while it keeps failing.
 */
class ReasoningAdapter {
public:
    /** A null oracle means every decision comes from fallback voting */
    ReasoningAdapter(std::shared_ptr<ReasoningOracle> oracle, const ReasoningAdapterConfig& config = ReasoningAdapterConfig());

    ReasoningOutcome Decide(const OracleRequest& request, const CancellationToken& cancel);

    const OracleBreaker& GetBreaker() const { return m_breaker; }

private:
    std::shared_ptr<ReasoningOracle> m_oracle;
    ReasoningAdapterConfig m_config;
    OracleBreaker m_breaker;

    /** Sleep the retry backoff; false if cancelled meanwhile */
    bool WaitBackoff(const CancellationToken& cancel) const;

    void ApplyFallback(const OracleRequest& request, const std::string& reason, ReasoningOutcome& outcome) const;
};

} // namespace fraudscore

#endif // FRAUDSCORE_ORACLE_H
