// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/oracle.h>
#include <fraudscore/risk.h>
#include <fraudscore/stats.h>
#include <util.h>
#include <utilstrencodings.h>
#include <utiltime.h>

#include <univalue.h>

#include <algorithm>

namespace fraudscore {

namespace {

const char* const DECISION_FRAMEWORK =
    "You are an expert fraud detection system optimized for balanced accuracy and decisiveness.\n"
    "\n"
    "Mark as \"Fraud\" if any of these conditions hold:\n"
    "1. Neighbor fraud probability > 0.65 and behavioral risk > 0.5\n"
    "2. Neighbor fraud probability > 0.6 and at least 2 strong fraud patterns detected\n"
    "3. Neighbor fraud probability > 0.5 and behavioral risk > 0.6 and validation quality is \"high\"\n"
    "4. Behavioral risk > 0.7 and at least 3 strong fraud indicators (mixer, wash trading, ...)\n"
    "\n"
    "Mark as \"Not_Fraud\" if any of these conditions hold:\n"
    "1. Neighbor fraud probability < 0.35 and behavioral risk < 0.35\n"
    "2. Neighbor fraud probability < 0.4 and no significant fraud patterns detected\n"
    "3. Neighbor fraud probability < 0.3 and behavioral risk < 0.5\n"
    "4. Clear legitimate DeFi/trading patterns with neighbor probability < 0.5\n"
    "\n"
    "Mark as \"Undecided\" only when:\n"
    "- Neighbor probability between 0.4 and 0.6 with conflicting signals\n"
    "- Very low neighbor confidence (< 0.3) regardless of score\n"
    "- Validation quality is \"low\" and no clear patterns\n"
    "- Evidence for fraud and legitimate activity is exactly balanced\n"
    "\n"
    "Confidence levels: 0.75-1.0 multiple signals strongly aligned; 0.5-0.75 good evidence;\n"
    "0.3-0.5 weak or conflicting signals; 0.0-0.3 insufficient data.\n";

const char* const ANSWER_SCHEMA =
    "Respond ONLY with a JSON object of the form:\n"
    "{\n"
    "  \"final_decision\": \"Fraud|Not_Fraud|Undecided\",\n"
    "  \"reasoning\": \"detailed explanation with specific evidence\",\n"
    "  \"confidence\": 0.0-1.0,\n"
    "  \"edge_cases_detected\": [\"list of edge cases\"],\n"
    "  \"risk_factors\": [\"specific fraud indicators with evidence\"]\n"
    "}\n";

std::string DescribeFinding(const PatternFinding& finding)
{
    std::string tags;
    for (PatternTag tag : finding.tags) {
        if (!tags.empty()) tags += ", ";
        tags += PatternTagName(tag);
    }
    std::string metrics;
    for (const auto& metric : finding.metrics) {
        if (!metrics.empty()) metrics += ", ";
        metrics += tfm::format("%s=%.4g", metric.first, metric.second);
    }
    return tfm::format("- %s: risk %.2f; tags: %s; %s\n", DetectorKindName(finding.kind), finding.riskLevel,
                       tags.empty() ? "none" : tags, metrics);
}

bool ParseLabel(const std::string& raw, FraudLabel& label)
{
    std::string name = ToLower(TrimString(raw));
    std::replace(name.begin(), name.end(), ' ', '_');
    std::replace(name.begin(), name.end(), '-', '_');
    if (name == "fraud") {
        label = FraudLabel::FRAUD;
    } else if (name == "not_fraud" || name == "notfraud") {
        label = FraudLabel::NOT_FRAUD;
    } else if (name == "undecided") {
        label = FraudLabel::UNDECIDED;
    } else {
        return false;
    }
    return true;
}

std::vector<std::string> StringArray(const UniValue& value)
{
    std::vector<std::string> out;
    if (!value.isArray()) return out;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i].isStr()) out.push_back(value[i].get_str());
    }
    return out;
}

/** Body of the first fence opened by marker, up to the closing fence or the end */
bool FenceBody(const std::string& text, const std::string& marker, std::string& body)
{
    size_t open = text.find(marker);
    if (open == std::string::npos) return false;
    size_t start = open + marker.size();
    size_t close = text.find("```", start);
    body = text.substr(start, close == std::string::npos ? std::string::npos : close - start);
    return true;
}

} // namespace

std::string BuildOraclePrompt(const OracleRequest& request)
{
    const NeighborAnalysis& n = request.neighbors;
    const FeatureMap& f = request.features;

    std::string detected;
    for (PatternTag tag : request.patterns.AllTags()) {
        if (!detected.empty()) detected += ", ";
        detected += PatternTagName(tag);
    }

    std::string prompt = DECISION_FRAMEWORK;
    prompt += "\n";
    prompt += tfm::format("Address: %s\n\n", request.address);
    prompt += tfm::format("Neighbor analysis:\n"
                          "- Fraud probability: %.2f%%\n"
                          "- Model confidence: %.2f%%\n"
                          "- Fraudulent neighbors: %d/%d\n"
                          "- Average distance to neighbors: %.4f\n\n",
                          n.fraudProbability * 100, n.confidence * 100, n.fraudCount, n.totalCount, n.avgDistance);
    prompt += tfm::format("Account statistics:\n"
                          "- Total transactions: %.0f\n"
                          "- Sent: %.0f | Received: %.0f\n"
                          "- Total ether sent: %.6f\n"
                          "- Total ether received: %.6f\n"
                          "- Current balance: %.6f\n"
                          "- Unique addresses contacted: %.0f\n"
                          "- Unique addresses received from: %.0f\n"
                          "- ERC20 token transactions: %.0f\n\n",
                          GetFeature(f, FEATURE_TOTAL_TX), GetFeature(f, FEATURE_SENT_TNX), GetFeature(f, FEATURE_RECEIVED_TNX),
                          GetFeature(f, FEATURE_TOTAL_ETHER_SENT), GetFeature(f, FEATURE_TOTAL_ETHER_RECEIVED),
                          GetFeature(f, FEATURE_BALANCE), GetFeature(f, FEATURE_UNIQUE_SENT_TO),
                          GetFeature(f, FEATURE_UNIQUE_RECEIVED_FROM), GetFeature(f, FEATURE_TOTAL_TOKEN_TNXS));
    prompt += tfm::format("Behavioral analysis:\n"
                          "- Overall risk score: %.2f%% (%s)\n"
                          "- Detected patterns: %s\n",
                          request.behavioralRisk * 100, DescribeRisk(request.behavioralRisk),
                          detected.empty() ? "None detected" : detected);
    for (const PatternFinding& finding : request.patterns.Findings()) {
        prompt += DescribeFinding(finding);
    }
    prompt += "\nEdge cases:\n";
    if (request.edgeCases.empty()) {
        prompt += "None\n";
    }
    for (const std::string& note : request.edgeCases) {
        prompt += "- " + note + "\n";
    }
    prompt += "\nValidation checks:\n" + ValidationToJSON(request.validation).write(2) + "\n";
    prompt += tfm::format("\nDecision quality: %s\n\n", QualityTierName(request.validation.qualityTier));
    prompt += ANSWER_SCHEMA;
    return prompt;
}

bool ExtractJSONPayload(const std::string& text, std::string& payload)
{
    std::string candidate;
    if (!FenceBody(text, "```json", candidate) && !FenceBody(text, "```", candidate)) {
        candidate = text;
    }
    size_t open = candidate.find('{');
    size_t close = candidate.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return false;
    }
    payload = candidate.substr(open, close - open + 1);
    return true;
}

bool ParseOracleResponse(const std::string& text, OracleVerdict& verdict, std::string& error)
{
    std::string payload;
    if (!ExtractJSONPayload(text, payload)) {
        error = "no JSON object in response";
        return false;
    }

    UniValue val;
    if (!val.read(payload) || !val.isObject()) {
        error = "response is not a JSON object";
        return false;
    }

    const UniValue& decision = val["final_decision"];
    if (!decision.isStr()) {
        error = "missing final_decision";
        return false;
    }
    OracleVerdict parsed;
    if (!ParseLabel(decision.get_str(), parsed.label)) {
        error = tfm::format("unknown final_decision '%s'", decision.get_str());
        return false;
    }

    const UniValue& confidence = val["confidence"];
    parsed.confidence = confidence.isNum() ? Clamp01(confidence.get_real()) : 0.5;

    const UniValue& reasoning = val["reasoning"];
    if (reasoning.isStr()) parsed.reasoning = reasoning.get_str();

    parsed.edgeCases = StringArray(val["edge_cases_detected"]);
    parsed.riskFactors = StringArray(val["risk_factors"]);

    verdict = parsed;
    return true;
}

OracleVerdict FallbackVote(const OracleRequest& request)
{
    const double p = request.neighbors.fraudProbability;
    const double r = request.behavioralRisk;
    const ValidationReport& v = request.validation;

    int fraudVotes = 0;
    int legitVotes = 0;

    if (p > 0.6) {
        fraudVotes += 2;
    } else if (p < 0.4) {
        legitVotes += 2;
    }

    if (r > 0.6) {
        fraudVotes += 2;
    } else if (r < 0.35) {
        legitVotes += 2;
    }

    if (v.mixerProfile || v.washTrading) {
        fraudVotes += 1;
    }

    if (v.alignment) {
        if (p > 0.5) {
            fraudVotes += 1;
        } else {
            legitVotes += 1;
        }
    }

    OracleVerdict verdict;
    if (fraudVotes >= 3) {
        verdict.label = FraudLabel::FRAUD;
        verdict.confidence = std::min(0.7, fraudVotes / 5.0);
    } else if (legitVotes >= 3) {
        verdict.label = FraudLabel::NOT_FRAUD;
        verdict.confidence = std::min(0.7, legitVotes / 5.0);
    } else {
        verdict.label = FraudLabel::UNDECIDED;
        verdict.confidence = 0.4;
    }
    verdict.reasoning = tfm::format("[Fallback decision based on %d fraud signals vs %d legitimate signals]",
                                    fraudVotes, legitVotes);
    verdict.edgeCases = request.edgeCases;
    for (PatternTag tag : request.patterns.AllTags()) {
        verdict.riskFactors.push_back(PatternTagName(tag));
    }
    return verdict;
}

ReasoningAdapter::ReasoningAdapter(std::shared_ptr<ReasoningOracle> oracle, const ReasoningAdapterConfig& config)
    : m_oracle(std::move(oracle))
    , m_config(config)
    , m_breaker(config.breaker)
{
}

bool ReasoningAdapter::WaitBackoff(const CancellationToken& cancel) const
{
    static const int64_t SLICE_MS = 50;
    int64_t remaining = m_config.retryBackoffMs;
    while (remaining > 0) {
        if (cancel.IsCancelled()) return false;
        int64_t slice = std::min(remaining, SLICE_MS);
        MilliSleep(slice);
        remaining -= slice;
    }
    return !cancel.IsCancelled();
}

void ReasoningAdapter::ApplyFallback(const OracleRequest& request, const std::string& reason, ReasoningOutcome& outcome) const
{
    LogPrint(BCLog::ORACLE, "Fallback voting for %s: %s\n", request.address, reason);
    outcome.usedFallback = true;
    outcome.fallbackReason = reason;
    outcome.verdict = FallbackVote(request);
}

ReasoningOutcome ReasoningAdapter::Decide(const OracleRequest& request, const CancellationToken& cancel)
{
    ReasoningOutcome outcome;
    if (cancel.IsCancelled()) {
        outcome.cancelled = true;
        outcome.lastStatus = OracleCallStatus::CANCELLED;
        return outcome;
    }
    if (!m_oracle) {
        ApplyFallback(request, "no oracle configured", outcome);
        return outcome;
    }

    const std::string prompt = BuildOraclePrompt(request);
    static const int MAX_ATTEMPTS = 2;

    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        if (attempt > 0 && !WaitBackoff(cancel)) {
            outcome.cancelled = true;
            outcome.lastStatus = OracleCallStatus::CANCELLED;
            return outcome;
        }
        if (!m_breaker.AllowCall()) {
            ApplyFallback(request, "circuit breaker open", outcome);
            return outcome;
        }

        std::string response;
        int64_t start = GetTimeMillis();
        OracleCallStatus status = m_oracle->Query(prompt, m_config.timeoutMs, cancel, response);
        outcome.attempts++;
        outcome.lastStatus = status;
        m_breaker.Record(cancel.IsCancelled() ? OracleCallStatus::CANCELLED : status);
        LogPrint(BCLog::ORACLE, "Oracle attempt %d for %s: %s in %d ms\n", attempt + 1, request.address,
                 OracleCallStatusName(status), GetTimeMillis() - start);

        if (status == OracleCallStatus::CANCELLED || cancel.IsCancelled()) {
            outcome.cancelled = true;
            outcome.lastStatus = OracleCallStatus::CANCELLED;
            return outcome;
        }

        if (status == OracleCallStatus::OK) {
            std::string error;
            if (ParseOracleResponse(response, outcome.verdict, error)) {
                return outcome;
            }
            LogPrintf("Oracle response for %s unusable: %s\n", request.address, error);
            ApplyFallback(request, "malformed oracle response: " + error, outcome);
            return outcome;
        }
    }

    ApplyFallback(request, "oracle unavailable: " + OracleCallStatusName(outcome.lastStatus), outcome);
    return outcome;
}

} // namespace fraudscore
