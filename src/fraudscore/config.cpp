// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/config.h>
#include <util.h>
#include <utilstrencodings.h>

namespace fraudscore {

namespace {

bool ReadDouble(const std::string& name, double minValue, double maxValue, double& value, std::string& error)
{
    if (!gArgs.IsArgSet(name)) return true;
    const std::string str = gArgs.GetArg(name, std::string());
    double parsed = 0;
    if (!ParseDouble(TrimString(str), &parsed)) {
        error = tfm::format("Invalid number for %s: '%s'", name, str);
        return false;
    }
    if (parsed < minValue || parsed > maxValue) {
        error = tfm::format("%s must be between %g and %g (got %s)", name, minValue, maxValue, str);
        return false;
    }
    value = parsed;
    return true;
}

bool ReadInt(const std::string& name, int64_t minValue, int64_t maxValue, int64_t& value, std::string& error)
{
    if (!gArgs.IsArgSet(name)) return true;
    const std::string str = gArgs.GetArg(name, std::string());
    int64_t parsed = 0;
    if (!ParseInt64(TrimString(str), &parsed)) {
        error = tfm::format("Invalid integer for %s: '%s'", name, str);
        return false;
    }
    if (parsed < minValue || parsed > maxValue) {
        error = tfm::format("%s must be between %d and %d (got %s)", name, minValue, maxValue, str);
        return false;
    }
    value = parsed;
    return true;
}

bool ReadProbability(const std::string& name, double& value, std::string& error)
{
    return ReadDouble(name, 0.0, 1.0, value, error);
}

} // namespace

std::string GetFraudScoreHelpMessage()
{
    const FraudScoreConfig defaults;
    const FusionThresholds& fusion = defaults.fusion;
    std::string strUsage;

    strUsage += HelpMessageGroup("Scoring options:");
    strUsage += HelpMessageOpt("-knn=<n>", tfm::format("Number of reference neighbors to consult (default: %d)", DEFAULT_KNN));
    strUsage += HelpMessageOpt("-decisionthreshold=<p>", tfm::format("Neighbor fraud probability at or above which the neighbor-only label is Fraud (default: %g)", DEFAULT_DECISION_THRESHOLD));
    strUsage += HelpMessageOpt("-decisionconfidencefloor=<c>", tfm::format("Neighbor confidence below which the neighbor-only label is Undecided (default: %g)", DEFAULT_DECISION_CONFIDENCE_FLOOR));
    strUsage += HelpMessageOpt("-denylist=<pattern>", "Counterparty address substring counted as a suspicious interaction. Can be specified multiple times; replaces the built-in list");

    strUsage += HelpMessageGroup("Guardrail options:");
    strUsage += HelpMessageOpt("-guardminconfidence=<c>", tfm::format("Force Undecided when neighbor confidence is below this (default: %g)", fusion.minNeighborConfidence));
    strUsage += HelpMessageOpt("-guardfraudmaxprob=<p>", tfm::format("A Fraud call with neighbor probability below this is unsupported (default: %g)", fusion.fraudMaxProbability));
    strUsage += HelpMessageOpt("-guardfraudmaxrisk=<r>", tfm::format("A Fraud call with behavioral risk below this is unsupported (default: %g)", fusion.fraudMaxRisk));
    strUsage += HelpMessageOpt("-guardfraudminconfidence=<c>", tfm::format("Neighbor confidence above which an unsupported Fraud call is overridden (default: %g)", fusion.fraudMinNeighborConfidence));
    strUsage += HelpMessageOpt("-guardnotfraudminprob=<p>", tfm::format("A Not_Fraud call with neighbor probability above this is contradicted (default: %g)", fusion.notFraudMinProbability));
    strUsage += HelpMessageOpt("-guardnotfraudminrisk=<r>", tfm::format("A Not_Fraud call with behavioral risk above this is contradicted (default: %g)", fusion.notFraudMinRisk));

    strUsage += HelpMessageGroup("Reasoning oracle options:");
    strUsage += HelpMessageOpt("-oracleurl=<url>", "HTTP endpoint of the reasoning oracle. Without it every decision uses fallback voting");
    strUsage += HelpMessageOpt("-oracleapikey=<key>", "Bearer token sent to the reasoning oracle");
    strUsage += HelpMessageOpt("-oracletimeout=<ms>", tfm::format("Timeout of one oracle call in milliseconds (default: %d)", DEFAULT_ORACLE_TIMEOUT_MS));
    strUsage += HelpMessageOpt("-oracleretrybackoff=<ms>", tfm::format("Wait before the single retry after a transport failure (default: %d)", DEFAULT_ORACLE_RETRY_BACKOFF_MS));
    strUsage += HelpMessageOpt("-oraclefailurethreshold=<n>", tfm::format("Consecutive oracle failures that open the circuit breaker (default: %u)", defaults.oracle.breaker.failureThreshold));
    strUsage += HelpMessageOpt("-oraclecooldown=<ms>", tfm::format("How long the circuit breaker stays open (default: %d)", defaults.oracle.breaker.cooldownMs));

    strUsage += HelpMessageGroup("Ledger options:");
    strUsage += HelpMessageOpt("-ledgerstep=<s>", tfm::format("Score change per unit of confidence for each recorded outcome (default: %g)", DEFAULT_LEDGER_STEP));

    return strUsage;
}

bool InitFraudScoreConfig(FraudScoreConfig& config, std::string& error)
{
    FraudScoreConfig result = config;

    int64_t k = static_cast<int64_t>(result.k);
    if (!ReadInt("-knn", 1, MAX_KNN, k, error)) return false;
    result.k = static_cast<size_t>(k);

    if (!ReadProbability("-decisionthreshold", result.decisionThreshold, error)) return false;
    if (!ReadProbability("-decisionconfidencefloor", result.decisionConfidenceFloor, error)) return false;

    if (!ReadProbability("-guardminconfidence", result.fusion.minNeighborConfidence, error)) return false;
    if (!ReadProbability("-guardfraudmaxprob", result.fusion.fraudMaxProbability, error)) return false;
    if (!ReadProbability("-guardfraudmaxrisk", result.fusion.fraudMaxRisk, error)) return false;
    if (!ReadProbability("-guardfraudminconfidence", result.fusion.fraudMinNeighborConfidence, error)) return false;
    if (!ReadProbability("-guardnotfraudminprob", result.fusion.notFraudMinProbability, error)) return false;
    if (!ReadProbability("-guardnotfraudminrisk", result.fusion.notFraudMinRisk, error)) return false;

    if (gArgs.IsArgSet("-denylist")) {
        std::vector<std::string> patterns;
        for (const std::string& pattern : gArgs.GetArgs("-denylist")) {
            const std::string trimmed = ToLower(TrimString(pattern));
            if (trimmed.empty()) {
                error = "-denylist patterns must not be empty";
                return false;
            }
            patterns.push_back(trimmed);
        }
        result.detectors.denylistPatterns = patterns;
    }

    result.oracleUrl = gArgs.GetArg("-oracleurl", result.oracleUrl);
    result.oracleApiKey = gArgs.GetArg("-oracleapikey", result.oracleApiKey);
    if (!ReadInt("-oracletimeout", 1, 600000, result.oracle.timeoutMs, error)) return false;
    if (!ReadInt("-oracleretrybackoff", 0, 600000, result.oracle.retryBackoffMs, error)) return false;

    int64_t failureThreshold = result.oracle.breaker.failureThreshold;
    if (!ReadInt("-oraclefailurethreshold", 1, 1000, failureThreshold, error)) return false;
    result.oracle.breaker.failureThreshold = static_cast<uint32_t>(failureThreshold);
    if (!ReadInt("-oraclecooldown", 0, 86400000, result.oracle.breaker.cooldownMs, error)) return false;

    if (!ReadDouble("-ledgerstep", 0.0, 1.0, result.ledgerStep, error)) return false;

    config = result;
    LogPrint(BCLog::SCORING, "Scoring config: k=%u threshold=%g floor=%g oracle=%s timeout=%dms ledgerstep=%g\n",
             config.k, config.decisionThreshold, config.decisionConfidenceFloor,
             config.oracleUrl.empty() ? "none" : config.oracleUrl, config.oracle.timeoutMs, config.ledgerStep);
    return true;
}

} // namespace fraudscore
