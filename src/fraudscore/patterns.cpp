// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/patterns.h>
#include <fraudscore/stats.h>
#include <util.h>
#include <utilstrencodings.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <numeric>

namespace fraudscore {

std::string PatternTagName(PatternTag tag)
{
    switch (tag) {
        case PatternTag::BURST_ACTIVITY: return "burst_activity_detected";
        case PatternTag::REGULAR_INTERVAL: return "regular_interval_activity";
        case PatternTag::NIGHT_ACTIVITY: return "predominantly_night_activity";
        case PatternTag::SHORT_LIFESPAN_HIGH_ACTIVITY: return "high_activity_short_lifespan";
        case PatternTag::ROUND_VALUES: return "frequent_round_values";
        case PatternTag::MATCHING_SEND_RECEIVE: return "matching_send_receive_values";
        case PatternTag::MIXER_VALUE_FLOW: return "mixer_value_pattern";
        case PatternTag::CONSISTENT_SMALL_VALUES: return "consistent_small_values";
        case PatternTag::HIGH_ADDRESS_DIVERSITY: return "high_address_diversity";
        case PatternTag::ONE_TIME_INTERACTIONS: return "predominantly_one_time_interactions";
        case PatternTag::CIRCULAR_FLOW: return "circular_flow_detected";
        case PatternTag::DENYLIST_INTERACTIONS: return "suspicious_address_interactions";
        case PatternTag::EXCESSIVE_TOKEN_DIVERSITY: return "excessive_token_diversity";
        case PatternTag::TOKEN_WASH_TRADING: return "token_wash_trading_pattern";
        case PatternTag::HIGH_NFT_ACTIVITY: return "high_nft_activity";
        case PatternTag::DUST_ACCOUNT: return "dust_account_high_activity";
        case PatternTag::IMMEDIATE_FORWARDING: return "immediate_forwarding_pattern";
        case PatternTag::ASYMMETRIC_TRANSACTIONS: return "asymmetric_transaction_pattern";
        case PatternTag::ZERO_VALUE_SPAM: return "excessive_zero_value_transactions";
    }
    return "unknown";
}

std::string DetectorKindName(DetectorKind kind)
{
    switch (kind) {
        case DetectorKind::TEMPORAL: return "temporal_patterns";
        case DetectorKind::VALUE: return "value_patterns";
        case DetectorKind::NETWORK: return "network_patterns";
        case DetectorKind::TOKEN: return "token_patterns";
        case DetectorKind::BEHAVIORAL: return "behavioral_flags";
    }
    return "unknown";
}

void PatternFinding::Raise(PatternTag tag, double weight)
{
    if (tags.insert(tag).second) {
        riskLevel = Clamp01(riskLevel + weight);
    }
}

PatternReport::PatternReport()
{
    for (size_t i = 0; i < DETECTOR_COUNT; ++i) {
        m_findings[i] = PatternFinding(static_cast<DetectorKind>(i));
    }
}

bool PatternReport::HasTag(PatternTag tag) const
{
    for (const PatternFinding& finding : m_findings) {
        if (finding.HasTag(tag)) return true;
    }
    return false;
}

bool PatternReport::HasAnyTag(const std::set<PatternTag>& tags) const
{
    for (PatternTag tag : tags) {
        if (HasTag(tag)) return true;
    }
    return false;
}

std::vector<PatternTag> PatternReport::AllTags() const
{
    std::vector<PatternTag> all;
    for (const PatternFinding& finding : m_findings) {
        all.insert(all.end(), finding.tags.begin(), finding.tags.end());
    }
    return all;
}

DetectorThresholds::DetectorThresholds()
    : burstGapSeconds(60), burstMinCount(5), burstWeight(0.3)
    , regularMinGaps(10), regularMaxVariation(0.1), regularMaxMeanSeconds(3600), regularWeight(0.2)
    , nightStartHour(1), nightEndHour(5), nightMinRatio(0.7), nightWeight(0.1)
    , shortLifespanHours(24), shortLifespanMinCount(50), shortLifespanWeight(0.4)
    , roundValues({0.1, 0.5, 1.0, 5.0, 10.0, 50.0, 100.0, 1000.0})
    , roundTolerance(0.001), roundMinRatio(0.5), roundWeight(0.3)
    , matchingWindow(20), matchingTolerance(0.01), matchingWeight(0.4)
    , mixerMinTotal(10), mixerMinBalanceRatio(0.9), mixerMinSent(20), mixerWeight(0.5)
    , drainingMinSent(10), drainingMaxVariation(0.2), drainingWeight(0.2)
    , diversityMinRatio(0.8), diversityMinTx(50), diversityWeight(0.4)
    , oneTimeMinRatio(0.7), oneTimeMinSent(20), oneTimeWeight(0.3)
    , circularMinOverlap(5), circularMinTx(10), circularMinRatio(0.3), circularWeight(0.5)
    , denylistPatterns({"0x00000", "0x11111", "0xdead", "0xaaaa", "0xbbbb"})
    , denylistMinMatches(5), denylistWeight(0.2)
    , tokenDiversityMin(30), tokenDiversityWeight(0.3)
    , washMinPerSide(3), washMaxImbalance(2), washMinContracts(3), washWeight(0.6)
    , nftMinCount(20), nftWeight(0.1)
    , dustMinTx(100), dustMaxBalance(0.01), dustWeight(0.5)
    , forwardMinPerSide(10), forwardMaxDelaySeconds(300), forwardMinCount(10), forwardWeight(0.6)
    , asymmetricMinTx(20), asymmetricHighRatio(0.9), asymmetricLowRatio(0.1), asymmetricWeight(0.2)
    , zeroValueMinRatio(0.5), zeroValueMinTx(50), zeroValueWeight(0.3)
{
}

namespace {

std::vector<int64_t> Timestamps(const std::vector<TransferRecord>& records)
{
    std::vector<int64_t> times;
    for (const TransferRecord& rec : records) {
        if (rec.HasTimestamp()) times.push_back(rec.timestamp);
    }
    return times;
}

std::vector<double> Values(const std::vector<TransferRecord>& records)
{
    std::vector<double> values;
    values.reserve(records.size());
    for (const TransferRecord& rec : records) {
        values.push_back(rec.value);
    }
    return values;
}

std::vector<std::string> LowercaseCounterparties(const std::vector<TransferRecord>& records)
{
    std::vector<std::string> addrs;
    for (const TransferRecord& rec : records) {
        if (!rec.counterparty.empty()) addrs.push_back(ToLower(rec.counterparty));
    }
    return addrs;
}

int UtcHour(int64_t timestamp)
{
    int64_t secondsOfDay = timestamp % 86400;
    if (secondsOfDay < 0) secondsOfDay += 86400;
    return static_cast<int>(secondsOfDay / 3600);
}

} // namespace

PatternFinding DetectTemporalPatterns(const AccountActivity& activity, const DetectorThresholds& t)
{
    PatternFinding finding(DetectorKind::TEMPORAL);

    std::vector<int64_t> times = Timestamps(activity.sent);
    std::vector<int64_t> received = Timestamps(activity.received);
    times.insert(times.end(), received.begin(), received.end());
    if (times.size() < 2) {
        return finding;
    }
    std::sort(times.begin(), times.end());
    const std::vector<double> gaps = ConsecutiveGaps(times);

    int burstCount = 0;
    for (double gap : gaps) {
        if (gap < t.burstGapSeconds) ++burstCount;
    }
    if (burstCount >= t.burstMinCount) {
        finding.Raise(PatternTag::BURST_ACTIVITY, t.burstWeight);
    }

    const double meanGap = CalculateMean(gaps);
    if (gaps.size() >= static_cast<size_t>(t.regularMinGaps)) {
        double stdDev = CalculateStdDev(gaps, meanGap);
        if (stdDev < meanGap * t.regularMaxVariation && meanGap < t.regularMaxMeanSeconds) {
            finding.Raise(PatternTag::REGULAR_INTERVAL, t.regularWeight);
        }
    }

    int nightCount = 0;
    for (int64_t ts : times) {
        int hour = UtcHour(ts);
        if (hour >= t.nightStartHour && hour <= t.nightEndHour) ++nightCount;
    }
    if (static_cast<double>(nightCount) / times.size() > t.nightMinRatio) {
        finding.Raise(PatternTag::NIGHT_ACTIVITY, t.nightWeight);
    }

    const double lifespanHours = (times.back() - times.front()) / 3600.0;
    if (lifespanHours < t.shortLifespanHours && times.size() > static_cast<size_t>(t.shortLifespanMinCount)) {
        finding.Raise(PatternTag::SHORT_LIFESPAN_HIGH_ACTIVITY, t.shortLifespanWeight);
    }

    finding.metrics["burst_count"] = burstCount;
    finding.metrics["avg_gap_seconds"] = meanGap;
    finding.metrics["lifespan_hours"] = SanitizeValue(lifespanHours);
    return finding;
}

PatternFinding DetectValuePatterns(const AccountActivity& activity, const DetectorThresholds& t)
{
    PatternFinding finding(DetectorKind::VALUE);

    const std::vector<double> sentValues = Values(activity.sent);
    const std::vector<double> receivedValues = Values(activity.received);
    const size_t valueCount = sentValues.size() + receivedValues.size();

    size_t roundCount = 0;
    auto isRound = [&t](double value) {
        for (double rn : t.roundValues) {
            if (std::fabs(value - rn) < t.roundTolerance) return true;
        }
        return false;
    };
    for (double v : sentValues) if (isRound(v)) ++roundCount;
    for (double v : receivedValues) if (isRound(v)) ++roundCount;
    const double roundRatio = valueCount > 0 ? static_cast<double>(roundCount) / valueCount : 0.0;
    if (roundRatio > t.roundMinRatio) {
        finding.Raise(PatternTag::ROUND_VALUES, t.roundWeight);
    }

    // Compare the most recent values of each direction
    if (!sentValues.empty() && !receivedValues.empty()) {
        size_t sentStart = sentValues.size() > t.matchingWindow ? sentValues.size() - t.matchingWindow : 0;
        size_t recvStart = receivedValues.size() > t.matchingWindow ? receivedValues.size() - t.matchingWindow : 0;
        bool matched = false;
        for (size_t i = sentStart; i < sentValues.size() && !matched; ++i) {
            if (!(sentValues[i] > 0)) continue;
            for (size_t j = recvStart; j < receivedValues.size(); ++j) {
                if (std::fabs(sentValues[i] - receivedValues[j]) < t.matchingTolerance) {
                    matched = true;
                    break;
                }
            }
        }
        if (matched) {
            finding.Raise(PatternTag::MATCHING_SEND_RECEIVE, t.matchingWeight);
        }
    }

    const double totalSent = std::accumulate(sentValues.begin(), sentValues.end(), 0.0);
    const double totalReceived = std::accumulate(receivedValues.begin(), receivedValues.end(), 0.0);
    if (totalSent > t.mixerMinTotal && totalReceived > t.mixerMinTotal) {
        double ratio = std::min(totalSent, totalReceived) / std::max(totalSent, totalReceived);
        if (ratio > t.mixerMinBalanceRatio && sentValues.size() > t.mixerMinSent) {
            finding.Raise(PatternTag::MIXER_VALUE_FLOW, t.mixerWeight);
        }
    }

    if (sentValues.size() > t.drainingMinSent) {
        double mean = CalculateMean(sentValues);
        double stdDev = CalculateStdDev(sentValues, mean);
        if (mean > 0 && stdDev < mean * t.drainingMaxVariation) {
            finding.Raise(PatternTag::CONSISTENT_SMALL_VALUES, t.drainingWeight);
        }
    }

    finding.metrics["round_value_ratio"] = roundRatio;
    finding.metrics["value_balance_ratio"] =
        SanitizeValue(std::min(totalSent, totalReceived) / std::max({totalSent, totalReceived, 1.0}));
    return finding;
}

PatternFinding DetectNetworkPatterns(const AccountActivity& activity, const DetectorThresholds& t)
{
    PatternFinding finding(DetectorKind::NETWORK);

    const std::vector<std::string> sentAddrs = LowercaseCounterparties(activity.sent);
    const std::vector<std::string> receivedAddrs = LowercaseCounterparties(activity.received);
    const std::set<std::string> sentSet(sentAddrs.begin(), sentAddrs.end());
    const std::set<std::string> receivedSet(receivedAddrs.begin(), receivedAddrs.end());
    const size_t totalTx = activity.TotalTransactions();

    double diversityRatio = 0;
    if (totalTx > 0) {
        diversityRatio = static_cast<double>(sentSet.size() + receivedSet.size()) / totalTx;
        if (diversityRatio > t.diversityMinRatio && totalTx > t.diversityMinTx) {
            finding.Raise(PatternTag::HIGH_ADDRESS_DIVERSITY, t.diversityWeight);
        }
    }

    if (!sentAddrs.empty()) {
        std::map<std::string, int> counts;
        for (const std::string& addr : sentAddrs) ++counts[addr];
        int oneTime = 0;
        for (const auto& entry : counts) {
            if (entry.second == 1) ++oneTime;
        }
        double oneTimeRatio = static_cast<double>(oneTime) / counts.size();
        if (oneTimeRatio > t.oneTimeMinRatio && sentAddrs.size() > t.oneTimeMinSent) {
            finding.Raise(PatternTag::ONE_TIME_INTERACTIONS, t.oneTimeWeight);
        }
    }

    std::vector<std::string> circular;
    std::set_intersection(sentSet.begin(), sentSet.end(), receivedSet.begin(), receivedSet.end(),
                          std::back_inserter(circular));
    if (!circular.empty() && circular.size() >= t.circularMinOverlap && totalTx > t.circularMinTx) {
        double circularRatio = static_cast<double>(circular.size()) / std::min(sentSet.size(), receivedSet.size());
        if (circularRatio > t.circularMinRatio) {
            finding.Raise(PatternTag::CIRCULAR_FLOW, t.circularWeight);
        }
    }

    int denylisted = 0;
    for (const std::string& addr : sentAddrs) {
        for (const std::string& pattern : t.denylistPatterns) {
            if (!pattern.empty() && addr.find(ToLower(pattern)) != std::string::npos) {
                ++denylisted;
                break;
            }
        }
    }
    if (denylisted > t.denylistMinMatches) {
        finding.Raise(PatternTag::DENYLIST_INTERACTIONS, t.denylistWeight);
    }

    finding.metrics["unique_counterparties"] = sentSet.size() + receivedSet.size();
    finding.metrics["diversity_ratio"] = diversityRatio;
    finding.metrics["circular_addresses"] = circular.size();
    return finding;
}

PatternFinding DetectTokenPatterns(const AccountActivity& activity, const DetectorThresholds& t)
{
    PatternFinding finding(DetectorKind::TOKEN);

    std::map<std::string, std::pair<int, int>> flow; // contract -> (sent, received)
    size_t nftCount = 0;
    size_t tokenRecords = 0;
    for (const TransferRecord& rec : activity.sent) {
        if (!IsTokenCategory(rec.category)) continue;
        ++tokenRecords;
        if (rec.category == TransferCategory::NFT) ++nftCount;
        if (rec.HasContract()) ++flow[ToLower(rec.tokenContract)].first;
    }
    for (const TransferRecord& rec : activity.received) {
        if (!IsTokenCategory(rec.category)) continue;
        ++tokenRecords;
        if (rec.category == TransferCategory::NFT) ++nftCount;
        if (rec.HasContract()) ++flow[ToLower(rec.tokenContract)].second;
    }

    int washCandidates = 0;
    for (const auto& entry : flow) {
        int sent = entry.second.first;
        int received = entry.second.second;
        if (sent > t.washMinPerSide && received > t.washMinPerSide && std::abs(sent - received) <= t.washMaxImbalance) {
            ++washCandidates;
        }
    }

    if (tokenRecords > 0) {
        if (flow.size() > t.tokenDiversityMin) {
            finding.Raise(PatternTag::EXCESSIVE_TOKEN_DIVERSITY, t.tokenDiversityWeight);
        }
        if (washCandidates >= t.washMinContracts) {
            finding.Raise(PatternTag::TOKEN_WASH_TRADING, t.washWeight);
        }
        if (nftCount > t.nftMinCount) {
            finding.Raise(PatternTag::HIGH_NFT_ACTIVITY, t.nftWeight);
        }
    }

    finding.metrics["unique_tokens"] = flow.size();
    finding.metrics["wash_candidates"] = washCandidates;
    finding.metrics["nft_transactions"] = nftCount;
    return finding;
}

PatternFinding DetectBehavioralFlags(const AccountActivity& activity, const DetectorThresholds& t)
{
    PatternFinding finding(DetectorKind::BEHAVIORAL);

    const size_t totalSent = activity.sent.size();
    const size_t totalReceived = activity.received.size();
    const size_t total = totalSent + totalReceived;
    const double balance = SanitizeValue(activity.balance);

    if (total > t.dustMinTx && balance < t.dustMaxBalance) {
        finding.Raise(PatternTag::DUST_ACCOUNT, t.dustWeight);
    }

    // A receipt counts once if some send follows it within the delay
    int immediateForwards = 0;
    if (totalReceived > t.forwardMinPerSide && totalSent > t.forwardMinPerSide) {
        std::vector<int64_t> sentTimes = Timestamps(activity.sent);
        std::sort(sentTimes.begin(), sentTimes.end());
        for (int64_t rt : Timestamps(activity.received)) {
            auto next = std::upper_bound(sentTimes.begin(), sentTimes.end(), rt);
            if (next != sentTimes.end() && (*next - rt) < t.forwardMaxDelaySeconds) {
                ++immediateForwards;
            }
        }
        if (immediateForwards > t.forwardMinCount) {
            finding.Raise(PatternTag::IMMEDIATE_FORWARDING, t.forwardWeight);
        }
    }

    if (total > t.asymmetricMinTx) {
        double ratio = static_cast<double>(totalSent) / total;
        if (ratio > t.asymmetricHighRatio || ratio < t.asymmetricLowRatio) {
            finding.Raise(PatternTag::ASYMMETRIC_TRANSACTIONS, t.asymmetricWeight);
        }
    }

    if (total > 0) {
        size_t zeroValue = 0;
        for (const TransferRecord& rec : activity.sent) if (rec.value == 0) ++zeroValue;
        for (const TransferRecord& rec : activity.received) if (rec.value == 0) ++zeroValue;
        double zeroRatio = static_cast<double>(zeroValue) / total;
        if (zeroRatio > t.zeroValueMinRatio && total > t.zeroValueMinTx) {
            finding.Raise(PatternTag::ZERO_VALUE_SPAM, t.zeroValueWeight);
        }
    }

    finding.metrics["balance"] = balance;
    finding.metrics["tx_asymmetry"] = static_cast<double>(std::max(totalSent, totalReceived) - std::min(totalSent, totalReceived))
                                      / std::max<size_t>(total, 1);
    finding.metrics["immediate_forwards"] = immediateForwards;
    return finding;
}

PatternReport RunPatternDetectors(const AccountActivity& activity, const DetectorThresholds& thresholds)
{
    PatternReport report;
    report.Set(DetectTemporalPatterns(activity, thresholds));
    report.Set(DetectValuePatterns(activity, thresholds));
    report.Set(DetectNetworkPatterns(activity, thresholds));
    report.Set(DetectTokenPatterns(activity, thresholds));
    report.Set(DetectBehavioralFlags(activity, thresholds));

    if (LogAcceptCategory(BCLog::PATTERNS)) {
        for (const PatternFinding& finding : report.Findings()) {
            std::string tags;
            for (PatternTag tag : finding.tags) {
                if (!tags.empty()) tags += ",";
                tags += PatternTagName(tag);
            }
            LogPrintf("%s: risk %.2f [%s]\n", DetectorKindName(finding.kind), finding.riskLevel, tags);
        }
    }
    return report;
}

} // namespace fraudscore
