// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/features.h>
#include <fraudscore/stats.h>
#include <util.h>

#include <algorithm>
#include <numeric>
#include <set>

namespace fraudscore {

const char* const FEATURE_AVG_MIN_SENT = "Avg min between sent tnx";
const char* const FEATURE_AVG_MIN_RECEIVED = "Avg min between received tnx";
const char* const FEATURE_TIME_SPAN_MINS = "Time Diff between first and last (Mins)";
const char* const FEATURE_SENT_TNX = "Sent tnx";
const char* const FEATURE_RECEIVED_TNX = "Received Tnx";
const char* const FEATURE_UNIQUE_RECEIVED_FROM = "Unique Received From Addresses";
const char* const FEATURE_UNIQUE_SENT_TO = "Unique Sent To Addresses";
const char* const FEATURE_TOTAL_TX = "total transactions (including tnx to create contract)";
const char* const FEATURE_TOTAL_ETHER_SENT = "total Ether sent";
const char* const FEATURE_TOTAL_ETHER_RECEIVED = "total ether received";
const char* const FEATURE_BALANCE = "total ether balance";
const char* const FEATURE_TOTAL_TOKEN_TNXS = " Total ERC20 tnxs";

const std::vector<std::string>& GetFeatureNames()
{
    static const std::vector<std::string> names = {
        FEATURE_AVG_MIN_SENT,
        FEATURE_AVG_MIN_RECEIVED,
        FEATURE_TIME_SPAN_MINS,
        FEATURE_SENT_TNX,
        FEATURE_RECEIVED_TNX,
        "Number of Created Contracts",
        FEATURE_UNIQUE_RECEIVED_FROM,
        FEATURE_UNIQUE_SENT_TO,
        "min value received",
        "max value received",
        "avg val received",
        "min val sent",
        "max val sent",
        "avg val sent",
        "min value sent to contract",
        "max val sent to contract",
        "avg value sent to contract",
        FEATURE_TOTAL_TX,
        FEATURE_TOTAL_ETHER_SENT,
        FEATURE_TOTAL_ETHER_RECEIVED,
        "total ether sent contracts",
        FEATURE_BALANCE,
        FEATURE_TOTAL_TOKEN_TNXS,
        " ERC20 total Ether received",
        " ERC20 total ether sent",
        " ERC20 total Ether sent contract",
        " ERC20 uniq sent addr",
        " ERC20 uniq rec addr",
        " ERC20 uniq rec contract addr",
        " ERC20 avg time between sent tnx",
        " ERC20 avg time between rec tnx",
        " ERC20 avg time between contract tnx",
        " ERC20 min val rec",
        " ERC20 max val rec",
        " ERC20 avg val rec",
        " ERC20 min val sent",
        " ERC20 max val sent",
        " ERC20 avg val sent",
        " ERC20 uniq sent token name",
        " ERC20 uniq rec token name",
        " ERC20 most sent token type",
        " ERC20 most rec token type",
        FEATURE_UNIQUE_SENT_TO,
        FEATURE_UNIQUE_RECEIVED_FROM,
    };
    return names;
}

namespace {

struct ValueStats {
    double min;
    double max;
    double mean;
    double sum;

    ValueStats() : min(0), max(0), mean(0), sum(0) {}
};

/** Statistics over the non-zero values of the given records */
ValueStats ComputeValueStats(const std::vector<const TransferRecord*>& records)
{
    std::vector<double> values;
    for (const TransferRecord* rec : records) {
        if (rec->value > 0) values.push_back(rec->value);
    }

    ValueStats stats;
    if (values.empty()) return stats;
    stats.min = *std::min_element(values.begin(), values.end());
    stats.max = *std::max_element(values.begin(), values.end());
    stats.sum = std::accumulate(values.begin(), values.end(), 0.0);
    stats.mean = CalculateMean(values);
    return stats;
}

std::vector<int64_t> CollectTimestamps(const std::vector<const TransferRecord*>& records)
{
    std::vector<int64_t> times;
    for (const TransferRecord* rec : records) {
        if (rec->HasTimestamp()) times.push_back(rec->timestamp);
    }
    return times;
}

double AverageGapMinutes(const std::vector<const TransferRecord*>& records)
{
    return AverageGapSeconds(CollectTimestamps(records)) / 60.0;
}

size_t UniqueCounterparties(const std::vector<const TransferRecord*>& records)
{
    std::set<std::string> parties;
    for (const TransferRecord* rec : records) {
        if (!rec->counterparty.empty()) parties.insert(rec->counterparty);
    }
    return parties.size();
}

/** Occurrence count of the most frequent token contract */
size_t MostFrequentContractCount(const std::vector<std::string>& contracts)
{
    std::map<std::string, size_t> counts;
    size_t best = 0;
    for (const std::string& contract : contracts) {
        best = std::max(best, ++counts[contract]);
    }
    return best;
}

template <typename Pred>
std::vector<const TransferRecord*> Select(const std::vector<TransferRecord>& records, Pred pred)
{
    std::vector<const TransferRecord*> out;
    for (const TransferRecord& rec : records) {
        if (pred(rec)) out.push_back(&rec);
    }
    return out;
}

bool IsContractSend(const TransferRecord& rec)
{
    return rec.HasContract() || rec.category == TransferCategory::INTERNAL;
}

} // namespace

FeatureMap BuildFeatureMap(const AccountActivity& activity)
{
    auto all = [](const TransferRecord&) { return true; };
    auto ofCategory = [](TransferCategory cat) {
        return [cat](const TransferRecord& rec) { return rec.category == cat; };
    };

    const auto sentAll = Select(activity.sent, all);
    const auto receivedAll = Select(activity.received, all);
    const auto sentExternal = Select(activity.sent, ofCategory(TransferCategory::EXTERNAL));
    const auto receivedExternal = Select(activity.received, ofCategory(TransferCategory::EXTERNAL));
    const auto sentToken = Select(activity.sent, ofCategory(TransferCategory::FUNGIBLE_TOKEN));
    const auto receivedToken = Select(activity.received, ofCategory(TransferCategory::FUNGIBLE_TOKEN));
    const auto sentContract = Select(activity.sent, IsContractSend);
    const auto sentTokenContract = Select(activity.sent, [](const TransferRecord& rec) {
        return rec.category == TransferCategory::FUNGIBLE_TOKEN && IsContractSend(rec);
    });

    FeatureMap f;

    // Counts
    f[FEATURE_SENT_TNX] = sentExternal.size();
    f[FEATURE_RECEIVED_TNX] = receivedExternal.size();
    f[FEATURE_TOTAL_TOKEN_TNXS] = sentToken.size() + receivedToken.size();
    f[FEATURE_TOTAL_TX] = activity.TotalTransactions();
    f["Number of Created Contracts"] = Select(activity.sent, ofCategory(TransferCategory::INTERNAL)).size();

    // Timing
    f[FEATURE_AVG_MIN_SENT] = AverageGapMinutes(sentExternal);
    f[FEATURE_AVG_MIN_RECEIVED] = AverageGapMinutes(receivedExternal);
    std::vector<const TransferRecord*> everything = sentAll;
    everything.insert(everything.end(), receivedAll.begin(), receivedAll.end());
    std::vector<int64_t> times = CollectTimestamps(everything);
    if (times.size() >= 2) {
        auto range = std::minmax_element(times.begin(), times.end());
        f[FEATURE_TIME_SPAN_MINS] = (*range.second - *range.first) / 60.0;
    } else {
        f[FEATURE_TIME_SPAN_MINS] = 0;
    }

    // Native value statistics
    ValueStats sent = ComputeValueStats(sentExternal);
    f["min val sent"] = sent.min;
    f["max val sent"] = sent.max;
    f["avg val sent"] = sent.mean;
    f[FEATURE_TOTAL_ETHER_SENT] = sent.sum;

    ValueStats received = ComputeValueStats(receivedExternal);
    f["min value received"] = received.min;
    f["max value received"] = received.max;
    f["avg val received"] = received.mean;
    f[FEATURE_TOTAL_ETHER_RECEIVED] = received.sum;

    ValueStats contract = ComputeValueStats(sentContract);
    f["min value sent to contract"] = contract.min;
    f["max val sent to contract"] = contract.max;
    f["avg value sent to contract"] = contract.mean;
    f["total ether sent contracts"] = contract.sum;

    // Counterparties
    f[FEATURE_UNIQUE_SENT_TO] = UniqueCounterparties(sentAll);
    f[FEATURE_UNIQUE_RECEIVED_FROM] = UniqueCounterparties(receivedAll);

    f[FEATURE_BALANCE] = activity.balance;

    // Fungible token statistics
    ValueStats tokenSent = ComputeValueStats(sentToken);
    f[" ERC20 total ether sent"] = tokenSent.sum;
    f[" ERC20 min val sent"] = tokenSent.min;
    f[" ERC20 max val sent"] = tokenSent.max;
    f[" ERC20 avg val sent"] = tokenSent.mean;

    ValueStats tokenReceived = ComputeValueStats(receivedToken);
    f[" ERC20 total Ether received"] = tokenReceived.sum;
    f[" ERC20 min val rec"] = tokenReceived.min;
    f[" ERC20 max val rec"] = tokenReceived.max;
    f[" ERC20 avg val rec"] = tokenReceived.mean;

    f[" ERC20 uniq sent addr"] = UniqueCounterparties(sentToken);
    f[" ERC20 uniq rec addr"] = UniqueCounterparties(receivedToken);

    f[" ERC20 total Ether sent contract"] = ComputeValueStats(sentTokenContract).sum;
    f[" ERC20 uniq rec contract addr"] = UniqueCounterparties(sentTokenContract);

    f[" ERC20 avg time between sent tnx"] = AverageGapMinutes(sentToken);
    f[" ERC20 avg time between rec tnx"] = AverageGapMinutes(receivedToken);
    f[" ERC20 avg time between contract tnx"] = AverageGapMinutes(sentTokenContract);

    std::vector<std::string> sentContracts, receivedContracts;
    for (const TransferRecord* rec : sentToken) {
        if (rec->HasContract()) sentContracts.push_back(rec->tokenContract);
    }
    for (const TransferRecord* rec : receivedToken) {
        if (rec->HasContract()) receivedContracts.push_back(rec->tokenContract);
    }
    f[" ERC20 uniq sent token name"] = std::set<std::string>(sentContracts.begin(), sentContracts.end()).size();
    f[" ERC20 uniq rec token name"] = std::set<std::string>(receivedContracts.begin(), receivedContracts.end()).size();
    f[" ERC20 most sent token type"] = MostFrequentContractCount(sentContracts);
    f[" ERC20 most rec token type"] = MostFrequentContractCount(receivedContracts);

    for (auto& entry : f) {
        entry.second = SanitizeValue(entry.second);
    }

    LogPrint(BCLog::FEATURES, "%s: %u sent, %u received, span %.1f min, balance %.6f\n", __func__,
             activity.sent.size(), activity.received.size(), f[FEATURE_TIME_SPAN_MINS], activity.balance);
    return f;
}

FeatureVector FeaturesToVector(const FeatureMap& features)
{
    const std::vector<std::string>& names = GetFeatureNames();
    FeatureVector vec;
    for (size_t i = 0; i < names.size(); ++i) {
        vec.values[i] = SanitizeValue(GetFeature(features, names[i]));
    }
    return vec;
}

FeatureVector BuildFeatureVector(const AccountActivity& activity)
{
    return FeaturesToVector(BuildFeatureMap(activity));
}

double GetFeature(const FeatureMap& features, const std::string& name)
{
    auto it = features.find(name);
    return it != features.end() ? it->second : 0.0;
}

} // namespace fraudscore
