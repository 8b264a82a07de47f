// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/activity.h>
#include <util.h>
#include <utilstrencodings.h>
#include <utiltime.h>

#include <univalue.h>

#include <cmath>
#include <fstream>
#include <sstream>

namespace fraudscore {

namespace {

double ReadValue(const UniValue& val, const char* field)
{
    if (val.isNum()) {
        double v = val.get_real();
        if (std::isfinite(v) && v >= 0) return v;
    } else if (val.isStr()) {
        double v = 0;
        if (ParseDouble(TrimString(val.get_str()), &v) && v >= 0) return v;
    } else if (val.isNull()) {
        return 0;
    }
    LogPrint(BCLog::FEATURES, "Ignoring malformed %s '%s'\n", field, val.write());
    return 0;
}

int64_t ReadTimestamp(const UniValue& val)
{
    if (val.isNull()) return 0;
    if (val.isNum()) {
        double v = val.get_real();
        if (std::isfinite(v) && v > 0) return static_cast<int64_t>(v);
    } else if (val.isStr()) {
        const std::string str = TrimString(val.get_str());
        int64_t t = 0;
        if (ParseInt64(str, &t) && t > 0) return t;
        if (ParseISO8601DateTime(str, t) && t > 0) return t;
    }
    LogPrint(BCLog::FEATURES, "Ignoring malformed timestamp '%s'\n", val.write());
    return 0;
}

std::string ReadString(const UniValue& val)
{
    return val.isStr() ? val.get_str() : std::string();
}

TransferRecord RecordFromJSON(const UniValue& obj, TransferDirection direction)
{
    TransferRecord rec;
    rec.direction = direction;

    const UniValue& category = obj["category"];
    if (category.isStr()) {
        if (!ParseTransferCategory(category.get_str(), rec.category)) {
            LogPrint(BCLog::FEATURES, "Unknown transfer category '%s', treating as external\n", category.get_str());
        }
    }

    rec.value = ReadValue(obj["value"], "value");

    const char* partyField = direction == TransferDirection::SENT ? "to" : "from";
    rec.counterparty = ReadString(obj[partyField]);
    if (rec.counterparty.empty()) rec.counterparty = ReadString(obj["counterparty"]);

    const UniValue& timestamp = obj["timestamp"];
    if (!timestamp.isNull()) {
        rec.timestamp = ReadTimestamp(timestamp);
    } else if (obj["metadata"].isObject()) {
        rec.timestamp = ReadTimestamp(obj["metadata"]["blockTimestamp"]);
    }

    rec.tokenContract = ReadString(obj["token_contract"]);
    if (rec.tokenContract.empty() && obj["rawContract"].isObject()) {
        rec.tokenContract = ReadString(obj["rawContract"]["address"]);
    }
    return rec;
}

void ReadTransfers(const UniValue& list, TransferDirection direction, std::vector<TransferRecord>& out)
{
    if (list.isNull()) return;
    if (!list.isArray()) {
        LogPrint(BCLog::FEATURES, "Ignoring non-array transfer list\n");
        return;
    }
    for (size_t i = 0; i < list.size(); ++i) {
        if (!list[i].isObject()) {
            LogPrint(BCLog::FEATURES, "Skipping non-object transfer at index %u\n", i);
            continue;
        }
        out.push_back(RecordFromJSON(list[i], direction));
    }
}

const UniValue& FirstPresent(const UniValue& obj, const char* a, const char* b)
{
    const UniValue& first = obj[a];
    return first.isNull() ? obj[b] : first;
}

} // namespace

bool ActivityFromJSON(const UniValue& val, AccountActivity& activity, std::string& error)
{
    if (!val.isObject()) {
        error = "activity must be a JSON object";
        return false;
    }
    AccountActivity result;
    ReadTransfers(FirstPresent(val, "sent", "sent_transfers"), TransferDirection::SENT, result.sent);
    ReadTransfers(FirstPresent(val, "received", "received_transfers"), TransferDirection::RECEIVED, result.received);
    result.balance = ReadValue(val["balance"], "balance");
    activity = std::move(result);
    return true;
}

bool ParseActivityJSON(const std::string& text, AccountActivity& activity, std::string& address, std::string& error)
{
    UniValue val;
    if (!val.read(text)) {
        error = "activity is not valid JSON";
        return false;
    }
    if (!ActivityFromJSON(val, activity, error)) {
        return false;
    }
    address = ReadString(val["address"]);
    return true;
}

bool ReadFileToString(const std::string& path, std::string& contents, std::string& error)
{
    std::ifstream file(path);
    if (!file.good()) {
        error = tfm::format("cannot open %s", path);
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    contents = ss.str();
    return true;
}

JSONFileActivitySource::JSONFileActivitySource(const std::string& path) : m_path(path)
{
}

bool JSONFileActivitySource::FetchActivity(const std::string& reference, AccountActivity& activity, std::string& error)
{
    std::string text;
    if (!ReadFileToString(m_path, text, error)) {
        return false;
    }
    UniValue val;
    if (!val.read(text)) {
        error = tfm::format("%s is not valid JSON", m_path);
        return false;
    }

    if (val.isObject()) {
        const std::string address = ReadString(val["address"]);
        if (!reference.empty() && !address.empty() && ToLower(address) != ToLower(reference)) {
            error = tfm::format("%s holds activity for %s, not %s", m_path, address, reference);
            return false;
        }
        return ActivityFromJSON(val, activity, error);
    }

    if (val.isArray()) {
        for (size_t i = 0; i < val.size(); ++i) {
            const UniValue& entry = val[i];
            if (!entry.isObject()) continue;
            const std::string address = ReadString(entry["address"]);
            if (reference.empty() || ToLower(address) == ToLower(reference)) {
                return ActivityFromJSON(entry, activity, error);
            }
        }
        error = tfm::format("no activity for %s in %s", reference, m_path);
        return false;
    }

    error = tfm::format("%s must hold an object or an array", m_path);
    return false;
}

} // namespace fraudscore
