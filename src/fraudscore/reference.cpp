// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/reference.h>
#include <fraudscore/activity.h>
#include <util.h>
#include <utilstrencodings.h>

#include <univalue.h>

#include <algorithm>
#include <cmath>
#include <fstream>

namespace fraudscore {

namespace {

/** Split one CSV line, honouring double quotes ("" inside quotes is a literal quote) */
std::vector<std::string> SplitCSVLine(const std::string& line)
{
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cell += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(cell);
            cell.clear();
        } else if (c != '\r') {
            cell += c;
        }
    }
    cells.push_back(cell);
    return cells;
}

/** Canonical feature name for a header cell, or empty if it is not a feature */
std::string MatchFeatureName(const std::string& header)
{
    const std::vector<std::string>& names = GetFeatureNames();
    for (const std::string& name : names) {
        if (name == header) return name;
    }
    const std::string wanted = ToLower(TrimString(header));
    for (const std::string& name : names) {
        if (ToLower(TrimString(name)) == wanted) return name;
    }
    return std::string();
}

double ParseCell(const std::string& cell)
{
    double v = 0;
    if (!ParseDouble(TrimString(cell), &v)) return 0;
    return v;
}

int ParseFlag(const std::string& cell)
{
    return ParseCell(cell) != 0 ? 1 : 0;
}

int ParseFlag(const UniValue& val)
{
    if (val.isNum()) return val.get_real() != 0 ? 1 : 0;
    if (val.isBool()) return val.isTrue() ? 1 : 0;
    if (val.isStr()) return ParseFlag(val.get_str());
    return 0;
}

} // namespace

bool ParseReferenceCSV(std::istream& in, std::vector<ReferenceRecord>& records, std::string& error)
{
    std::string line;
    if (!std::getline(in, line)) {
        error = "reference CSV is empty";
        return false;
    }
    // Strip a UTF-8 byte order mark
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line = line.substr(3);
    }

    const std::vector<std::string> header = SplitCSVLine(line);
    int addressCol = -1;
    int flagCol = -1;
    std::vector<std::string> columnFeature(header.size());
    size_t matched = 0;
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string name = ToLower(TrimString(header[i]));
        if (name == "address") {
            addressCol = i;
        } else if (name == "flag") {
            flagCol = i;
        } else {
            columnFeature[i] = MatchFeatureName(header[i]);
            if (!columnFeature[i].empty()) ++matched;
        }
    }
    if (addressCol < 0 || flagCol < 0) {
        error = "reference CSV header needs Address and FLAG columns";
        return false;
    }
    LogPrint(BCLog::INDEX, "%s: %u of %u feature columns present\n", __func__, matched, FEATURE_COUNT);

    std::vector<ReferenceRecord> result;
    int lineno = 1;
    while (std::getline(in, line)) {
        ++lineno;
        if (TrimString(line).empty()) continue;
        const std::vector<std::string> cells = SplitCSVLine(line);
        if (cells.size() <= static_cast<size_t>(std::max(addressCol, flagCol))) {
            LogPrint(BCLog::INDEX, "%s: skipping short row on line %d\n", __func__, lineno);
            continue;
        }
        ReferenceRecord rec;
        rec.address = TrimString(cells[addressCol]);
        if (rec.address.empty()) {
            LogPrint(BCLog::INDEX, "%s: skipping row without address on line %d\n", __func__, lineno);
            continue;
        }
        rec.flag = ParseFlag(cells[flagCol]);

        FeatureMap features;
        for (size_t i = 0; i < cells.size() && i < columnFeature.size(); ++i) {
            if (columnFeature[i].empty()) continue;
            // A name listed twice in the canonical order reads the first column found
            if (features.count(columnFeature[i])) continue;
            features[columnFeature[i]] = ParseCell(cells[i]);
        }
        rec.raw = FeaturesToVector(features);
        result.push_back(std::move(rec));
    }

    records = std::move(result);
    return true;
}

bool LoadReferenceCSV(const std::string& path, std::vector<ReferenceRecord>& records, std::string& error)
{
    std::ifstream file(path);
    if (!file.good()) {
        error = tfm::format("cannot open %s", path);
        return false;
    }
    return ParseReferenceCSV(file, records, error);
}

bool ParseReferenceJSON(const std::string& text, std::vector<ReferenceRecord>& records, std::string& error)
{
    UniValue val;
    if (!val.read(text) || !val.isArray()) {
        error = "reference JSON must be an array";
        return false;
    }

    std::vector<ReferenceRecord> result;
    for (size_t i = 0; i < val.size(); ++i) {
        const UniValue& entry = val[i];
        if (!entry.isObject() || !entry["address"].isStr()) {
            LogPrint(BCLog::INDEX, "%s: skipping entry %u without address\n", __func__, i);
            continue;
        }
        ReferenceRecord rec;
        rec.address = entry["address"].get_str();
        rec.flag = ParseFlag(entry["flag"]);

        const UniValue& features = entry["features"];
        const UniValue& activity = entry["activity"];
        if (features.isObject()) {
            FeatureMap map;
            for (const std::string& name : GetFeatureNames()) {
                const UniValue& v = features[name];
                if (v.isNum()) {
                    map[name] = v.get_real();
                } else if (v.isStr()) {
                    map[name] = ParseCell(v.get_str());
                }
            }
            rec.raw = FeaturesToVector(map);
        } else if (activity.isObject()) {
            AccountActivity history;
            if (!ActivityFromJSON(activity, history, error)) {
                return false;
            }
            rec.raw = BuildFeatureVector(history);
        } else {
            error = tfm::format("reference entry %s has neither features nor activity", rec.address);
            return false;
        }
        result.push_back(std::move(rec));
    }

    records = std::move(result);
    return true;
}

bool LoadReferenceJSON(const std::string& path, std::vector<ReferenceRecord>& records, std::string& error)
{
    std::string text;
    if (!ReadFileToString(path, text, error)) {
        return false;
    }
    return ParseReferenceJSON(text, records, error);
}

bool LoadReference(const std::string& path, std::vector<ReferenceRecord>& records, std::string& error)
{
    const std::string lower = ToLower(path);
    if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".json") == 0) {
        return LoadReferenceJSON(path, records, error);
    }
    return LoadReferenceCSV(path, records, error);
}

ReferenceSnapshotRef ReferenceRegistry::Current() const
{
    return std::atomic_load(&m_current);
}

bool ReferenceRegistry::Publish(const ScalerRef& scaler, const std::shared_ptr<const SimilarityIndex>& index,
                                std::string& error)
{
    if (!scaler || !index) {
        error = "reference snapshot needs a scaler and an index";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writerMutex);
    ReferenceSnapshotRef current = std::atomic_load(&m_current);
    if (current && scaler->GetVersion() <= current->GetVersion()) {
        error = tfm::format("scaler version %u is not newer than published version %u",
                            scaler->GetVersion(), current->GetVersion());
        return false;
    }
    std::atomic_store(&m_current, ReferenceSnapshotRef(std::make_shared<const ReferenceSnapshot>(scaler, index)));
    LogPrint(BCLog::INDEX, "Published reference snapshot version %u\n", scaler->GetVersion());
    return true;
}

uint32_t ReferenceRegistry::CurrentVersion() const
{
    ReferenceSnapshotRef current = Current();
    return current ? current->GetVersion() : 0;
}

bool BuildReferenceIndex(const std::vector<ReferenceRecord>& records, ScalerRegistry& scalers,
                         ReferenceRegistry& references, std::string& error)
{
    if (records.empty()) {
        error = "reference population is empty";
        return false;
    }

    std::vector<FeatureVector> batch;
    batch.reserve(records.size());
    for (const ReferenceRecord& rec : records) {
        batch.push_back(rec.raw);
    }

    ScalerRef scaler = scalers.Fit(batch);
    if (!scaler) {
        error = "could not fit scaler on reference population";
        return false;
    }

    std::shared_ptr<InMemorySimilarityIndex> index = std::make_shared<InMemorySimilarityIndex>();
    for (const ReferenceRecord& rec : records) {
        if (!index->Insert(rec.address, rec.flag, Normalize(*scaler, rec.raw), error)) {
            return false;
        }
    }
    if (!references.Publish(scaler, index, error)) {
        return false;
    }
    LogPrintf("Reference index holds %u accounts (scaler version %u)\n", index->Size(), scaler->GetVersion());
    return true;
}

} // namespace fraudscore
