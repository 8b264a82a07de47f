// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/similarityindex.h>
#include <fraudscore/stats.h>
#include <util.h>

#include <algorithm>
#include <cmath>
#include <mutex>

namespace fraudscore {

InMemorySimilarityIndex::InMemorySimilarityIndex() : m_scalerVersion(0)
{
}

bool InMemorySimilarityIndex::Insert(const std::string& address, int label, const FeatureVector& normalized, std::string& error)
{
    std::unique_lock<std::shared_timed_mutex> lock(m_mutex);
    if (!m_entries.empty()) {
        if (normalized.values.size() != m_entries.front().values.size()) {
            error = tfm::format("vector for %s has %u dimensions, index expects %u",
                                address, normalized.values.size(), m_entries.front().values.size());
            return false;
        }
        if (normalized.scalerVersion != m_scalerVersion) {
            error = tfm::format("vector for %s normalized with scaler %u, index uses %u",
                                address, normalized.scalerVersion, m_scalerVersion);
            return false;
        }
    } else {
        m_scalerVersion = normalized.scalerVersion;
    }

    Entry entry;
    entry.address = address;
    entry.label = label != 0 ? 1 : 0;
    entry.values = normalized.values;
    for (double& v : entry.values) v = SanitizeValue(v);
    m_entries.push_back(std::move(entry));
    return true;
}

std::vector<NeighborEvidence> InMemorySimilarityIndex::Search(const FeatureVector& normalized, size_t k) const
{
    std::shared_lock<std::shared_timed_mutex> lock(m_mutex);
    std::vector<NeighborEvidence> result;
    if (k == 0 || m_entries.empty()) {
        return result;
    }
    if (normalized.values.size() != m_entries.front().values.size()) {
        LogPrint(BCLog::INDEX, "%s: query has %u dimensions, index has %u\n", __func__,
                 normalized.values.size(), m_entries.front().values.size());
        return result;
    }
    if (normalized.scalerVersion != m_scalerVersion) {
        // Distances across two normalizations mean nothing
        LogPrint(BCLog::INDEX, "%s: query normalized with scaler %u, index built with %u\n", __func__,
                 normalized.scalerVersion, m_scalerVersion);
        return result;
    }

    result.reserve(m_entries.size());
    for (const Entry& entry : m_entries) {
        double sum = 0;
        for (size_t d = 0; d < entry.values.size(); ++d) {
            double diff = SanitizeValue(normalized.values[d]) - entry.values[d];
            sum += diff * diff;
        }
        const double distance = std::sqrt(sum);
        if (!std::isfinite(distance)) {
            LogPrint(BCLog::INDEX, "%s: distance to %s overflowed, skipped\n", __func__, entry.address);
            continue;
        }
        result.emplace_back(entry.address, entry.label, distance);
    }

    const size_t keep = std::min(k, result.size());
    std::partial_sort(result.begin(), result.begin() + keep, result.end(),
                      [](const NeighborEvidence& a, const NeighborEvidence& b) { return a.distance < b.distance; });
    result.resize(keep);
    return result;
}

size_t InMemorySimilarityIndex::Size() const
{
    std::shared_lock<std::shared_timed_mutex> lock(m_mutex);
    return m_entries.size();
}

uint32_t InMemorySimilarityIndex::GetScalerVersion() const
{
    std::shared_lock<std::shared_timed_mutex> lock(m_mutex);
    return m_scalerVersion;
}

} // namespace fraudscore
