// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_SIMILARITYINDEX_H
#define FRAUDSCORE_SIMILARITYINDEX_H

#include <fraudscore/collaborators.h>

#include <shared_mutex>
#include <string>
#include <vector>

namespace fraudscore {

/**
 * In-memory similarity index
 *
 * Exhaustive Euclidean search. Suitable for reference populations that fit
 * in memory; searches run concurrently, inserts take the lock exclusively.
 * An index is filled before it is published in a ReferenceSnapshot and is
 * read-only afterwards.
 */
class InMemorySimilarityIndex : public SimilarityIndex {
public:
    InMemorySimilarityIndex();

    /**
     * Add a labeled, normalized vector. All entries must share one
     * dimension count and one scaler version.
     */
    bool Insert(const std::string& address, int label, const FeatureVector& normalized, std::string& error);

    /**
     * Queries normalized by another scaler version, or with another
     * dimension count, find nothing. Entries whose distance overflows are
     * left out.
     */
    std::vector<NeighborEvidence> Search(const FeatureVector& normalized, size_t k) const override;

    size_t Size() const;
    uint32_t GetScalerVersion() const;

private:
    struct Entry {
        std::string address;
        int label;
        std::vector<double> values;
    };

    mutable std::shared_timed_mutex m_mutex;
    std::vector<Entry> m_entries;
    uint32_t m_scalerVersion;
};

} // namespace fraudscore

#endif // FRAUDSCORE_SIMILARITYINDEX_H
