// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_REFERENCE_H
#define FRAUDSCORE_REFERENCE_H

#include <fraudscore/features.h>
#include <fraudscore/scaler.h>
#include <fraudscore/similarityindex.h>

#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fraudscore {

/** One labeled account of the reference population, raw (unnormalized) */
struct ReferenceRecord {
    std::string address;
    int flag;                       // 1 = fraud, 0 = legitimate
    FeatureVector raw;

    ReferenceRecord() : flag(0) {}
};

/**
 * Read Kaggle-style rows: a header with "Address", "FLAG" and any of the
 * canonical feature names (leading/trailing spaces and case are ignored
 * when matching). Blank or non-numeric cells become 0; unknown columns are
 * skipped. Rows without an address are skipped.
 */
bool ParseReferenceCSV(std::istream& in, std::vector<ReferenceRecord>& records, std::string& error);
bool LoadReferenceCSV(const std::string& path, std::vector<ReferenceRecord>& records, std::string& error);

/**
 * Read a JSON array of {"address", "flag", "features": {name: value}} or
 * {"address", "flag", "activity": {...}} objects. Activity entries are
 * turned into features with BuildFeatureVector.
 */
bool ParseReferenceJSON(const std::string& text, std::vector<ReferenceRecord>& records, std::string& error);
bool LoadReferenceJSON(const std::string& path, std::vector<ReferenceRecord>& records, std::string& error);

/** Pick LoadReferenceJSON for *.json, LoadReferenceCSV otherwise */
bool LoadReference(const std::string& path, std::vector<ReferenceRecord>& records, std::string& error);

/**
 * Reference Snapshot
 *
 * A scaler together with the index whose entries it normalized. Scoring
 * captures one snapshot per request, so the query and the population are
 * always normalized by the same version.
 */
struct ReferenceSnapshot {
    const ScalerRef scaler;
    const std::shared_ptr<const SimilarityIndex> index;

    ReferenceSnapshot(const ScalerRef& scalerIn, const std::shared_ptr<const SimilarityIndex>& indexIn)
        : scaler(scalerIn), index(indexIn) {}

    uint32_t GetVersion() const { return scaler->GetVersion(); }
};

typedef std::shared_ptr<const ReferenceSnapshot> ReferenceSnapshotRef;

/**
 * Reference Registry
 *
 * Holds the snapshot scoring reads. Readers take it with an atomic load;
 * a rebuild swaps in a complete new snapshot, and requests that captured
 * the previous one keep using it until they finish.
 */
class ReferenceRegistry {
public:
    /** Latest snapshot, nullptr before the first publish */
    ReferenceSnapshotRef Current() const;

    /**
     * Publish a scaler and the index built with it. Rejected when either is
     * missing or the scaler is not newer than the current snapshot.
     */
    bool Publish(const ScalerRef& scaler, const std::shared_ptr<const SimilarityIndex>& index, std::string& error);

    /** Version of the current snapshot, 0 when none */
    uint32_t CurrentVersion() const;

private:
    std::mutex m_writerMutex;
    ReferenceSnapshotRef m_current;     // accessed through std::atomic_load/atomic_store only
};

/**
 * Fit the next scaler version on the raw vectors, build a fresh index with
 * every record normalized by it, then publish both as one snapshot. The
 * snapshot in use is untouched until the new one is complete.
 */
bool BuildReferenceIndex(const std::vector<ReferenceRecord>& records, ScalerRegistry& scalers,
                         ReferenceRegistry& references, std::string& error);

} // namespace fraudscore

#endif // FRAUDSCORE_REFERENCE_H
