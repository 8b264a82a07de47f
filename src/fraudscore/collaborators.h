// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Interfaces of the services the scoring pipeline depends on but does not
 * implement: ledger data, similarity search and score persistence.
 */
#ifndef FRAUDSCORE_COLLABORATORS_H
#define FRAUDSCORE_COLLABORATORS_H

#include <fraudscore/features.h>
#include <fraudscore/neighbors.h>
#include <fraudscore/transfer.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace fraudscore {

/**
 * Cancellation Token
 *
 * Copies share one flag, so the caller keeps a copy and cancels while the
 * pipeline polls its own.
 */
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() { m_flag->store(true); }
    bool IsCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

/** Supplies the raw transfer history of an account */
class ActivitySource {
public:
    virtual ~ActivitySource() {}

    /**
     * @param reference account identifier
     * @param[out] activity history; an account without history is not an error
     * @param[out] error reason when false is returned
     */
    virtual bool FetchActivity(const std::string& reference, AccountActivity& activity, std::string& error) = 0;
};

/** Nearest-neighbor search over a labeled reference population */
class SimilarityIndex {
public:
    virtual ~SimilarityIndex() {}

    /**
     * At most k neighbors of a normalized vector, nearest first. An empty
     * result is valid and means no evidence.
     */
    virtual std::vector<NeighborEvidence> Search(const FeatureVector& normalized, size_t k) const = 0;
};

/** Outcome handed to the scoring history store */
struct LedgerUpdate {
    std::string reference;
    bool isFraud;
    double confidence;

    LedgerUpdate() : isFraud(false), confidence(0) {}
    LedgerUpdate(const std::string& ref, bool fraud, double conf)
        : reference(ref), isFraud(fraud), confidence(conf) {}
};

/** Persists decided outcomes; never called for Undecided */
class ScoreLedger {
public:
    virtual ~ScoreLedger() {}

    virtual bool RecordOutcome(const LedgerUpdate& update, std::string& error) = 0;
};

} // namespace fraudscore

#endif // FRAUDSCORE_COLLABORATORS_H
