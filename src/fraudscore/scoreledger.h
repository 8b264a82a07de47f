// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_SCORELEDGER_H
#define FRAUDSCORE_SCORELEDGER_H

#include <fraudscore/collaborators.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace fraudscore {

static const double DEFAULT_LEDGER_STEP = 0.1;

/**
 * Ledger Entry
 *
 * Cumulative fraud score of one reference.
 */
struct LedgerEntry {
    double score;                   // 0.0-1.0
    bool lastWasFraud;
    double lastConfidence;
    uint32_t fraudUpdates;
    uint32_t notFraudUpdates;
    int64_t createdAt;
    int64_t updatedAt;

    LedgerEntry() : score(0), lastWasFraud(false), lastConfidence(0),
                    fraudUpdates(0), notFraudUpdates(0), createdAt(0), updatedAt(0) {}
};

/**
 * In-memory score ledger
 *
 * Additive rule starting from 0: a fraud outcome adds confidence * step,
 * any other outcome subtracts it; the score stays within [0,1].
 */
class InMemoryScoreLedger : public ScoreLedger {
public:
    explicit InMemoryScoreLedger(double step = DEFAULT_LEDGER_STEP);

    bool RecordOutcome(const LedgerUpdate& update, std::string& error) override;

    bool GetEntry(const std::string& reference, LedgerEntry& entry) const;
    size_t Size() const;

private:
    const double m_step;
    mutable std::mutex m_mutex;
    std::map<std::string, LedgerEntry> m_entries;
};

} // namespace fraudscore

#endif // FRAUDSCORE_SCORELEDGER_H
