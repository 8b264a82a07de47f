// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/scoreledger.h>
#include <fraudscore/stats.h>
#include <util.h>
#include <utiltime.h>

namespace fraudscore {

InMemoryScoreLedger::InMemoryScoreLedger(double step) : m_step(step)
{
}

bool InMemoryScoreLedger::RecordOutcome(const LedgerUpdate& update, std::string& error)
{
    if (update.reference.empty()) {
        error = "empty reference";
        return false;
    }
    const double confidence = Clamp01(update.confidence);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto inserted = m_entries.emplace(update.reference, LedgerEntry());
    LedgerEntry& entry = inserted.first->second;
    const int64_t now = GetTime();
    if (inserted.second) {
        entry.createdAt = now;
    }

    const double previous = entry.score;
    if (update.isFraud) {
        entry.score = Clamp01(entry.score + confidence * m_step);
        entry.fraudUpdates++;
    } else {
        entry.score = Clamp01(entry.score - confidence * m_step);
        entry.notFraudUpdates++;
    }
    entry.lastWasFraud = update.isFraud;
    entry.lastConfidence = confidence;
    entry.updatedAt = now;

    LogPrint(BCLog::LEDGER, "Updated score for %s: %.4f -> %.4f\n", update.reference, previous, entry.score);
    return true;
}

bool InMemoryScoreLedger::GetEntry(const std::string& reference, LedgerEntry& entry) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(reference);
    if (it == m_entries.end()) return false;
    entry = it->second;
    return true;
}

size_t InMemoryScoreLedger::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace fraudscore
