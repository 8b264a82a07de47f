// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_ORACLEBREAKER_H
#define FRAUDSCORE_ORACLEBREAKER_H

#include <cstdint>
#include <mutex>
#include <string>

namespace fraudscore {

/** Outcome of one oracle call */
enum class OracleCallStatus {
    OK,                 // an answer arrived; it may still fail to parse
    TIMEOUT,
    TRANSPORT_ERROR,
    CANCELLED
};

/** "ok", "timeout", "transport_error" or "cancelled" */
std::string OracleCallStatusName(OracleCallStatus status);

enum class BreakerState {
    CLOSED,             // calls go through
    OPEN,               // calls skipped until the cool-down ends
    PROBING             // one trial call in flight after the cool-down
};

/** "closed", "open" or "half-open" */
std::string BreakerStateName(BreakerState state);

static const uint32_t DEFAULT_ORACLE_FAILURE_THRESHOLD = 5;
static const int64_t DEFAULT_ORACLE_COOLDOWN_MS = 30000;

struct OracleBreakerConfig {
    uint32_t failureThreshold;      // consecutive timeouts or transport errors that open the breaker
    int64_t cooldownMs;

    OracleBreakerConfig() : failureThreshold(DEFAULT_ORACLE_FAILURE_THRESHOLD), cooldownMs(DEFAULT_ORACLE_COOLDOWN_MS) {}
};

/**
 * Oracle Breaker
 *
 * Tracks whether the reasoning oracle is reachable. TIMEOUT and
 * TRANSPORT_ERROR count against it; OK resets the count even if the answer
 * later proves unusable, since the service itself responded. CANCELLED
 * says nothing about the service and is not counted.
 *
 * After failureThreshold failures in a row the breaker opens and every
 * AllowCall() is refused for cooldownMs. The first call after that is a
 * trial call: OK closes the breaker, a failure reopens it for another cool-down.
 */
class OracleBreaker {
public:
    explicit OracleBreaker(const OracleBreakerConfig& config = OracleBreakerConfig());

    /** False while open, or while a trial call is already in flight */
    bool AllowCall();

    /** Report how a call that AllowCall() let through ended */
    void Record(OracleCallStatus status);

    BreakerState GetState() const;
    uint32_t GetConsecutiveFailures() const;
    uint64_t GetSkippedCalls() const;

private:
    const OracleBreakerConfig m_config;
    mutable std::mutex m_mutex;
    BreakerState m_state;
    uint32_t m_consecutiveFailures;
    int64_t m_openedAt;             // GetTimeMillis() when the breaker last opened
    bool m_trialInFlight;
    uint64_t m_skippedCalls;

    void Open(int64_t now);
};

} // namespace fraudscore

#endif // FRAUDSCORE_ORACLEBREAKER_H
