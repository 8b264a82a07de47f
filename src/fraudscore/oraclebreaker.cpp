// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/oraclebreaker.h>
#include <util.h>
#include <utiltime.h>

namespace fraudscore {

std::string OracleCallStatusName(OracleCallStatus status)
{
    switch (status) {
        case OracleCallStatus::OK: return "ok";
        case OracleCallStatus::TIMEOUT: return "timeout";
        case OracleCallStatus::TRANSPORT_ERROR: return "transport_error";
        case OracleCallStatus::CANCELLED: return "cancelled";
    }
    return "transport_error";
}

std::string BreakerStateName(BreakerState state)
{
    switch (state) {
        case BreakerState::CLOSED: return "closed";
        case BreakerState::OPEN: return "open";
        case BreakerState::PROBING: return "half-open";
    }
    return "closed";
}

OracleBreaker::OracleBreaker(const OracleBreakerConfig& config)
    : m_config(config)
    , m_state(BreakerState::CLOSED)
    , m_consecutiveFailures(0)
    , m_openedAt(0)
    , m_trialInFlight(false)
    , m_skippedCalls(0)
{
}

void OracleBreaker::Open(int64_t now)
{
    if (m_state != BreakerState::OPEN) {
        LogPrint(BCLog::ORACLE, "Oracle breaker %s -> open after %u failures, retrying in %d ms\n",
                 BreakerStateName(m_state), m_consecutiveFailures, m_config.cooldownMs);
    }
    m_state = BreakerState::OPEN;
    m_openedAt = now;
    m_trialInFlight = false;
}

bool OracleBreaker::AllowCall()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == BreakerState::CLOSED) {
        return true;
    }
    if (m_state == BreakerState::OPEN && GetTimeMillis() - m_openedAt >= m_config.cooldownMs) {
        LogPrint(BCLog::ORACLE, "Oracle breaker cool-down over, probing\n");
        m_state = BreakerState::PROBING;
    }
    if (m_state == BreakerState::PROBING && !m_trialInFlight) {
        m_trialInFlight = true;
        return true;
    }
    ++m_skippedCalls;
    return false;
}

void OracleBreaker::Record(OracleCallStatus status)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    switch (status) {
        case OracleCallStatus::OK:
            m_consecutiveFailures = 0;
            if (m_state == BreakerState::PROBING) {
                LogPrint(BCLog::ORACLE, "Oracle answered the trial call, breaker closed\n");
                m_state = BreakerState::CLOSED;
                m_trialInFlight = false;
            }
            break;
        case OracleCallStatus::TIMEOUT:
        case OracleCallStatus::TRANSPORT_ERROR:
            ++m_consecutiveFailures;
            if (m_state == BreakerState::PROBING || m_consecutiveFailures >= m_config.failureThreshold) {
                Open(GetTimeMillis());
            }
            break;
        case OracleCallStatus::CANCELLED:
            // Let the next caller try instead
            m_trialInFlight = false;
            break;
    }
}

BreakerState OracleBreaker::GetState() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

uint32_t OracleBreaker::GetConsecutiveFailures() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_consecutiveFailures;
}

uint64_t OracleBreaker::GetSkippedCalls() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_skippedCalls;
}

} // namespace fraudscore
