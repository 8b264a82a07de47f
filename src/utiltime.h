// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_UTILTIME_H
#define FRAUDSCORE_UTILTIME_H

#include <cstdint>
#include <string>

/**
 * GetTimeMillis() returns the system time in milliseconds since the epoch.
 * GetTime() returns the system time in seconds.
 * GetTimeMicros() is steady, useful for timing durations.
 */
int64_t GetTime();
int64_t GetTimeMillis();
int64_t GetTimeMicros();

void MilliSleep(int64_t n);

/** ISO 8601 UTC formatting, e.g. 2025-01-31T12:00:00Z */
std::string FormatISO8601DateTime(int64_t nTime);

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[Z]" (a space may replace the 'T') as UTC.
 * Returns false on malformed input.
 */
bool ParseISO8601DateTime(const std::string& str, int64_t& nTime);

#endif // FRAUDSCORE_UTILTIME_H
