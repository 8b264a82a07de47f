// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef FRAUDSCORE_UTILSTRENCODINGS_H
#define FRAUDSCORE_UTILSTRENCODINGS_H

#include <cstdint>
#include <string>

std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v");

int atoi(const std::string& str);
int64_t atoi64(const std::string& str);

/**
 * Convert string to signed 64-bit integer with strict parse error feedback.
 * @returns true if the entire string could be parsed as valid integer,
 *   false if not the entire string could be parsed or when overflow or underflow occurred.
 */
bool ParseInt64(const std::string& str, int64_t *out);

/**
 * Convert string to double with strict parse error feedback.
 * @returns true if the entire string could be parsed as valid double,
 *   false if not the entire string could be parsed or when overflow or underflow occurred.
 */
bool ParseDouble(const std::string& str, double *out);

/** Lowercase an ASCII string; other bytes are left untouched */
std::string ToLower(const std::string& str);

/**
 * Format a paragraph of text to a fixed width, adding spaces for
 * indentation to any added line.
 */
std::string FormatParagraph(const std::string& in, size_t width = 79, size_t indent = 0);

#endif // FRAUDSCORE_UTILSTRENCODINGS_H
