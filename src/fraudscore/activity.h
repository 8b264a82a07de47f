// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_ACTIVITY_H
#define FRAUDSCORE_ACTIVITY_H

#include <fraudscore/collaborators.h>
#include <fraudscore/transfer.h>

#include <string>

class UniValue;

namespace fraudscore {

/**
 * Read an account's history from a JSON object:
 *
 *   {"address": "...", "balance": 1.5,
 *    "sent": [{"category": "external", "value": 1.0, "to": "0x..",
 *              "timestamp": 1700000000, "token_contract": "0x.."}, ...],
 *    "received": [{..., "from": "0x.."}, ...]}
 *
 * "sent_transfers"/"received_transfers", "metadata.blockTimestamp" (ISO
 * 8601) and "rawContract.address" are accepted as well. Malformed fields
 * default to 0 / EXTERNAL / no timestamp and are logged, never rejected.
 *
 * @return false only when val is not an object
 */
bool ActivityFromJSON(const UniValue& val, AccountActivity& activity, std::string& error);

/** Parse JSON text; also returns the "address" member if present */
bool ParseActivityJSON(const std::string& text, AccountActivity& activity, std::string& address, std::string& error);

/** Read a whole file into a string */
bool ReadFileToString(const std::string& path, std::string& contents, std::string& error);

/**
 * Activity source backed by a JSON file holding one activity object or an
 * array of them keyed by their "address" member.
 */
class JSONFileActivitySource : public ActivitySource {
public:
    explicit JSONFileActivitySource(const std::string& path);

    bool FetchActivity(const std::string& reference, AccountActivity& activity, std::string& error) override;

private:
    std::string m_path;
};

} // namespace fraudscore

#endif // FRAUDSCORE_ACTIVITY_H
