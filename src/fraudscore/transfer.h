// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_TRANSFER_H
#define FRAUDSCORE_TRANSFER_H

#include <cstdint>
#include <string>
#include <vector>

namespace fraudscore {

enum class TransferDirection {
    SENT,
    RECEIVED
};

/**
 * Transfer Category
 *
 * Kind of asset movement. Token categories map to the usual
 * fungible (ERC20), non-fungible (ERC721) and multi-token (ERC1155)
 * standards.
 */
enum class TransferCategory {
    EXTERNAL,           // Native value transfer between accounts
    INTERNAL,           // Contract-initiated transfer / contract creation
    FUNGIBLE_TOKEN,
    NFT,
    MULTI_TOKEN
};

/**
 * Transfer Record
 *
 * One asset movement seen from the scored account. A timestamp of 0 means
 * the source did not supply a usable time; such records are counted but
 * take no part in timing statistics.
 */
struct TransferRecord {
    TransferDirection direction;
    TransferCategory category;
    double value;                   // Non-negative
    std::string counterparty;       // Recipient for SENT, sender for RECEIVED
    int64_t timestamp;              // Unix seconds, 0 when unknown
    std::string tokenContract;      // Empty when the transfer has no contract

    TransferRecord() : direction(TransferDirection::SENT), category(TransferCategory::EXTERNAL),
                       value(0), timestamp(0) {}

    TransferRecord(TransferDirection dir, TransferCategory cat, double val,
                   const std::string& party, int64_t time, const std::string& contract = std::string())
        : direction(dir), category(cat), value(val < 0 ? 0 : val), counterparty(party),
          timestamp(time < 0 ? 0 : time), tokenContract(contract) {}

    bool HasTimestamp() const { return timestamp > 0; }
    bool HasContract() const { return !tokenContract.empty(); }
};

/**
 * Account Activity
 *
 * Raw transfer history of one account plus its current balance. Empty
 * lists are valid input.
 */
struct AccountActivity {
    std::vector<TransferRecord> sent;
    std::vector<TransferRecord> received;
    double balance;

    AccountActivity() : balance(0) {}

    size_t TotalTransactions() const { return sent.size() + received.size(); }
};

/** Return true for the fungible, non-fungible and multi-token categories */
bool IsTokenCategory(TransferCategory category);

/** Canonical lowercase name ("external", "internal", "erc20", "erc721", "erc1155") */
std::string TransferCategoryName(TransferCategory category);

/**
 * Parse a category name. Accepts the canonical names as well as
 * "fungible_token", "nft" and "multi_token" in any case.
 *
 * @return false for unknown names; category is left as EXTERNAL
 */
bool ParseTransferCategory(const std::string& name, TransferCategory& category);

} // namespace fraudscore

#endif // FRAUDSCORE_TRANSFER_H
