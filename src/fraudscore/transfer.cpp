// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/transfer.h>
#include <utilstrencodings.h>

namespace fraudscore {

bool IsTokenCategory(TransferCategory category)
{
    switch (category) {
        case TransferCategory::FUNGIBLE_TOKEN:
        case TransferCategory::NFT:
        case TransferCategory::MULTI_TOKEN:
            return true;
        default:
            return false;
    }
}

std::string TransferCategoryName(TransferCategory category)
{
    switch (category) {
        case TransferCategory::EXTERNAL: return "external";
        case TransferCategory::INTERNAL: return "internal";
        case TransferCategory::FUNGIBLE_TOKEN: return "erc20";
        case TransferCategory::NFT: return "erc721";
        case TransferCategory::MULTI_TOKEN: return "erc1155";
    }
    return "external";
}

bool ParseTransferCategory(const std::string& name, TransferCategory& category)
{
    const std::string lower = ToLower(TrimString(name));
    category = TransferCategory::EXTERNAL;
    if (lower == "external") {
        return true;
    } else if (lower == "internal") {
        category = TransferCategory::INTERNAL;
    } else if (lower == "erc20" || lower == "fungible_token" || lower == "token") {
        category = TransferCategory::FUNGIBLE_TOKEN;
    } else if (lower == "erc721" || lower == "nft") {
        category = TransferCategory::NFT;
    } else if (lower == "erc1155" || lower == "multi_token") {
        category = TransferCategory::MULTI_TOKEN;
    } else {
        return false;
    }
    return true;
}

} // namespace fraudscore
