// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <random.h>

FastRandomContext::FastRandomContext(bool fDeterministic)
{
    if (fDeterministic) {
        rng.seed(0);
    } else {
        std::random_device rd;
        rng.seed(((uint64_t)rd() << 32) | rd());
    }
}
