// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_RANDOM_H
#define FRAUDSCORE_RANDOM_H

#include <cstdint>
#include <random>

/**
 * Fast randomness source. Not suitable for anything security related;
 * used for jitter and by the tests to generate inputs.
 */
class FastRandomContext {
private:
    std::mt19937_64 rng;

public:
    /** A deterministic context always yields the same sequence */
    explicit FastRandomContext(bool fDeterministic = false);

    uint64_t rand64() { return rng(); }

    uint32_t rand32() { return (uint32_t)(rng() >> 32); }

    /** Generate a random integer in the range [0..range). */
    uint64_t randrange(uint64_t range)
    {
        if (range == 0) return 0;
        std::uniform_int_distribution<uint64_t> dist(0, range - 1);
        return dist(rng);
    }

    /** Generate a double in [0, 1). */
    double randdouble()
    {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(rng);
    }

    bool randbool() { return rng() & 1; }
};

#endif // FRAUDSCORE_RANDOM_H
