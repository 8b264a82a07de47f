// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_FEATURES_H
#define FRAUDSCORE_FEATURES_H

#include <fraudscore/transfer.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fraudscore {

/** Number of dimensions of every feature vector */
static const size_t FEATURE_COUNT = 44;

/**
 * Canonical feature names in vector order. The names follow the public
 * Ethereum fraud dataset columns verbatim (some carry a leading space) so a
 * labeled reference population can be ingested without renaming. The last
 * two names repeat earlier ones and occupy their own dimensions.
 */
const std::vector<std::string>& GetFeatureNames();

// Names referenced outside the builder
extern const char* const FEATURE_AVG_MIN_SENT;
extern const char* const FEATURE_AVG_MIN_RECEIVED;
extern const char* const FEATURE_TIME_SPAN_MINS;
extern const char* const FEATURE_SENT_TNX;
extern const char* const FEATURE_RECEIVED_TNX;
extern const char* const FEATURE_UNIQUE_RECEIVED_FROM;
extern const char* const FEATURE_UNIQUE_SENT_TO;
extern const char* const FEATURE_TOTAL_TX;
extern const char* const FEATURE_TOTAL_ETHER_SENT;
extern const char* const FEATURE_TOTAL_ETHER_RECEIVED;
extern const char* const FEATURE_BALANCE;
extern const char* const FEATURE_TOTAL_TOKEN_TNXS;

typedef std::map<std::string, double> FeatureMap;

/**
 * Feature Vector
 *
 * Always FEATURE_COUNT values in canonical order. scalerVersion is 0 for a
 * raw vector and the version of the scaler that produced it otherwise.
 */
struct FeatureVector {
    std::vector<double> values;
    uint32_t scalerVersion;

    FeatureVector() : values(FEATURE_COUNT, 0.0), scalerVersion(0) {}

    bool IsNormalized() const { return scalerVersion != 0; }
};

/**
 * Compute every canonical feature from the raw history.
 *
 * Zero-valued transfers count as transactions but are excluded from the
 * value statistics. Records without a timestamp are excluded from the
 * timing statistics. Every value is finite.
 */
FeatureMap BuildFeatureMap(const AccountActivity& activity);

/** Lay a feature map out in canonical order; absent names are 0 */
FeatureVector FeaturesToVector(const FeatureMap& features);

/** Convenience for FeaturesToVector(BuildFeatureMap(activity)) */
FeatureVector BuildFeatureVector(const AccountActivity& activity);

/** Look up a feature by name, 0 when absent */
double GetFeature(const FeatureMap& features, const std::string& name);

} // namespace fraudscore

#endif // FRAUDSCORE_FEATURES_H
