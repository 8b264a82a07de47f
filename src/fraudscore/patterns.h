// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_PATTERNS_H
#define FRAUDSCORE_PATTERNS_H

#include <fraudscore/transfer.h>

#include <array>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fraudscore {

/**
 * Pattern Tag
 *
 * Every indicator a detector can raise.
 */
enum class PatternTag {
    // Temporal
    BURST_ACTIVITY,
    REGULAR_INTERVAL,
    NIGHT_ACTIVITY,
    SHORT_LIFESPAN_HIGH_ACTIVITY,
    // Value
    ROUND_VALUES,
    MATCHING_SEND_RECEIVE,
    MIXER_VALUE_FLOW,
    CONSISTENT_SMALL_VALUES,
    // Network
    HIGH_ADDRESS_DIVERSITY,
    ONE_TIME_INTERACTIONS,
    CIRCULAR_FLOW,
    DENYLIST_INTERACTIONS,
    // Token
    EXCESSIVE_TOKEN_DIVERSITY,
    TOKEN_WASH_TRADING,
    HIGH_NFT_ACTIVITY,
    // Behavioral
    DUST_ACCOUNT,
    IMMEDIATE_FORWARDING,
    ASYMMETRIC_TRANSACTIONS,
    ZERO_VALUE_SPAM
};

/** Stable snake_case name of a tag, e.g. "burst_activity_detected" */
std::string PatternTagName(PatternTag tag);

enum class DetectorKind {
    TEMPORAL = 0,
    VALUE,
    NETWORK,
    TOKEN,
    BEHAVIORAL
};

static const size_t DETECTOR_COUNT = 5;

/** "temporal_patterns", "value_patterns", ..., "behavioral_flags" */
std::string DetectorKindName(DetectorKind kind);

/**
 * Pattern Finding
 *
 * Output of one detector. riskLevel is the sum of the weights of the
 * raised tags, clamped to [0,1].
 */
struct PatternFinding {
    DetectorKind kind;
    std::set<PatternTag> tags;
    double riskLevel;
    std::map<std::string, double> metrics;

    PatternFinding() : kind(DetectorKind::TEMPORAL), riskLevel(0) {}
    explicit PatternFinding(DetectorKind k) : kind(k), riskLevel(0) {}

    bool HasTag(PatternTag tag) const { return tags.count(tag) != 0; }

    /** Raise a tag and add its weight */
    void Raise(PatternTag tag, double weight);
};

/**
 * Pattern Report
 *
 * The five findings of one account, indexed by detector kind.
 */
class PatternReport {
public:
    PatternReport();

    const PatternFinding& Get(DetectorKind kind) const { return m_findings[static_cast<size_t>(kind)]; }
    void Set(const PatternFinding& finding) { m_findings[static_cast<size_t>(finding.kind)] = finding; }

    bool HasTag(PatternTag tag) const;
    bool HasAnyTag(const std::set<PatternTag>& tags) const;

    /** Tags of all detectors in detector order */
    std::vector<PatternTag> AllTags() const;

    const std::array<PatternFinding, DETECTOR_COUNT>& Findings() const { return m_findings; }

private:
    std::array<PatternFinding, DETECTOR_COUNT> m_findings;
};

/**
 * Detector Thresholds
 *
 * Trigger constants and indicator weights of the five detectors.
 * Defaults are the empirically chosen production values.
 */
struct DetectorThresholds {
    // Temporal
    double burstGapSeconds;
    int burstMinCount;
    double burstWeight;
    int regularMinGaps;
    double regularMaxVariation;         // stddev / mean
    double regularMaxMeanSeconds;
    double regularWeight;
    int nightStartHour;                 // UTC, inclusive
    int nightEndHour;                   // UTC, inclusive
    double nightMinRatio;
    double nightWeight;
    double shortLifespanHours;
    int shortLifespanMinCount;
    double shortLifespanWeight;

    // Value
    std::vector<double> roundValues;
    double roundTolerance;
    double roundMinRatio;
    double roundWeight;
    size_t matchingWindow;
    double matchingTolerance;
    double matchingWeight;
    double mixerMinTotal;
    double mixerMinBalanceRatio;
    size_t mixerMinSent;
    double mixerWeight;
    size_t drainingMinSent;
    double drainingMaxVariation;
    double drainingWeight;

    // Network
    double diversityMinRatio;
    size_t diversityMinTx;
    double diversityWeight;
    double oneTimeMinRatio;
    size_t oneTimeMinSent;
    double oneTimeWeight;
    size_t circularMinOverlap;
    size_t circularMinTx;
    double circularMinRatio;
    double circularWeight;
    std::vector<std::string> denylistPatterns;
    int denylistMinMatches;
    double denylistWeight;

    // Token
    size_t tokenDiversityMin;
    double tokenDiversityWeight;
    int washMinPerSide;
    int washMaxImbalance;
    int washMinContracts;
    double washWeight;
    size_t nftMinCount;
    double nftWeight;

    // Behavioral
    size_t dustMinTx;
    double dustMaxBalance;
    double dustWeight;
    size_t forwardMinPerSide;
    double forwardMaxDelaySeconds;
    int forwardMinCount;
    double forwardWeight;
    size_t asymmetricMinTx;
    double asymmetricHighRatio;
    double asymmetricLowRatio;
    double asymmetricWeight;
    double zeroValueMinRatio;
    size_t zeroValueMinTx;
    double zeroValueWeight;

    DetectorThresholds();
};

PatternFinding DetectTemporalPatterns(const AccountActivity& activity, const DetectorThresholds& thresholds);
PatternFinding DetectValuePatterns(const AccountActivity& activity, const DetectorThresholds& thresholds);
PatternFinding DetectNetworkPatterns(const AccountActivity& activity, const DetectorThresholds& thresholds);
PatternFinding DetectTokenPatterns(const AccountActivity& activity, const DetectorThresholds& thresholds);
PatternFinding DetectBehavioralFlags(const AccountActivity& activity, const DetectorThresholds& thresholds);

/** Run all five detectors */
PatternReport RunPatternDetectors(const AccountActivity& activity, const DetectorThresholds& thresholds);

} // namespace fraudscore

#endif // FRAUDSCORE_PATTERNS_H
