// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_NEIGHBORS_H
#define FRAUDSCORE_NEIGHBORS_H

#include <string>
#include <vector>

namespace fraudscore {

/** Default smoothing term of the inverse-distance weights */
static const double DEFAULT_DISTANCE_EPSILON = 1e-6;
static const double DEFAULT_DECISION_THRESHOLD = 0.5;
static const double DEFAULT_DECISION_CONFIDENCE_FLOOR = 0.4;

/** Final and tentative classification labels */
enum class FraudLabel {
    FRAUD,
    NOT_FRAUD,
    UNDECIDED
};

/** "Fraud", "Not_Fraud" or "Undecided" */
std::string FraudLabelName(FraudLabel label);

/**
 * Neighbor Evidence
 *
 * One labeled reference account returned by the similarity index.
 */
struct NeighborEvidence {
    std::string address;
    int label;                  // 1 = fraud, 0 = legitimate
    double distance;            // >= 0

    NeighborEvidence() : label(0), distance(0) {}
    NeighborEvidence(const std::string& addr, int lbl, double dist)
        : address(addr), label(lbl), distance(dist) {}
};

/**
 * Neighbor Analysis
 *
 * Aggregate of a neighbor list. An empty list yields probability 0.5 and
 * confidence 0, which means "no evidence" rather than "no fraud".
 */
struct NeighborAnalysis {
    double fraudProbability;            // inverse-distance weighted
    double simpleProbability;           // fraud_count / total
    double confidence;
    double avgDistance;
    int fraudCount;
    int totalCount;

    NeighborAnalysis() : fraudProbability(0.5), simpleProbability(0.5), confidence(0),
                         avgDistance(0), fraudCount(0), totalCount(0) {}

    bool HasEvidence() const { return totalCount > 0; }
};

/**
 * Aggregate a neighbor list. Neighbors with a non-finite distance are
 * ignored, negative distances are read as 0 and any nonzero label counts
 * as fraud. A list with no usable neighbor is treated as empty.
 *
 * weighted probability = sum(label * w) / sum(w), w = 1 / (distance + epsilon)
 * confidence = (1 / (1 + avg_distance) + max(fraud, legit) / total) / 2
 */
NeighborAnalysis AnalyzeNeighbors(const std::vector<NeighborEvidence>& neighbors,
                                  double epsilon = DEFAULT_DISTANCE_EPSILON);

/**
 * Classify a probability with a symmetric dead zone. Confidence below the
 * floor is Undecided; probability >= threshold is Fraud; probability below
 * 1 - threshold is NotFraud; anything in between is Undecided.
 */
FraudLabel ClassifyProbability(double probability, double confidence,
                               double threshold = DEFAULT_DECISION_THRESHOLD,
                               double confidenceFloor = DEFAULT_DECISION_CONFIDENCE_FLOOR);

} // namespace fraudscore

#endif // FRAUDSCORE_NEIGHBORS_H
