// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/fusion.h>
#include <test/test_fraudscore.h>

#include <boost/test/unit_test.hpp>

using namespace fraudscore;

namespace {

FastRandomContext g_test_rand_ctx(true);

ScoreDecision Tentative(FraudLabel label, double confidence)
{
    OracleVerdict verdict;
    verdict.label = label;
    verdict.confidence = confidence;
    verdict.reasoning = "oracle says so";
    verdict.riskFactors.push_back("burst_activity_detected");
    return MakeTentativeDecision(verdict);
}

NeighborAnalysis Neighbors(double probability, double confidence)
{
    NeighborAnalysis analysis;
    analysis.fraudProbability = probability;
    analysis.confidence = confidence;
    analysis.totalCount = 10;
    return analysis;
}

FraudLabel RandomLabel()
{
    switch (g_test_rand_ctx.randrange(3)) {
        case 0: return FraudLabel::FRAUD;
        case 1: return FraudLabel::NOT_FRAUD;
        default: return FraudLabel::UNDECIDED;
    }
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(fusion_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(supported_fraud_call_is_kept)
{
    // p = 0.55 is above the unsupported-fraud probability limit
    ScoreDecision fused = FuseDecision(Tentative(FraudLabel::FRAUD, 0.8), Neighbors(0.55, 0.35), 0.30, ValidationReport());
    BOOST_CHECK(fused.label == FraudLabel::FRAUD);
    BOOST_CHECK_CLOSE(fused.confidence, 0.8, 1e-9);
    BOOST_CHECK(fused.guardrailsApplied.empty());
    BOOST_CHECK_EQUAL(fused.reasoning, "oracle says so");
}

BOOST_AUTO_TEST_CASE(unsupported_fraud_call_is_downgraded)
{
    ScoreDecision fused = FuseDecision(Tentative(FraudLabel::FRAUD, 0.8), Neighbors(0.45, 0.35), 0.30, ValidationReport());
    BOOST_CHECK(fused.label == FraudLabel::UNDECIDED);
    BOOST_CHECK_CLOSE(fused.confidence, 0.5, 1e-9);
    BOOST_REQUIRE_EQUAL(fused.guardrailsApplied.size(), 1u);
    BOOST_CHECK(fused.guardrailsApplied[0] == Guardrail::UNSUPPORTED_FRAUD);
    BOOST_CHECK_EQUAL(fused.reasoning, "oracle says so [Adjusted to Undecided - weak fraud signals]");
    BOOST_REQUIRE_EQUAL(fused.riskFactors.size(), 1u);

    // Unconfident neighbors do not support the downgrade
    ScoreDecision kept = FuseDecision(Tentative(FraudLabel::FRAUD, 0.8), Neighbors(0.45, 0.28), 0.30, ValidationReport());
    BOOST_CHECK(kept.label == FraudLabel::FRAUD);
}

BOOST_AUTO_TEST_CASE(low_neighbor_confidence_forces_undecided)
{
    ScoreDecision fused = FuseDecision(Tentative(FraudLabel::NOT_FRAUD, 0.9), Neighbors(0.1, 0.2), 0.1, ValidationReport());
    BOOST_CHECK(fused.label == FraudLabel::UNDECIDED);
    BOOST_CHECK_CLOSE(fused.confidence, 0.4, 1e-9);
    BOOST_REQUIRE_EQUAL(fused.guardrailsApplied.size(), 1u);
    BOOST_CHECK(fused.guardrailsApplied[0] == Guardrail::LOW_NEIGHBOR_CONFIDENCE);
    BOOST_CHECK(fused.reasoning.find("[Overridden to Undecided due to very low neighbor confidence]") != std::string::npos);

    // Already Undecided: nothing to override
    ScoreDecision undecided = FuseDecision(Tentative(FraudLabel::UNDECIDED, 0.9), Neighbors(0.1, 0.2), 0.1, ValidationReport());
    BOOST_CHECK(undecided.guardrailsApplied.empty());
    BOOST_CHECK_CLOSE(undecided.confidence, 0.9, 1e-9);
}

BOOST_AUTO_TEST_CASE(contradicted_not_fraud_is_downgraded)
{
    ScoreDecision fused = FuseDecision(Tentative(FraudLabel::NOT_FRAUD, 0.3), Neighbors(0.7, 0.6), 0.65, ValidationReport());
    BOOST_CHECK(fused.label == FraudLabel::UNDECIDED);
    // The cap never raises a confidence
    BOOST_CHECK_CLOSE(fused.confidence, 0.3, 1e-9);
    BOOST_REQUIRE_EQUAL(fused.guardrailsApplied.size(), 1u);
    BOOST_CHECK(fused.guardrailsApplied[0] == Guardrail::CONTRADICTED_NOT_FRAUD);
    BOOST_CHECK_EQUAL(GuardrailName(fused.guardrailsApplied[0]), "contradicted_not_fraud");

    ScoreDecision kept = FuseDecision(Tentative(FraudLabel::NOT_FRAUD, 0.7), Neighbors(0.7, 0.6), 0.5, ValidationReport());
    BOOST_CHECK(kept.label == FraudLabel::NOT_FRAUD);
}

BOOST_AUTO_TEST_CASE(attaches_validation_and_behavioral_score)
{
    ValidationReport validation;
    validation.overallScore = 0.66;
    validation.qualityTier = QualityTier::MEDIUM;
    ScoreDecision fused = FuseDecision(Tentative(FraudLabel::FRAUD, 1.4), Neighbors(0.9, 0.9), 1.3, validation);
    BOOST_CHECK(fused.label == FraudLabel::FRAUD);
    BOOST_CHECK_EQUAL(fused.confidence, 1.0);
    BOOST_CHECK_EQUAL(fused.behavioralScore, 1.0);
    BOOST_CHECK_CLOSE(fused.validation.overallScore, 0.66, 1e-9);
    BOOST_CHECK(fused.validation.qualityTier == QualityTier::MEDIUM);
}

BOOST_AUTO_TEST_CASE(fusion_is_idempotent_and_never_strengthens)
{
    for (int i = 0; i < 500; ++i) {
        const FraudLabel label = RandomLabel();
        const double confidence = g_test_rand_ctx.randdouble();
        const NeighborAnalysis neighbors = Neighbors(g_test_rand_ctx.randdouble(), g_test_rand_ctx.randdouble());
        const double risk = g_test_rand_ctx.randdouble();

        ScoreDecision once = FuseDecision(Tentative(label, confidence), neighbors, risk, ValidationReport());
        BOOST_CHECK(once.label == label || once.label == FraudLabel::UNDECIDED);
        BOOST_CHECK(once.confidence <= confidence + 1e-12);
        BOOST_CHECK(once.confidence >= 0.0 && once.confidence <= 1.0);

        ScoreDecision twice = FuseDecision(once, neighbors, risk, ValidationReport());
        BOOST_CHECK(twice.label == once.label);
        BOOST_CHECK_EQUAL(twice.confidence, once.confidence);
        BOOST_CHECK_EQUAL(twice.reasoning, once.reasoning);
        BOOST_CHECK_EQUAL(twice.guardrailsApplied.size(), once.guardrailsApplied.size());
    }
}

BOOST_AUTO_TEST_SUITE_END()
