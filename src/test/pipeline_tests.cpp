// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/pipeline.h>
#include <fraudscore/scoreledger.h>
#include <test/test_fraudscore.h>
#include <tinyformat.h>

#include <atomic>
#include <memory>
#include <thread>

#include <boost/test/unit_test.hpp>

using namespace fraudscore;

namespace {

/** Index answering every query with the same neighbor list */
class FixedIndex : public SimilarityIndex {
public:
    std::vector<NeighborEvidence> neighbors;
    mutable size_t lastK;

    FixedIndex() : lastK(0) {}

    std::vector<NeighborEvidence> Search(const FeatureVector& normalized, size_t k) const override
    {
        lastK = k;
        return neighbors;
    }
};

/** Publishes a replacement snapshot the first time it is searched */
class RepublishingIndex : public FixedIndex {
public:
    ReferenceRegistry* registry;
    ScalerRef nextScaler;
    std::shared_ptr<const SimilarityIndex> nextIndex;
    mutable bool published;

    RepublishingIndex() : registry(nullptr), published(false) {}

    std::vector<NeighborEvidence> Search(const FeatureVector& normalized, size_t k) const override
    {
        if (!published) {
            published = true;
            std::string error;
            registry->Publish(nextScaler, nextIndex, error);
        }
        return FixedIndex::Search(normalized, k);
    }
};

std::vector<ReferenceRecord> Population(const std::string& prefix, int flag)
{
    std::vector<ReferenceRecord> records(6);
    for (int i = 0; i < 6; ++i) {
        records[i].address = tfm::format("%s%d", prefix, i);
        records[i].flag = flag;
        records[i].raw.values[0] = i;
        records[i].raw.values[1] = 2.0 * i + (flag ? 5.0 : 0.0);
    }
    return records;
}

class StaticSource : public ActivitySource {
public:
    bool fail;
    AccountActivity activity;

    StaticSource() : fail(false) {}

    bool FetchActivity(const std::string& reference, AccountActivity& out, std::string& error) override
    {
        if (fail) {
            error = "source offline";
            return false;
        }
        out = activity;
        return true;
    }
};

const char* const FRAUD_ANSWER = "{\"final_decision\": \"Fraud\", \"reasoning\": \"funnel\", \"confidence\": 0.8}";
const char* const UNDECIDED_ANSWER = "{\"final_decision\": \"Undecided\", \"confidence\": 0.3}";

struct PipelineTestingSetup : public BasicTestingSetup {
    ReferenceRegistry references;
    std::shared_ptr<FixedIndex> index;
    std::shared_ptr<ScriptedOracle> oracle;
    InMemoryScoreLedger ledger;
    FraudScoreConfig config;
    AccountActivity activity;

    PipelineTestingSetup() : index(std::make_shared<FixedIndex>()), oracle(std::make_shared<ScriptedOracle>()), ledger(0.1)
    {
        config.oracle.retryBackoffMs = 0;

        std::vector<FeatureVector> batch(2);
        batch[1].values[0] = 1.0;
        std::string error;
        BOOST_REQUIRE(references.Publish(FitScaler(batch, 1), index, error));

        // Five identical fraud templates right next to the query
        for (int i = 0; i < 5; ++i) {
            index->neighbors.emplace_back(tfm::format("0xfraud%d", i), 1, 0.01);
        }

        activity.sent.push_back(SentTransfer(1.5, "0xa", 1700000000));
        activity.received.push_back(ReceivedTransfer(2.0, "0xb", 1699990000));
        activity.balance = 0.5;
    }

    ScoreResult Run(const CancellationToken& cancel = CancellationToken())
    {
        ReasoningAdapter adapter(oracle, config.oracle);
        ScoringPipeline pipeline(references, adapter, &ledger, config);
        return pipeline.Score("0xsubject", activity, cancel);
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(pipeline_tests, PipelineTestingSetup)

BOOST_AUTO_TEST_CASE(fraud_outcome_is_persisted)
{
    oracle->Push(OracleCallStatus::OK, FRAUD_ANSWER);
    ScoreResult result = Run();

    BOOST_CHECK(result.status == ScoreStatus::OK);
    BOOST_CHECK(result.decision.label == FraudLabel::FRAUD);
    BOOST_CHECK_CLOSE(result.decision.confidence, 0.8, 1e-9);
    BOOST_CHECK(!result.usedFallback);
    BOOST_CHECK_EQUAL(result.oracleAttempts, 1);
    BOOST_CHECK_EQUAL(result.scalerVersion, 1u);
    BOOST_CHECK(result.neighborLabel == FraudLabel::FRAUD);
    BOOST_CHECK_EQUAL(result.neighbors.totalCount, 5);
    BOOST_CHECK(!result.features.empty());
    BOOST_CHECK_EQUAL(index->lastK, config.k);

    BOOST_CHECK(result.ledgerUpdated);
    LedgerEntry entry;
    BOOST_REQUIRE(ledger.GetEntry("0xsubject", entry));
    BOOST_CHECK_CLOSE(entry.score, 0.08, 1e-9);
    BOOST_CHECK(entry.lastWasFraud);
}

BOOST_AUTO_TEST_CASE(undecided_outcome_is_not_persisted)
{
    oracle->Push(OracleCallStatus::OK, UNDECIDED_ANSWER);
    ScoreResult result = Run();

    BOOST_CHECK(result.status == ScoreStatus::OK);
    BOOST_CHECK(result.decision.label == FraudLabel::UNDECIDED);
    BOOST_CHECK(!result.ledgerUpdated);
    BOOST_CHECK_EQUAL(ledger.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(malformed_oracle_answer_uses_fallback)
{
    oracle->Push(OracleCallStatus::OK, "Looks suspicious to me, but who knows.");
    ScoreResult result = Run();

    BOOST_CHECK(result.status == ScoreStatus::OK);
    BOOST_CHECK(result.usedFallback);
    BOOST_CHECK_EQUAL(result.oracleAttempts, 1);
    BOOST_CHECK_EQUAL(oracle->Calls(), 1u);
    BOOST_CHECK(result.decision.reasoning.find("[Fallback decision based on") != std::string::npos);
    BOOST_CHECK(result.decision.confidence >= 0.0 && result.decision.confidence <= 1.0);
}

BOOST_AUTO_TEST_CASE(no_scaler_means_no_evidence)
{
    ReferenceRegistry empty;
    ReasoningAdapter adapter(oracle, config.oracle);
    ScoringPipeline pipeline(empty, adapter, &ledger, config);
    ScoreResult result = pipeline.Score("0xsubject", activity);

    BOOST_CHECK(result.status == ScoreStatus::EVIDENCE_UNAVAILABLE);
    BOOST_CHECK_EQUAL(result.message, "no fitted scaler; load a reference population first");
    BOOST_CHECK(result.decision.label != FraudLabel::NOT_FRAUD);
    BOOST_CHECK_EQUAL(oracle->Calls(), 0u);
    BOOST_CHECK_EQUAL(ledger.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(no_neighbors_means_no_evidence)
{
    index->neighbors.clear();
    oracle->Push(OracleCallStatus::OK, FRAUD_ANSWER);
    ScoreResult result = Run();

    BOOST_CHECK(result.status == ScoreStatus::EVIDENCE_UNAVAILABLE);
    BOOST_CHECK_EQUAL(result.message, "similarity index returned no neighbors");
    BOOST_CHECK(result.decision.label != FraudLabel::NOT_FRAUD);
    BOOST_CHECK_EQUAL(oracle->Calls(), 0u);
    BOOST_CHECK_EQUAL(ledger.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(neighbors_sorted_and_truncated)
{
    index->neighbors.clear();
    const double distances[] = {0.9, 0.1, 0.5, 0.3, 0.7, 0.2, 0.8, 0.4};
    for (int i = 0; i < 8; ++i) {
        index->neighbors.emplace_back(tfm::format("0x%d", i), i % 2, distances[i]);
    }
    config.k = 6;
    oracle->Push(OracleCallStatus::OK, UNDECIDED_ANSWER);
    ScoreResult result = Run();

    BOOST_CHECK(result.status == ScoreStatus::OK);
    BOOST_CHECK_EQUAL(result.neighbors.totalCount, 6);
    BOOST_REQUIRE_EQUAL(result.topNeighbors.size(), TOP_NEIGHBORS_REPORTED);
    BOOST_CHECK_EQUAL(result.topNeighbors[0].address, "0x1");
    BOOST_CHECK_EQUAL(result.topNeighbors[1].address, "0x5");
    for (size_t i = 1; i < result.topNeighbors.size(); ++i) {
        BOOST_CHECK(result.topNeighbors[i - 1].distance <= result.topNeighbors[i].distance);
    }
}

BOOST_AUTO_TEST_CASE(cancelled_before_scoring)
{
    oracle->Push(OracleCallStatus::OK, FRAUD_ANSWER);
    CancellationToken cancel;
    cancel.Cancel();
    ScoreResult result = Run(cancel);

    BOOST_CHECK(result.status == ScoreStatus::CANCELLED);
    BOOST_CHECK_EQUAL(result.message, "cancelled before scoring");
    BOOST_CHECK_EQUAL(oracle->Calls(), 0u);
    BOOST_CHECK_EQUAL(ledger.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(cancelled_during_reasoning)
{
    oracle->Push(OracleCallStatus::OK, FRAUD_ANSWER);
    oracle->cancelDuringCall = true;
    ScoreResult result = Run(oracle->cancelOnCall);

    BOOST_CHECK(result.status == ScoreStatus::CANCELLED);
    BOOST_CHECK_EQUAL(result.message, "cancelled during reasoning");
    BOOST_CHECK_EQUAL(oracle->Calls(), 1u);
    BOOST_CHECK(!result.ledgerUpdated);
    BOOST_CHECK_EQUAL(ledger.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(scoring_through_activity_source)
{
    ReasoningAdapter adapter(oracle, config.oracle);
    ScoringPipeline pipeline(references, adapter, nullptr, config);

    StaticSource source;
    source.activity = activity;
    ScoreResult result;
    std::string error;
    BOOST_CHECK(pipeline.Score(source, "0xsubject", CancellationToken(), result, error));
    BOOST_CHECK(result.status == ScoreStatus::OK);
    BOOST_CHECK_EQUAL(result.reference, "0xsubject");
    // No ledger attached
    BOOST_CHECK(!result.ledgerUpdated);

    source.fail = true;
    BOOST_CHECK(!pipeline.Score(source, "0xsubject", CancellationToken(), result, error));
    BOOST_CHECK_EQUAL(error, "source offline");
}

BOOST_AUTO_TEST_CASE(ledger_moves_by_confidence_step)
{
    InMemoryScoreLedger book(0.1);
    std::string error;
    LedgerEntry entry;

    BOOST_CHECK(book.RecordOutcome(LedgerUpdate("0xabc", true, 0.8), error));
    BOOST_REQUIRE(book.GetEntry("0xabc", entry));
    BOOST_CHECK_CLOSE(entry.score, 0.08, 1e-9);

    BOOST_CHECK(book.RecordOutcome(LedgerUpdate("0xabc", true, 1.0), error));
    BOOST_REQUIRE(book.GetEntry("0xabc", entry));
    BOOST_CHECK_CLOSE(entry.score, 0.18, 1e-9);

    BOOST_CHECK(book.RecordOutcome(LedgerUpdate("0xabc", false, 1.0), error));
    BOOST_REQUIRE(book.GetEntry("0xabc", entry));
    BOOST_CHECK_CLOSE(entry.score, 0.08, 1e-9);

    BOOST_CHECK(book.RecordOutcome(LedgerUpdate("0xabc", false, 1.0), error));
    BOOST_REQUIRE(book.GetEntry("0xabc", entry));
    BOOST_CHECK_EQUAL(entry.score, 0.0);
    BOOST_CHECK_EQUAL(entry.fraudUpdates, 2u);
    BOOST_CHECK_EQUAL(entry.notFraudUpdates, 2u);
    BOOST_CHECK(!entry.lastWasFraud);

    BOOST_CHECK(!book.RecordOutcome(LedgerUpdate("", true, 1.0), error));
    BOOST_CHECK_EQUAL(error, "empty reference");
    BOOST_CHECK_EQUAL(book.Size(), 1u);
    BOOST_CHECK(!book.GetEntry("0xother", entry));
}

BOOST_AUTO_TEST_CASE(rebuild_during_request_keeps_captured_snapshot)
{
    std::vector<FeatureVector> batch(2);
    batch[1].values[0] = 1.0;

    std::shared_ptr<FixedIndex> replacement = std::make_shared<FixedIndex>();
    for (int i = 0; i < 5; ++i) {
        replacement->neighbors.emplace_back(tfm::format("0xlegit%d", i), 0, 0.01);
    }

    ReferenceRegistry local;
    std::shared_ptr<RepublishingIndex> first = std::make_shared<RepublishingIndex>();
    first->neighbors = index->neighbors;
    first->registry = &local;
    first->nextScaler = FitScaler(batch, 2);
    first->nextIndex = replacement;
    std::string error;
    BOOST_REQUIRE(local.Publish(FitScaler(batch, 1), first, error));

    oracle->Push(OracleCallStatus::OK, UNDECIDED_ANSWER);
    oracle->Push(OracleCallStatus::OK, UNDECIDED_ANSWER);
    ReasoningAdapter adapter(oracle, config.oracle);
    ScoringPipeline pipeline(local, adapter, nullptr, config);

    // The rebuild lands while the first request is searching
    ScoreResult during = pipeline.Score("0xsubject", activity);
    BOOST_CHECK(during.status == ScoreStatus::OK);
    BOOST_CHECK_EQUAL(during.scalerVersion, 1u);
    BOOST_CHECK(during.neighborLabel == FraudLabel::FRAUD);
    BOOST_REQUIRE(!during.topNeighbors.empty());
    BOOST_CHECK_EQUAL(during.topNeighbors[0].address, "0xfraud0");
    BOOST_CHECK_EQUAL(local.CurrentVersion(), 2u);

    ScoreResult after = pipeline.Score("0xsubject", activity);
    BOOST_CHECK(after.status == ScoreStatus::OK);
    BOOST_CHECK_EQUAL(after.scalerVersion, 2u);
    BOOST_CHECK(after.neighborLabel == FraudLabel::NOT_FRAUD);
    BOOST_REQUIRE(!after.topNeighbors.empty());
    BOOST_CHECK_EQUAL(after.topNeighbors[0].address, "0xlegit0");
}

BOOST_AUTO_TEST_CASE(concurrent_rebuilds_never_mix_populations)
{
    // Odd versions hold the legitimate population, even ones the fraud one
    const std::vector<ReferenceRecord> legit = Population("0xlegit", 0);
    const std::vector<ReferenceRecord> fraud = Population("0xfraud", 1);

    ScalerRegistry scalers;
    ReferenceRegistry local;
    std::string error;
    BOOST_REQUIRE(BuildReferenceIndex(legit, scalers, local, error));

    std::atomic<bool> done(false);
    std::atomic<int> rebuildFailures(0);
    std::thread writer([&]() {
        std::string writerError;
        for (int i = 0; i < 60; ++i) {
            if (!BuildReferenceIndex(i % 2 == 0 ? fraud : legit, scalers, local, writerError)) {
                ++rebuildFailures;
            }
        }
        done = true;
    });

    ReasoningAdapter adapter(nullptr, config.oracle);
    ScoringPipeline pipeline(local, adapter, nullptr, config);
    int scored = 0;
    int unavailable = 0;
    int mixed = 0;
    for (int attempt = 0; attempt < 100000 && (!done || scored < 50); ++attempt) {
        ScoreResult result = pipeline.Score("0xsubject", activity);
        if (result.status != ScoreStatus::OK) {
            ++unavailable;
            continue;
        }
        ++scored;
        const std::string expected = result.scalerVersion % 2 == 1 ? "0xlegit" : "0xfraud";
        if (result.neighbors.totalCount != 6) ++mixed;
        for (const NeighborEvidence& n : result.topNeighbors) {
            if (n.address.compare(0, expected.size(), expected) != 0) ++mixed;
        }
    }
    writer.join();

    BOOST_CHECK_EQUAL(rebuildFailures.load(), 0);
    BOOST_CHECK_EQUAL(unavailable, 0);
    BOOST_CHECK_EQUAL(mixed, 0);
    BOOST_CHECK_EQUAL(local.CurrentVersion(), 61u);
}

BOOST_AUTO_TEST_CASE(stage_and_status_names)
{
    BOOST_CHECK_EQUAL(PipelineStageName(PipelineStage::VALIDATE), "VALIDATE");
    BOOST_CHECK_EQUAL(ScoreStatusName(ScoreStatus::EVIDENCE_UNAVAILABLE), "evidence_unavailable");
}

BOOST_AUTO_TEST_SUITE_END()
