// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/activity.h>
#include <fraudscore/output.h>
#include <fraudscore/reference.h>
#include <test/test_fraudscore.h>

#include <univalue.h>

#include <memory>
#include <sstream>

#include <boost/test/unit_test.hpp>

using namespace fraudscore;

namespace {

const size_t IDX_SENT_TNX = 3;
const size_t IDX_RECEIVED_TNX = 4;
const size_t IDX_BALANCE = 21;
const size_t IDX_TOKEN_TNXS = 22;

const char* const REFERENCE_CSV =
    "\xEF\xBB\xBFIndex,Address,FLAG,Sent tnx,\"Received Tnx\", Total ERC20 tnxs,total ether balance,unknown\n"
    "1,0xaaa,1,10,abc,,\"2.5\",zzz\n"
    "2,0xbbb,0,3,4,7,0.5,x\n"
    "\n"
    "3,,1,1,1,1,1,x\n"
    "4,0xccc\n";

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(json_reference_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(activity_json_variants)
{
    const std::string text =
        "{\"address\": \"0xSubject\", \"balance\": \"2.5\","
        " \"sent\": ["
        "  {\"category\": \"erc20\", \"value\": \"1.5\", \"to\": \"0xA\", \"timestamp\": \"2024-01-01T00:00:00Z\","
        "   \"rawContract\": {\"address\": \"0xTok\"}},"
        "  {\"value\": -3, \"counterparty\": \"0xB\", \"metadata\": {\"blockTimestamp\": \"1704067260\"}},"
        "  {\"category\": \"weird\", \"value\": 2},"
        "  5],"
        " \"received_transfers\": [{\"from\": \"0xC\", \"value\": 0.25, \"timestamp\": 1704067300}]}";

    AccountActivity activity;
    std::string address;
    std::string error;
    BOOST_REQUIRE(ParseActivityJSON(text, activity, address, error));
    BOOST_CHECK_EQUAL(address, "0xSubject");
    BOOST_CHECK_CLOSE(activity.balance, 2.5, 1e-9);

    BOOST_REQUIRE_EQUAL(activity.sent.size(), 3u);
    BOOST_CHECK(activity.sent[0].category == TransferCategory::FUNGIBLE_TOKEN);
    BOOST_CHECK_CLOSE(activity.sent[0].value, 1.5, 1e-9);
    BOOST_CHECK_EQUAL(activity.sent[0].counterparty, "0xA");
    BOOST_CHECK_EQUAL(activity.sent[0].timestamp, 1704067200);
    BOOST_CHECK_EQUAL(activity.sent[0].tokenContract, "0xTok");

    BOOST_CHECK_EQUAL(activity.sent[1].value, 0.0);
    BOOST_CHECK_EQUAL(activity.sent[1].counterparty, "0xB");
    BOOST_CHECK_EQUAL(activity.sent[1].timestamp, 1704067260);

    BOOST_CHECK(activity.sent[2].category == TransferCategory::EXTERNAL);
    BOOST_CHECK_EQUAL(activity.sent[2].timestamp, 0);
    BOOST_CHECK(!activity.sent[2].HasTimestamp());

    BOOST_REQUIRE_EQUAL(activity.received.size(), 1u);
    BOOST_CHECK(activity.received[0].direction == TransferDirection::RECEIVED);
    BOOST_CHECK_EQUAL(activity.received[0].counterparty, "0xC");
    BOOST_CHECK_EQUAL(activity.received[0].timestamp, 1704067300);
}

BOOST_AUTO_TEST_CASE(activity_json_rejects)
{
    AccountActivity activity;
    std::string address;
    std::string error;
    BOOST_CHECK(!ParseActivityJSON("sent: nothing", activity, address, error));
    BOOST_CHECK_EQUAL(error, "activity is not valid JSON");
    BOOST_CHECK(!ParseActivityJSON("[1, 2]", activity, address, error));
    BOOST_CHECK_EQUAL(error, "activity must be a JSON object");

    // An account without history is valid
    BOOST_CHECK(ParseActivityJSON("{}", activity, address, error));
    BOOST_CHECK(activity.sent.empty());
    BOOST_CHECK(activity.received.empty());
    BOOST_CHECK(address.empty());
}

BOOST_AUTO_TEST_CASE(reference_csv)
{
    std::istringstream in(REFERENCE_CSV);
    std::vector<ReferenceRecord> records;
    std::string error;
    BOOST_REQUIRE(ParseReferenceCSV(in, records, error));
    BOOST_REQUIRE_EQUAL(records.size(), 2u);

    BOOST_CHECK_EQUAL(records[0].address, "0xaaa");
    BOOST_CHECK_EQUAL(records[0].flag, 1);
    BOOST_CHECK_EQUAL(records[0].raw.values.size(), FEATURE_COUNT);
    BOOST_CHECK_EQUAL(records[0].raw.values[IDX_SENT_TNX], 10.0);
    BOOST_CHECK_EQUAL(records[0].raw.values[IDX_RECEIVED_TNX], 0.0);
    BOOST_CHECK_EQUAL(records[0].raw.values[IDX_TOKEN_TNXS], 0.0);
    BOOST_CHECK_CLOSE(records[0].raw.values[IDX_BALANCE], 2.5, 1e-9);
    BOOST_CHECK(!records[0].raw.IsNormalized());

    BOOST_CHECK_EQUAL(records[1].flag, 0);
    BOOST_CHECK_EQUAL(records[1].raw.values[IDX_RECEIVED_TNX], 4.0);
    BOOST_CHECK_EQUAL(records[1].raw.values[IDX_TOKEN_TNXS], 7.0);
}

BOOST_AUTO_TEST_CASE(reference_csv_header_rules)
{
    std::vector<ReferenceRecord> records;
    std::string error;

    std::istringstream relaxed("address , flag,SENT TNX\n0x1,1,4\n");
    BOOST_REQUIRE(ParseReferenceCSV(relaxed, records, error));
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].raw.values[IDX_SENT_TNX], 4.0);

    std::istringstream noFlag("Address,Sent tnx\n0x1,4\n");
    BOOST_CHECK(!ParseReferenceCSV(noFlag, records, error));
    BOOST_CHECK_EQUAL(error, "reference CSV header needs Address and FLAG columns");

    std::istringstream empty("");
    BOOST_CHECK(!ParseReferenceCSV(empty, records, error));
    BOOST_CHECK_EQUAL(error, "reference CSV is empty");
}

BOOST_AUTO_TEST_CASE(reference_json)
{
    const std::string text =
        "[{\"address\": \"0x1\", \"flag\": true, \"features\": {\"Sent tnx\": 5, \"total ether balance\": \"1.25\"}},"
        " {\"address\": \"0x2\", \"flag\": \"0\", \"activity\": {\"sent\": [{\"value\": 1, \"to\": \"0xa\", \"timestamp\": 100}], \"balance\": 3}},"
        " {\"flag\": 1},"
        " 7]";
    std::vector<ReferenceRecord> records;
    std::string error;
    BOOST_REQUIRE(ParseReferenceJSON(text, records, error));
    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(records[0].flag, 1);
    BOOST_CHECK_EQUAL(records[0].raw.values[IDX_SENT_TNX], 5.0);
    BOOST_CHECK_CLOSE(records[0].raw.values[IDX_BALANCE], 1.25, 1e-9);
    BOOST_CHECK_EQUAL(records[1].flag, 0);
    BOOST_CHECK_EQUAL(records[1].raw.values[IDX_SENT_TNX], 1.0);
    BOOST_CHECK_EQUAL(records[1].raw.values[IDX_BALANCE], 3.0);

    BOOST_CHECK(!ParseReferenceJSON("[{\"address\": \"0x3\"}]", records, error));
    BOOST_CHECK_EQUAL(error, "reference entry 0x3 has neither features nor activity");
    BOOST_CHECK(!ParseReferenceJSON("{}", records, error));
    BOOST_CHECK_EQUAL(error, "reference JSON must be an array");
}

BOOST_AUTO_TEST_CASE(load_reference_by_extension)
{
    std::vector<ReferenceRecord> records;
    std::string error;

    TempFile csv(".csv", REFERENCE_CSV);
    BOOST_CHECK(LoadReference(csv.Path(), records, error));
    BOOST_CHECK_EQUAL(records.size(), 2u);

    TempFile json(".JSON", "[{\"address\": \"0x9\", \"flag\": 1, \"features\": {}}]");
    BOOST_CHECK(LoadReference(json.Path(), records, error));
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].address, "0x9");

    BOOST_CHECK(!LoadReference("/nonexistent/reference.csv", records, error));
    BOOST_CHECK_EQUAL(error, "cannot open /nonexistent/reference.csv");
}

BOOST_AUTO_TEST_CASE(build_reference_index)
{
    std::istringstream in(REFERENCE_CSV);
    std::vector<ReferenceRecord> records;
    std::string error;
    BOOST_REQUIRE(ParseReferenceCSV(in, records, error));

    ScalerRegistry scalers;
    ReferenceRegistry references;
    BOOST_CHECK(references.Current() == nullptr);
    BOOST_REQUIRE(BuildReferenceIndex(records, scalers, references, error));
    BOOST_CHECK_EQUAL(scalers.CurrentVersion(), 1u);
    BOOST_CHECK_EQUAL(references.CurrentVersion(), 1u);

    ReferenceSnapshotRef first = references.Current();
    BOOST_REQUIRE(first != nullptr);
    BOOST_CHECK_EQUAL(first->scaler->GetVersion(), 1u);

    // Each entry is its own nearest neighbor
    FeatureVector query = Normalize(*first->scaler, records[1].raw);
    std::vector<NeighborEvidence> found = first->index->Search(query, 1);
    BOOST_REQUIRE_EQUAL(found.size(), 1u);
    BOOST_CHECK_EQUAL(found[0].address, "0xbbb");
    BOOST_CHECK_SMALL(found[0].distance, 1e-9);

    // Rebuilding publishes a new snapshot; the captured one stays usable
    BOOST_REQUIRE(BuildReferenceIndex(records, scalers, references, error));
    ReferenceSnapshotRef second = references.Current();
    BOOST_CHECK_EQUAL(second->GetVersion(), 2u);
    BOOST_CHECK(second->index != first->index);
    BOOST_CHECK_EQUAL(first->index->Search(query, 5).size(), 2u);

    // A query normalized by the old scaler finds nothing in the new index
    BOOST_CHECK(second->index->Search(query, 5).empty());
    FeatureVector current = Normalize(*second->scaler, records[1].raw);
    BOOST_CHECK_EQUAL(second->index->Search(current, 5).size(), 2u);

    BOOST_CHECK(!BuildReferenceIndex(std::vector<ReferenceRecord>(), scalers, references, error));
    BOOST_CHECK_EQUAL(error, "reference population is empty");
    BOOST_CHECK_EQUAL(references.CurrentVersion(), 2u);
}

BOOST_AUTO_TEST_CASE(reference_registry_publish_rules)
{
    std::vector<FeatureVector> batch(2);
    batch[1].values[0] = 1.0;
    std::shared_ptr<InMemorySimilarityIndex> index = std::make_shared<InMemorySimilarityIndex>();

    ReferenceRegistry references;
    std::string error;
    BOOST_CHECK(!references.Publish(nullptr, index, error));
    BOOST_CHECK_EQUAL(error, "reference snapshot needs a scaler and an index");
    BOOST_CHECK(!references.Publish(FitScaler(batch, 1), nullptr, error));

    BOOST_CHECK(references.Publish(FitScaler(batch, 3), index, error));
    BOOST_CHECK(!references.Publish(FitScaler(batch, 3), index, error));
    BOOST_CHECK_EQUAL(error, "scaler version 3 is not newer than published version 3");
    BOOST_CHECK(!references.Publish(FitScaler(batch, 2), index, error));
    BOOST_CHECK_EQUAL(references.CurrentVersion(), 3u);
    BOOST_CHECK(references.Publish(FitScaler(batch, 4), index, error));
    BOOST_CHECK_EQUAL(references.CurrentVersion(), 4u);
}

BOOST_AUTO_TEST_CASE(json_file_activity_source)
{
    AccountActivity activity;
    std::string error;

    TempFile single(".json", "{\"address\": \"0xAbC\", \"balance\": 4, \"sent\": []}");
    JSONFileActivitySource singleSource(single.Path());
    BOOST_CHECK(singleSource.FetchActivity("0xabc", activity, error));
    BOOST_CHECK_EQUAL(activity.balance, 4.0);
    BOOST_CHECK(singleSource.FetchActivity("", activity, error));
    BOOST_CHECK(!singleSource.FetchActivity("0xdef", activity, error));
    BOOST_CHECK(error.find("not 0xdef") != std::string::npos);

    TempFile many(".json", "[{\"address\": \"0x1\", \"balance\": 1}, {\"address\": \"0x2\", \"balance\": 2}]");
    JSONFileActivitySource manySource(many.Path());
    BOOST_CHECK(manySource.FetchActivity("0X2", activity, error));
    BOOST_CHECK_EQUAL(activity.balance, 2.0);
    BOOST_CHECK(!manySource.FetchActivity("0x3", activity, error));
    BOOST_CHECK_EQUAL(error, "no activity for 0x3 in " + many.Path());

    TempFile broken(".json", "{\"address\": ");
    JSONFileActivitySource brokenSource(broken.Path());
    BOOST_CHECK(!brokenSource.FetchActivity("0x1", activity, error));
    BOOST_CHECK_EQUAL(error, broken.Path() + " is not valid JSON");

    JSONFileActivitySource missing("/nonexistent/activity.json");
    BOOST_CHECK(!missing.FetchActivity("0x1", activity, error));
    BOOST_CHECK_EQUAL(error, "cannot open /nonexistent/activity.json");
}

BOOST_AUTO_TEST_CASE(score_result_json)
{
    ScoreResult result;
    result.status = ScoreStatus::OK;
    result.reference = "0xabc";
    result.decision.label = FraudLabel::FRAUD;
    result.decision.confidence = 0.8;
    result.decision.riskFactors.push_back("mixer_value_pattern");
    result.decision.guardrailsApplied.push_back(Guardrail::UNSUPPORTED_FRAUD);
    result.neighbors.totalCount = 2;
    result.neighbors.fraudCount = 1;
    result.neighborLabel = FraudLabel::UNDECIDED;
    result.topNeighbors.emplace_back("0xn", 1, 0.25);
    result.features[FEATURE_SENT_TNX] = 3;
    result.scalerVersion = 4;
    result.usedFallback = true;
    result.fallbackReason = "no oracle configured";

    UniValue json = ScoreResultToJSON(result);
    BOOST_CHECK_EQUAL(json["address"].get_str(), "0xabc");
    BOOST_CHECK_EQUAL(json["status"].get_str(), "ok");
    BOOST_CHECK(json["message"].isNull());
    BOOST_CHECK_EQUAL(json["final_decision"].get_str(), "Fraud");
    BOOST_CHECK_CLOSE(json["confidence"].get_real(), 0.8, 1e-9);
    BOOST_CHECK_EQUAL(json["risk_factors"][0].get_str(), "mixer_value_pattern");
    BOOST_CHECK_EQUAL(json["guardrails"][0].get_str(), "unsupported_fraud");
    BOOST_CHECK(json["validation"].isObject());
    BOOST_CHECK_EQUAL(json["features"]["Sent tnx"].get_real(), 3.0);
    BOOST_REQUIRE_EQUAL(json["top_neighbors"].size(), 1u);
    BOOST_CHECK_EQUAL(json["top_neighbors"][0]["flag"].get_int(), 1);
    BOOST_CHECK_EQUAL(json["neighbor_analysis"]["label"].get_str(), "Undecided");
    BOOST_CHECK(json["patterns"]["behavioral_flags"]["patterns"].isArray());
    BOOST_CHECK_EQUAL(json["scaler_version"].get_int(), 4);
    BOOST_CHECK_EQUAL(json["fallback_reason"].get_str(), "no oracle configured");
    BOOST_CHECK(!json["ledger_updated"].get_bool());
}

BOOST_AUTO_TEST_CASE(unavailable_result_json)
{
    ScoreResult result;
    result.status = ScoreStatus::EVIDENCE_UNAVAILABLE;
    result.reference = "0xabc";
    result.message = "similarity index returned no neighbors";

    UniValue json = ScoreResultToJSON(result);
    BOOST_CHECK_EQUAL(json["status"].get_str(), "evidence_unavailable");
    BOOST_CHECK_EQUAL(json["message"].get_str(), "similarity index returned no neighbors");
    BOOST_CHECK(json["final_decision"].isNull());
    BOOST_CHECK(json["neighbor_analysis"].isNull());
    BOOST_CHECK(json["fallback_reason"].isNull());
    BOOST_CHECK_EQUAL(json["top_neighbors"].size(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
