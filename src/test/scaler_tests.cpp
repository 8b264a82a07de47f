// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/scaler.h>
#include <test/test_fraudscore.h>

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

using namespace fraudscore;

namespace {

FastRandomContext g_test_rand_ctx(true);

FeatureVector VectorWithFirst(double first)
{
    FeatureVector vec;
    vec.values[0] = first;
    return vec;
}

std::vector<FeatureVector> RandomBatch(size_t size)
{
    std::vector<FeatureVector> batch(size);
    for (FeatureVector& vec : batch) {
        for (size_t d = 0; d < vec.values.size(); ++d) {
            vec.values[d] = g_test_rand_ctx.randdouble() * (d + 1) * 10;
        }
    }
    return batch;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(scaler_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(fit_and_normalize)
{
    std::vector<FeatureVector> batch = {VectorWithFirst(1), VectorWithFirst(2), VectorWithFirst(3)};
    ScalerRef scaler = FitScaler(batch, 7);
    BOOST_REQUIRE(scaler);
    BOOST_CHECK_EQUAL(scaler->GetVersion(), 7u);
    BOOST_CHECK_EQUAL(scaler->GetBatchSize(), 3u);
    BOOST_CHECK_EQUAL(scaler->GetDimensions(), FEATURE_COUNT);
    BOOST_CHECK_CLOSE(scaler->GetMeans()[0], 2.0, 1e-9);
    BOOST_CHECK_CLOSE(scaler->GetStdDevs()[0], std::sqrt(2.0 / 3.0), 1e-9);

    FeatureVector normalized = Normalize(*scaler, VectorWithFirst(3));
    BOOST_CHECK(normalized.IsNormalized());
    BOOST_CHECK_EQUAL(normalized.scalerVersion, 7u);
    BOOST_CHECK_CLOSE(normalized.values[0], 1.0 / std::sqrt(2.0 / 3.0), 1e-9);
    // Constant dimensions normalize to 0, not NaN
    for (size_t d = 1; d < normalized.values.size(); ++d) {
        BOOST_CHECK_EQUAL(normalized.values[d], 0.0);
    }
}

BOOST_AUTO_TEST_CASE(normalized_batch_is_centered)
{
    std::vector<FeatureVector> batch = RandomBatch(40);
    ScalerRef scaler = FitScaler(batch, 1);
    BOOST_REQUIRE(scaler);

    std::vector<double> sums(FEATURE_COUNT, 0.0);
    for (const FeatureVector& vec : batch) {
        FeatureVector normalized = Normalize(*scaler, vec);
        for (size_t d = 0; d < FEATURE_COUNT; ++d) {
            sums[d] += normalized.values[d];
        }
    }
    for (size_t d = 0; d < FEATURE_COUNT; ++d) {
        BOOST_CHECK_SMALL(sums[d] / batch.size(), 1e-9);
    }
}

BOOST_AUTO_TEST_CASE(non_finite_values_sanitized)
{
    std::vector<FeatureVector> batch = {VectorWithFirst(1), VectorWithFirst(std::numeric_limits<double>::quiet_NaN()), VectorWithFirst(3)};
    ScalerRef scaler = FitScaler(batch, 1);
    BOOST_REQUIRE(scaler);
    BOOST_CHECK(std::isfinite(scaler->GetMeans()[0]));
    BOOST_CHECK_CLOSE(scaler->GetMeans()[0], 4.0 / 3.0, 1e-9);

    FeatureVector normalized = Normalize(*scaler, VectorWithFirst(std::numeric_limits<double>::infinity()));
    for (double v : normalized.values) {
        BOOST_CHECK(std::isfinite(v));
    }
}

BOOST_AUTO_TEST_CASE(empty_and_ragged_batches_rejected)
{
    BOOST_CHECK(!FitScaler(std::vector<FeatureVector>(), 1));

    std::vector<FeatureVector> ragged = {VectorWithFirst(1), VectorWithFirst(2)};
    ragged[1].values.pop_back();
    BOOST_CHECK(!FitScaler(ragged, 1));

    ScalerRegistry registry;
    BOOST_CHECK(!registry.Fit(ragged));
    BOOST_CHECK(!registry.Current());
    BOOST_CHECK_EQUAL(registry.CurrentVersion(), 0u);
}

BOOST_AUTO_TEST_CASE(registry_publishes_new_versions)
{
    ScalerRegistry registry;
    BOOST_CHECK(!registry.Current());

    ScalerRef first = registry.Fit(RandomBatch(5));
    BOOST_REQUIRE(first);
    BOOST_CHECK_EQUAL(first->GetVersion(), 1u);
    BOOST_CHECK_EQUAL(registry.CurrentVersion(), 1u);

    // A captured snapshot keeps its statistics after a refit
    const std::vector<double> firstMeans = first->GetMeans();
    ScalerRef second = registry.Fit(RandomBatch(5));
    BOOST_REQUIRE(second);
    BOOST_CHECK_EQUAL(second->GetVersion(), 2u);
    BOOST_CHECK_EQUAL(registry.Current()->GetVersion(), 2u);
    BOOST_CHECK_EQUAL(first->GetVersion(), 1u);
    BOOST_CHECK(first->GetMeans() == firstMeans);

    BOOST_CHECK(!registry.Publish(nullptr));
    BOOST_CHECK(!registry.Publish(FitScaler(RandomBatch(3), 2)));
    BOOST_CHECK(!registry.Publish(FitScaler(RandomBatch(3), 1)));
    BOOST_CHECK(registry.Publish(FitScaler(RandomBatch(3), 5)));
    BOOST_CHECK_EQUAL(registry.CurrentVersion(), 5u);

    ScalerRef next = registry.Fit(RandomBatch(3));
    BOOST_REQUIRE(next);
    BOOST_CHECK_EQUAL(next->GetVersion(), 6u);
}

BOOST_AUTO_TEST_CASE(readers_never_see_versions_go_backwards)
{
    ScalerRegistry registry;
    BOOST_REQUIRE(registry.Fit(RandomBatch(4)));

    std::vector<std::vector<FeatureVector>> batches;
    for (int i = 0; i < 20; ++i) {
        batches.push_back(RandomBatch(4));
    }

    std::atomic<bool> done(false);
    std::atomic<int> regressions(0);
    std::atomic<int> reads(0);
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            uint32_t last = 0;
            while (!done.load()) {
                ScalerRef current = registry.Current();
                if (!current) {
                    ++regressions;
                    continue;
                }
                if (current->GetVersion() < last) ++regressions;
                last = current->GetVersion();
                FeatureVector normalized = Normalize(*current, VectorWithFirst(1));
                if (normalized.scalerVersion != current->GetVersion()) ++regressions;
                ++reads;
            }
        });
    }

    for (const auto& batch : batches) {
        BOOST_CHECK(registry.Fit(batch));
    }
    done = true;
    for (std::thread& reader : readers) {
        reader.join();
    }

    BOOST_CHECK_EQUAL(regressions.load(), 0);
    BOOST_CHECK_EQUAL(registry.CurrentVersion(), 21u);
}

BOOST_AUTO_TEST_SUITE_END()
