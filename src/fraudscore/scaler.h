// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_SCALER_H
#define FRAUDSCORE_SCALER_H

#include <fraudscore/features.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace fraudscore {

/** Standard deviations below this are treated as zero */
static const double SCALER_MIN_STDDEV = 1e-12;

/**
 * Scaler
 *
 * Frozen per-dimension (mean, stddev) statistics of a reference batch.
 * Never mutated after construction; refitting produces a new instance with
 * a higher version.
 */
class Scaler {
public:
    Scaler(uint32_t version, std::vector<double> means, std::vector<double> stddevs, size_t batchSize);

    uint32_t GetVersion() const { return m_version; }
    size_t GetBatchSize() const { return m_batchSize; }
    size_t GetDimensions() const { return m_means.size(); }
    const std::vector<double>& GetMeans() const { return m_means; }
    const std::vector<double>& GetStdDevs() const { return m_stddevs; }

private:
    const uint32_t m_version;
    const std::vector<double> m_means;
    const std::vector<double> m_stddevs;
    const size_t m_batchSize;
};

typedef std::shared_ptr<const Scaler> ScalerRef;

/**
 * Fit a scaler over a batch of raw vectors using the population mean and
 * standard deviation of every dimension.
 *
 * @return nullptr for an empty batch or vectors of differing length
 */
ScalerRef FitScaler(const std::vector<FeatureVector>& batch, uint32_t version);

/**
 * Apply (x - mean) / stddev per dimension. Dimensions with a zero standard
 * deviation map to 0, as does any non-finite result. The returned vector
 * records the scaler version.
 */
FeatureVector Normalize(const Scaler& scaler, const FeatureVector& raw);

/**
 * Scaler Registry
 *
 * Publishes scaler versions. Readers take the current snapshot with an
 * atomic load and keep it for the rest of their request; a fit or publish
 * swaps in a new snapshot without blocking them. Writers are serialized.
 */
class ScalerRegistry {
public:
    ScalerRegistry();

    /** Latest published snapshot, nullptr before the first fit */
    ScalerRef Current() const;

    /** Fit the batch as the next version and publish it */
    ScalerRef Fit(const std::vector<FeatureVector>& batch);

    /**
     * Install an externally built snapshot. Rejected unless its version is
     * newer than the current one.
     */
    bool Publish(const ScalerRef& scaler);

    /** Version of the current snapshot, 0 when none */
    uint32_t CurrentVersion() const;

private:
    std::mutex m_writerMutex;
    ScalerRef m_current;            // accessed through std::atomic_load/atomic_store only
    uint32_t m_nextVersion;         // guarded by m_writerMutex
};

} // namespace fraudscore

#endif // FRAUDSCORE_SCALER_H
