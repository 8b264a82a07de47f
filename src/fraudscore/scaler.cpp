// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/scaler.h>
#include <fraudscore/stats.h>
#include <util.h>

#include <cmath>

namespace fraudscore {

Scaler::Scaler(uint32_t version, std::vector<double> means, std::vector<double> stddevs, size_t batchSize)
    : m_version(version), m_means(std::move(means)), m_stddevs(std::move(stddevs)), m_batchSize(batchSize)
{
}

ScalerRef FitScaler(const std::vector<FeatureVector>& batch, uint32_t version)
{
    if (batch.empty()) {
        return nullptr;
    }
    const size_t dims = batch.front().values.size();
    for (const FeatureVector& vec : batch) {
        if (vec.values.size() != dims) {
            LogPrintf("%s: ragged batch (%u vs %u dimensions)\n", __func__, vec.values.size(), dims);
            return nullptr;
        }
    }

    std::vector<double> means(dims, 0.0);
    std::vector<double> stddevs(dims, 0.0);
    std::vector<double> column(batch.size());
    for (size_t d = 0; d < dims; ++d) {
        for (size_t i = 0; i < batch.size(); ++i) {
            column[i] = SanitizeValue(batch[i].values[d]);
        }
        means[d] = CalculateMean(column);
        stddevs[d] = CalculateStdDev(column, means[d]);
    }

    return std::make_shared<const Scaler>(version, std::move(means), std::move(stddevs), batch.size());
}

FeatureVector Normalize(const Scaler& scaler, const FeatureVector& raw)
{
    FeatureVector out;
    out.values.assign(raw.values.size(), 0.0);
    out.scalerVersion = scaler.GetVersion();

    const std::vector<double>& means = scaler.GetMeans();
    const std::vector<double>& stddevs = scaler.GetStdDevs();
    for (size_t d = 0; d < raw.values.size() && d < means.size(); ++d) {
        if (stddevs[d] < SCALER_MIN_STDDEV) {
            continue;
        }
        out.values[d] = SanitizeValue((raw.values[d] - means[d]) / stddevs[d]);
    }
    return out;
}

ScalerRegistry::ScalerRegistry() : m_nextVersion(1)
{
}

ScalerRef ScalerRegistry::Current() const
{
    return std::atomic_load(&m_current);
}

ScalerRef ScalerRegistry::Fit(const std::vector<FeatureVector>& batch)
{
    std::lock_guard<std::mutex> lock(m_writerMutex);
    ScalerRef fitted = FitScaler(batch, m_nextVersion);
    if (!fitted) {
        return nullptr;
    }
    ++m_nextVersion;
    std::atomic_store(&m_current, fitted);
    LogPrint(BCLog::INDEX, "Published scaler version %u fitted on %u vectors\n",
             fitted->GetVersion(), fitted->GetBatchSize());
    return fitted;
}

bool ScalerRegistry::Publish(const ScalerRef& scaler)
{
    if (!scaler) return false;

    std::lock_guard<std::mutex> lock(m_writerMutex);
    ScalerRef current = std::atomic_load(&m_current);
    if (current && scaler->GetVersion() <= current->GetVersion()) {
        return false;
    }
    if (scaler->GetVersion() == 0) {
        return false;
    }
    if (scaler->GetVersion() >= m_nextVersion) {
        m_nextVersion = scaler->GetVersion() + 1;
    }
    std::atomic_store(&m_current, scaler);
    return true;
}

uint32_t ScalerRegistry::CurrentVersion() const
{
    ScalerRef current = Current();
    return current ? current->GetVersion() : 0;
}

} // namespace fraudscore
