#include "analytics/IVRankEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace thetadesk {
namespace analytics {

nlohmann::json VolatilityRecord::toJson() const {
    return {
        {"symbol", symbol},
        {"lookback_days", lookback_days},
        {"computed_at_ms", toEpochMs(computed_at)},
        {"samples", hv_series.size()},
        {"current_hv", current_hv},
        {"hv_mean", hv_mean},
        {"hv_std", hv_std},
        {"hv_min", hv_min},
        {"hv_max", hv_max},
        {"iv_rank", iv_rank},
        {"high_iv", high_iv},
        {"low_iv", low_iv}
    };
}

IVRankEngine::IVRankEngine(std::shared_ptr<core::IHistoricalDataSource> source,
                           IVRankConfig config,
                           Clock clock)
    : source_(std::move(source))
    , config_(config)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{}

std::vector<double> IVRankEngine::historicalVolatilitySeries(const std::vector<double>& closes, int window) {
    auto returns = TechnicalIndicators::calculateReturns(closes);
    auto rolling = TechnicalIndicators::calculateRollingStdDev(returns, window);

    const double annualize = std::sqrt(static_cast<double>(kTradingDaysPerYear)) * 100.0;
    for (auto& v : rolling) {
        v *= annualize;
    }
    return rolling;
}

double IVRankEngine::percentileRank(const std::vector<double>& hv_series) {
    if (hv_series.empty()) return 0.0;

    const double current = hv_series.back();
    const auto below = std::count_if(hv_series.begin(), hv_series.end(),
                                     [current](double v) { return v < current; });
    return static_cast<double>(below) / static_cast<double>(hv_series.size()) * 100.0;
}

std::optional<double> IVRankEngine::lookupFresh(const CacheKey& key, Timestamp now) const {
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    const auto elapsed = now - it->second.computed_at;
    // 시계가 뒤로 간 경우(음수 경과)는 stale
    if (elapsed >= Timestamp::duration::zero() &&
        elapsed < std::chrono::seconds(config_.cache_ttl_seconds)) {
        return it->second.value;
    }
    return std::nullopt;
}

std::optional<std::vector<double>> IVRankEngine::fetchHVSeries(const std::string& symbol, int lookback_days) {
    if (!source_) {
        // 호출마다 반복하지 않음
        std::call_once(no_source_warned_, [&symbol] {
            LOG_WARN("No historical data source configured (first request: {}). IV rank unavailable.", symbol);
        });
        return std::nullopt;
    }

    PriceSeries history;
    try {
        const auto end = clock_();
        const auto start = end - std::chrono::hours(24) * lookback_days;
        history = source_->getHistory(symbol, start, end);
    } catch (const std::exception& e) {
        LOG_ERROR("Error fetching history for {} IV rank: {}", symbol, e.what());
        return std::nullopt;
    }

    if (history.size() < static_cast<size_t>(config_.min_samples)) {
        LOG_WARN("Insufficient data for {} IV rank ({} samples)", symbol, history.size());
        return std::nullopt;
    }

    auto hv = historicalVolatilitySeries(extractCloses(history), config_.hv_window);
    if (hv.empty()) {
        LOG_WARN("Rolling HV series empty for {} ({} samples)", symbol, history.size());
        return std::nullopt;
    }
    return hv;
}

std::optional<double> IVRankEngine::getIVRank(const std::string& symbol, int lookback_days) {
    std::lock_guard<std::mutex> lock(mutex_);

    const CacheKey key{symbol, lookback_days};
    const auto now = clock_();
    if (auto cached = lookupFresh(key, now)) {
        LOG_DEBUG("IV rank cache hit for {}", symbol);
        return cached;
    }

    auto hv = fetchHVSeries(symbol, lookback_days);
    if (!hv) {
        return std::nullopt;
    }

    const double iv_rank = percentileRank(*hv);
    cache_[key] = CacheEntry{now, iv_rank};

    LOG_INFO("{} IV Rank: {:.1f}% (Current HV: {:.1f}%)", symbol, iv_rank, hv->back());
    return iv_rank;
}

std::optional<VolatilityRecord> IVRankEngine::getIVDetails(const std::string& symbol, int lookback_days) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto hv = fetchHVSeries(symbol, lookback_days);
    if (!hv) {
        return std::nullopt;
    }

    const auto now = clock_();
    const CacheKey key{symbol, lookback_days};

    VolatilityRecord record;
    record.symbol = symbol;
    record.lookback_days = lookback_days;
    record.computed_at = now;
    record.current_hv = hv->back();
    record.hv_mean = TechnicalIndicators::calculateMean(*hv);
    record.hv_std = TechnicalIndicators::calculateSampleStdDev(*hv);
    record.hv_min = *std::min_element(hv->begin(), hv->end());
    record.hv_max = *std::max_element(hv->begin(), hv->end());
    record.high_iv = record.current_hv > record.hv_mean + record.hv_std;
    record.low_iv = record.current_hv < record.hv_mean - record.hv_std;

    // 유효한 캐시 값이 있으면 그대로, 없으면 같은 시계열로 계산 후 저장
    if (auto cached = lookupFresh(key, now)) {
        record.iv_rank = *cached;
    } else {
        record.iv_rank = percentileRank(*hv);
        cache_[key] = CacheEntry{now, record.iv_rank};
    }
    record.hv_series = std::move(*hv);

    return record;
}

void IVRankEngine::clearCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    LOG_INFO("IV rank cache cleared");
}

size_t IVRankEngine::cacheSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace analytics
} // namespace thetadesk
