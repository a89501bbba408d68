#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/PipelineConfig.h"
#include "common/Types.h"
#include "core/contracts/IHistoricalDataSource.h"

namespace thetadesk {
namespace analytics {

// 과거 변동성(HV) 통계. "IV rank"라고 부르지만 실제로는 HV 시계열 자신에 대한 백분위 -
// 옵션 내재변동성 rank의 근사치로만 사용할 것
struct VolatilityRecord {
    std::string symbol;
    int lookback_days = 252;
    Timestamp computed_at{};
    std::vector<double> hv_series;  // annualized %, rolling window가 채워진 날부터 1개씩
    double current_hv = 0.0;
    double iv_rank = 0.0;           // 0 ~ 100
    double hv_mean = 0.0;
    double hv_std = 0.0;
    double hv_min = 0.0;
    double hv_max = 0.0;
    bool high_iv = false;           // current > mean + std
    bool low_iv = false;            // current < mean - std

    nlohmann::json toJson() const;
};

class IVRankEngine {
public:
    using Clock = std::function<Timestamp()>;

    static constexpr int kTradingDaysPerYear = 252;

    IVRankEngine(std::shared_ptr<core::IHistoricalDataSource> source,
                 IVRankConfig config = IVRankConfig{},
                 Clock clock = nullptr);

    // 데이터 부족 / provider 실패 시 nullopt (예외 없음)
    std::optional<double> getIVRank(const std::string& symbol, int lookback_days = 252);

    std::optional<VolatilityRecord> getIVDetails(const std::string& symbol, int lookback_days = 252);

    // 전체 삭제 (선택적 삭제 없음)
    void clearCache();
    size_t cacheSize() const;

    // price series -> annualized HV series (%). 순수 함수
    static std::vector<double> historicalVolatilitySeries(const std::vector<double>& closes, int window = 20);

    // (hv < current) 개수 / 전체 * 100
    static double percentileRank(const std::vector<double>& hv_series);

private:
    struct CacheEntry {
        Timestamp computed_at;
        double value;
    };
    using CacheKey = std::pair<std::string, int>;

    std::optional<std::vector<double>> fetchHVSeries(const std::string& symbol, int lookback_days);
    std::optional<double> lookupFresh(const CacheKey& key, Timestamp now) const;

    std::shared_ptr<core::IHistoricalDataSource> source_;
    IVRankConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<CacheKey, CacheEntry> cache_;
    std::once_flag no_source_warned_;
};

} // namespace analytics
} // namespace thetadesk
