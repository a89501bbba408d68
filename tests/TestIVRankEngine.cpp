#include "analytics/IVRankEngine.h"
#include "common/Logger.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace thetadesk;
using thetadesk::analytics::IVRankEngine;

namespace {

// 호출 횟수를 기록하는 가짜 provider
class FakeHistorySource : public core::IHistoricalDataSource {
public:
    PriceSeries series;
    bool fail = false;
    int calls = 0;

    PriceSeries getHistory(const std::string&, Timestamp, Timestamp) override {
        ++calls;
        if (fail) {
            throw std::runtime_error("provider timeout");
        }
        return series;
    }
};

PriceSeries makeSeries(const std::vector<double>& closes) {
    PriceSeries out;
    long long ts = 1700000000000LL;
    for (double c : closes) {
        out.emplace_back(ts, c);
        ts += 86400000LL;
    }
    return out;
}

std::vector<double> wavyCloses(size_t n) {
    std::vector<double> closes;
    for (size_t i = 0; i < n; ++i) {
        // 진폭이 점점 커지는 파형 -> HV 상승
        const double amp = 0.5 + 0.05 * static_cast<double>(i);
        closes.push_back(100.0 + amp * std::sin(static_cast<double>(i) * 0.7));
    }
    return closes;
}

} // namespace

int main() {
    auto now = std::make_shared<Timestamp>(std::chrono::system_clock::now());
    auto clock = [now] { return *now; };

    // 19 / 20 샘플 -> nullopt (20개는 rolling window가 채워지지 않음)
    {
        auto source = std::make_shared<FakeHistorySource>();
        IVRankEngine engine(source, IVRankConfig{}, clock);

        source->series = makeSeries(std::vector<double>(19, 100.0));
        assert(!engine.getIVRank("SHORT").has_value());

        source->series = makeSeries(wavyCloses(20));
        assert(!engine.getIVRank("TWENTY").has_value());
        assert(!engine.getIVDetails("TWENTY").has_value());
        assert(engine.cacheSize() == 0);
    }

    // 21 샘플 -> HV 1개, rank 0
    {
        auto source = std::make_shared<FakeHistorySource>();
        source->series = makeSeries(wavyCloses(21));
        IVRankEngine engine(source, IVRankConfig{}, clock);
        auto rank = engine.getIVRank("MIN");
        assert(rank.has_value());
        assert(*rank == 0.0);
    }

    // 상수 가격 -> HV 모두 0 -> rank 0
    {
        auto source = std::make_shared<FakeHistorySource>();
        source->series = makeSeries(std::vector<double>(60, 42.0));
        IVRankEngine engine(source, IVRankConfig{}, clock);
        auto rank = engine.getIVRank("FLAT");
        assert(rank.has_value());
        assert(*rank == 0.0);

        auto details = engine.getIVDetails("FLAT");
        assert(details.has_value());
        assert(details->current_hv == 0.0);
        assert(!details->high_iv && !details->low_iv);
    }

    // 범위 [0, 100], 상승하는 HV -> 높은 rank
    {
        auto source = std::make_shared<FakeHistorySource>();
        source->series = makeSeries(wavyCloses(120));
        IVRankEngine engine(source, IVRankConfig{}, clock);
        auto rank = engine.getIVRank("WAVE");
        assert(rank.has_value());
        assert(*rank >= 0.0 && *rank <= 100.0);
        assert(*rank > 50.0);
    }

    // percentile은 현재 HV에 대해 단조 증가
    {
        std::vector<double> base = {12.0, 18.0, 25.0, 9.0, 30.0, 21.0};
        double prev = -1.0;
        for (double current : {5.0, 9.0, 15.0, 21.0, 22.0, 35.0}) {
            auto hv = base;
            hv.push_back(current);
            double r = IVRankEngine::percentileRank(hv);
            assert(r >= 0.0 && r <= 100.0);
            assert(r >= prev);
            prev = r;
        }
        // 현재값은 자기 자신보다 작지 않음 -> 최대값이어도 100 미만
        auto hv = base;
        hv.push_back(99.0);
        assert(std::abs(IVRankEngine::percentileRank(hv) - 6.0 / 7.0 * 100.0) < 1e-9);
    }

    // HV 시계열 길이: returns(n-1) - window + 1
    {
        auto hv = IVRankEngine::historicalVolatilitySeries(wavyCloses(50), 20);
        assert(hv.size() == 30);
        for (double v : hv) assert(v > 0.0);
    }

    // 캐시: TTL 이내 재호출은 provider 호출 없이 동일 값
    {
        auto source = std::make_shared<FakeHistorySource>();
        source->series = makeSeries(wavyCloses(80));
        IVRankConfig cfg;
        cfg.cache_ttl_seconds = 3600;
        IVRankEngine engine(source, cfg, clock);

        auto first = engine.getIVRank("SPY");
        auto second = engine.getIVRank("SPY");
        assert(first.has_value() && second.has_value());
        assert(*first == *second);
        assert(source->calls == 1);

        // 새 데이터가 와도 TTL 내에는 캐시 사용
        source->series = makeSeries(std::vector<double>(80, 10.0));
        *now += std::chrono::seconds(3599);
        assert(*engine.getIVRank("SPY") == *first);
        assert(source->calls == 1);

        // 다른 lookback은 별도 key
        engine.getIVRank("SPY", 126);
        assert(source->calls == 2);
        assert(engine.cacheSize() == 2);

        // 시계가 뒤로 가면 (음수 경과) TTL 과 무관하게 stale
        *now -= std::chrono::seconds(10);
        engine.getIVRank("SPY", 126);
        assert(source->calls == 3);
        *now += std::chrono::seconds(10);
        engine.getIVRank("SPY", 126);
        assert(source->calls == 3);

        // TTL 만료 -> 재계산
        *now += std::chrono::seconds(2);
        auto refreshed = engine.getIVRank("SPY");
        assert(source->calls == 4);
        assert(refreshed.has_value() && *refreshed == 0.0);

        engine.clearCache();
        assert(engine.cacheSize() == 0);
        engine.getIVRank("SPY");
        assert(source->calls == 5);
    }

    // provider 예외 -> nullopt, 캐시 없음
    {
        auto source = std::make_shared<FakeHistorySource>();
        source->fail = true;
        IVRankEngine engine(source, IVRankConfig{}, clock);
        assert(!engine.getIVRank("ERR").has_value());
        assert(!engine.getIVDetails("ERR").has_value());
        assert(engine.cacheSize() == 0);
    }

    // provider 없음 -> nullopt
    {
        IVRankEngine engine(nullptr, IVRankConfig{}, clock);
        assert(!engine.getIVRank("NONE").has_value());
    }

    // details
    {
        auto source = std::make_shared<FakeHistorySource>();
        source->series = makeSeries(wavyCloses(120));
        IVRankEngine engine(source, IVRankConfig{}, clock);

        auto details = engine.getIVDetails("WAVE");
        assert(details.has_value());
        assert(!details->hv_series.empty());
        assert(details->symbol == "WAVE");
        assert(details->current_hv == details->hv_series.back());
        assert(details->hv_min <= details->hv_mean && details->hv_mean <= details->hv_max);
        assert(!(details->high_iv && details->low_iv));
        assert(details->high_iv == (details->current_hv > details->hv_mean + details->hv_std));

        // details가 채운 캐시를 getIVRank가 재사용
        const int calls = source->calls;
        auto rank = engine.getIVRank("WAVE");
        assert(rank.has_value() && *rank == details->iv_rank);
        assert(source->calls == calls);
    }

    // provider 없음 경고는 엔진당 한 번만 기록
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const auto dir = std::filesystem::temp_directory_path() / ("thetadesk_ivrank_test_" + std::to_string(stamp));
        Logger::getInstance().initialize(dir.string(), "warn");

        IVRankEngine engine(nullptr, IVRankConfig{}, clock);
        for (int i = 0; i < 5; ++i) {
            assert(!engine.getIVRank("NONE").has_value());
            assert(!engine.getIVDetails("NONE").has_value());
        }
        assert(engine.cacheSize() == 0);

        std::ifstream log(dir / "thetadesk.log");
        assert(log.is_open());
        std::string line;
        int warnings = 0;
        while (std::getline(log, line)) {
            if (line.find("No historical data source configured") != std::string::npos) {
                ++warnings;
            }
        }
        assert(warnings == 1);

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::cout << "[TEST] IVRankEngine PASSED\n";
    return 0;
}
