#include "analytics/BuiltinIndicatorBackend.h"
#include "analytics/TechnicalIndicators.h"
#include "analytics/TechnicalSignalEngine.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace thetadesk;
using namespace thetadesk::analytics;

namespace {

// 고정값을 돌려주는 backend
class StubBackend : public core::IIndicatorBackend {
public:
    std::optional<double> rsi_value;
    std::optional<core::BollingerValues> bb_value;
    std::optional<core::MACDValues> macd_value;
    std::optional<double> atr_value;
    bool throw_on_macd = false;

    std::optional<double> rsi(const std::vector<double>&, int) const override { return rsi_value; }

    std::optional<core::BollingerValues> bollinger(const std::vector<double>&, int, double) const override {
        return bb_value;
    }

    std::optional<core::MACDValues> macd(const std::vector<double>&, int, int, int) const override {
        if (throw_on_macd) throw std::runtime_error("backend crashed");
        return macd_value;
    }

    std::optional<double> atr(const std::vector<double>&, const std::vector<double>&,
                              const std::vector<double>&, int) const override {
        return atr_value;
    }
};

core::BollingerValues bandAt(double position) {
    core::BollingerValues v;
    v.upper = 110.0;
    v.middle = 100.0;
    v.lower = 90.0;
    v.width = 20.0;
    v.position = position;
    return v;
}

core::MACDValues macdOf(double macd, double signal) {
    core::MACDValues v;
    v.macd = macd;
    v.signal = signal;
    v.histogram = macd - signal;
    return v;
}

std::vector<double> linear(size_t n, double start, double step) {
    std::vector<double> out;
    for (size_t i = 0; i < n; ++i) out.push_back(start + step * static_cast<double>(i));
    return out;
}

} // namespace

int main() {
    // Bollinger 경계값: 0.2 / 0.8 은 NEUTRAL
    {
        assert(TechnicalSignalEngine::classifyBandPosition(0.2) == BandSignal::NEUTRAL);
        assert(TechnicalSignalEngine::classifyBandPosition(0.8) == BandSignal::NEUTRAL);
        assert(TechnicalSignalEngine::classifyBandPosition(0.1999) == BandSignal::OVERSOLD);
        assert(TechnicalSignalEngine::classifyBandPosition(0.8001) == BandSignal::OVERBOUGHT);
        assert(TechnicalSignalEngine::classifyBandPosition(-0.3) == BandSignal::OVERSOLD);
        assert(TechnicalSignalEngine::classifyBandPosition(1.4) == BandSignal::OVERBOUGHT);
    }

    // MACD trend 분류
    {
        assert(TechnicalSignalEngine::classifyTrend(1.0, 0.5, 0.5) == MACDTrend::BULLISH);
        assert(TechnicalSignalEngine::classifyTrend(-1.0, -0.5, -0.5) == MACDTrend::BEARISH);
        assert(TechnicalSignalEngine::classifyTrend(1.0, 1.0, 0.0) == MACDTrend::NEUTRAL);
        // histogram 부호가 어긋나면 NEUTRAL
        assert(TechnicalSignalEngine::classifyTrend(1.0, 0.5, -0.1) == MACDTrend::NEUTRAL);
    }

    // 종합 신호: MACD 가 유일한 결정권
    {
        auto stub = std::make_shared<StubBackend>();
        stub->rsi_value = 25.0;
        stub->bb_value = bandAt(0.9);
        stub->macd_value = macdOf(1.0, 0.5);
        TechnicalSignalEngine engine(stub);

        auto snap = engine.analyze(linear(60, 100.0, 0.5));
        assert(!snap.error.has_value());
        assert(snap.hasSignal("RSI_OVERSOLD"));
        assert(snap.hasSignal("BB_OVERBOUGHT"));
        assert(snap.hasSignal("MACD_BULLISH"));
        assert(snap.signals.size() == 3);
        assert(snap.overall_signal == OverallSignal::BULLISH);
        assert(snap.macd.has_value() && !snap.macd->crossover);
        assert(!snap.atr.has_value());

        stub->rsi_value = 85.0;
        stub->bb_value = bandAt(0.05);
        stub->macd_value = macdOf(-1.0, -0.4);
        snap = engine.analyze(linear(60, 100.0, 0.5));
        assert(snap.hasSignal("RSI_OVERBOUGHT"));
        assert(snap.hasSignal("BB_OVERSOLD"));
        assert(snap.overall_signal == OverallSignal::BEARISH);

        // signal 선에 근접하면 crossover 표시
        stub->rsi_value = 10.0;
        stub->macd_value = macdOf(0.30, 0.25);
        snap = engine.analyze(linear(60, 100.0, 0.5));
        assert(snap.hasSignal("MACD_BULLISH"));
        assert(snap.macd->crossover);

        // RSI/밴드가 극단이어도 MACD 중립이면 NEUTRAL
        stub->macd_value = macdOf(0.5, 0.5);
        snap = engine.analyze(linear(60, 100.0, 0.5));
        assert(snap.hasSignal("MACD_NEUTRAL"));
        assert(snap.overall_signal == OverallSignal::NEUTRAL);

        // RSI 30~70 구간은 태그 없음, 지표 없음도 허용
        stub->rsi_value = 50.0;
        stub->bb_value.reset();
        stub->macd_value.reset();
        snap = engine.analyze(linear(60, 100.0, 0.5));
        assert(snap.signals.empty());
        assert(snap.overall_signal == OverallSignal::NEUTRAL);

        // ATR 은 high/low 모두 있을 때만
        stub->atr_value = 1.5;
        snap = engine.analyze(linear(60, 100.0, 0.5));
        assert(!snap.atr.has_value());
        snap = engine.analyze(linear(60, 100.0, 0.5), linear(60, 101.0, 0.5), linear(60, 99.0, 0.5));
        assert(snap.atr.has_value() && *snap.atr == 1.5);
    }

    // backend 없음 -> error marker 만
    {
        TechnicalSignalEngine engine(nullptr);
        assert(!engine.backendAvailable());
        auto snap = engine.analyze(linear(60, 100.0, 0.5));
        assert(snap.error.has_value());
        assert(*snap.error == TechnicalSignalEngine::kBackendUnavailable);
        assert(!snap.rsi.has_value() && !snap.bbands.has_value() && !snap.macd.has_value());
        assert(snap.signals.empty());
        assert(!engine.calculateRSI(linear(60, 100.0, 0.5)).has_value());

        auto j = snap.toJson();
        assert(j.contains("error") && !j.contains("rsi"));
    }

    // backend 예외 -> 부분 결과 없이 error marker
    {
        auto stub = std::make_shared<StubBackend>();
        stub->rsi_value = 25.0;
        stub->throw_on_macd = true;
        TechnicalSignalEngine engine(stub);
        auto snap = engine.analyze(linear(60, 100.0, 0.5));
        assert(snap.error.has_value());
        assert(!snap.rsi.has_value());
        assert(!engine.calculateMACD(linear(60, 100.0, 0.5)).has_value());
    }

    // 기본 backend: 최소 샘플 수
    {
        TechnicalSignalEngine engine(std::make_shared<BuiltinIndicatorBackend>());

        assert(!engine.calculateRSI(linear(14, 100.0, 1.0)).has_value());
        assert(engine.calculateRSI(linear(15, 100.0, 1.0)).has_value());

        assert(!engine.calculateBollingerBands(linear(19, 100.0, 1.0)).has_value());
        assert(engine.calculateBollingerBands(linear(20, 100.0, 1.0)).has_value());

        assert(!engine.calculateMACD(linear(34, 100.0, 1.0)).has_value());
        assert(engine.calculateMACD(linear(35, 100.0, 1.0)).has_value());

        auto close = linear(14, 50.0, 0.0);
        auto high = linear(14, 51.0, 0.0);
        auto low = linear(14, 49.0, 0.0);
        assert(!engine.calculateATR(high, low, close).has_value());
    }

    // 기본 backend: 값 검증
    {
        TechnicalSignalEngine engine(std::make_shared<BuiltinIndicatorBackend>());

        // 단조 상승 -> RSI 100
        auto rsi = engine.calculateRSI(linear(30, 100.0, 1.0));
        assert(rsi.has_value() && std::abs(*rsi - 100.0) < 1e-9);

        // 상수 가격 -> 밴드 폭 0, position 0.5, NEUTRAL
        auto flat = engine.calculateBollingerBands(std::vector<double>(25, 100.0));
        assert(flat.has_value());
        assert(flat->width == 0.0);
        assert(flat->position == 0.5);
        assert(flat->signal == BandSignal::NEUTRAL);
        assert(flat->middle == 100.0);

        // 마지막 가격 급등 -> 상단 밴드 돌파 (position > 1)
        std::vector<double> spike(24, 100.0);
        spike.push_back(100.5);
        spike.push_back(99.5);
        spike.push_back(130.0);
        auto breakout = engine.calculateBollingerBands(spike);
        assert(breakout.has_value());
        assert(breakout->position > 1.0);
        assert(breakout->signal == BandSignal::OVERBOUGHT);

        // 일정한 TR = 2
        auto close = std::vector<double>(30, 50.0);
        auto high = std::vector<double>(30, 51.0);
        auto low = std::vector<double>(30, 49.0);
        auto atr = engine.calculateATR(high, low, close);
        assert(atr.has_value() && std::abs(*atr - 2.0) < 1e-9);

        // 길이 불일치
        high.pop_back();
        assert(!engine.calculateATR(high, low, close).has_value());

        // 상수 가격 -> MACD 0, crossover
        auto macd = engine.calculateMACD(std::vector<double>(40, 100.0));
        assert(macd.has_value());
        assert(std::abs(macd->macd) < 1e-9);
        assert(macd->trend == MACDTrend::NEUTRAL);
        assert(macd->crossover);
    }

    // PriceSeries 입력: 모든 bar 에 high/low 가 있을 때 ATR 포함
    {
        TechnicalSignalEngine engine(std::make_shared<BuiltinIndicatorBackend>());
        PriceSeries series;
        for (int i = 0; i < 40; ++i) {
            double c = 100.0 + i * 0.25;
            series.emplace_back(1000LL * i, c, c + 1.0, c - 1.0);
        }
        auto snap = engine.analyze(series);
        assert(!snap.error.has_value());
        assert(snap.rsi.has_value() && snap.bbands.has_value() && snap.macd.has_value());
        assert(snap.atr.has_value());

        series.back().has_range = false;
        snap = engine.analyze(series);
        assert(!snap.atr.has_value());
    }

    // 원시 함수: 샘플 표준편차 / rolling
    {
        std::vector<double> v = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
        assert(std::abs(TechnicalIndicators::calculateStandardDeviation(v, 5.0) - 2.0) < 1e-12);
        assert(std::abs(TechnicalIndicators::calculateSampleStdDev(v) - std::sqrt(32.0 / 7.0)) < 1e-12);
        assert(TechnicalIndicators::calculateRollingStdDev(v, 3).size() == 6);
        assert(TechnicalIndicators::calculateReturns({100.0, 110.0, 99.0}).size() == 2);
    }

    std::cout << "[TEST] TechnicalSignalEngine PASSED\n";
    return 0;
}
