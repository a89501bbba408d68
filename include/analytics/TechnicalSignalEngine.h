#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/PipelineConfig.h"
#include "common/Types.h"
#include "core/contracts/IIndicatorBackend.h"

namespace thetadesk {
namespace analytics {

enum class BandSignal { OVERSOLD, OVERBOUGHT, NEUTRAL };
enum class MACDTrend { BULLISH, BEARISH, NEUTRAL };

const char* toString(BandSignal s);
const char* toString(MACDTrend t);

struct BollingerSnapshot {
    double upper = 0.0;
    double middle = 0.0;
    double lower = 0.0;
    double width = 0.0;
    double position = 0.5;  // 0 = lower, 0.5 = middle, 1 = upper (돌파 시 범위 밖)
    BandSignal signal = BandSignal::NEUTRAL;
};

struct MACDSnapshot {
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
    MACDTrend trend = MACDTrend::NEUTRAL;
    bool crossover = false;  // |macd - signal| < 0.1 (근사치, 실제 교차 검출 아님)
};

struct IndicatorSnapshot {
    std::optional<double> rsi;
    std::optional<BollingerSnapshot> bbands;
    std::optional<MACDSnapshot> macd;
    std::optional<double> atr;
    std::vector<std::string> signals;
    OverallSignal overall_signal = OverallSignal::NEUTRAL;
    std::optional<std::string> error;   // backend unavailable marker

    bool hasSignal(const std::string& tag) const;
    nlohmann::json toJson() const;
};

// 지표 4종 + 종합 신호. 캐시 없음 - 매 호출마다 재계산
class TechnicalSignalEngine {
public:
    static constexpr double kRsiOversold = 30.0;
    static constexpr double kRsiOverbought = 70.0;
    static constexpr double kBandOversold = 0.2;
    static constexpr double kBandOverbought = 0.8;
    static constexpr double kCrossoverTolerance = 0.1;
    static constexpr const char* kBackendUnavailable = "indicator backend not available";

    explicit TechnicalSignalEngine(std::shared_ptr<const core::IIndicatorBackend> backend,
                                   IndicatorConfig config = IndicatorConfig{});

    bool backendAvailable() const { return backend_ != nullptr; }

    std::optional<double> calculateRSI(const std::vector<double>& prices, int period = 14) const;

    std::optional<BollingerSnapshot> calculateBollingerBands(const std::vector<double>& prices,
                                                             int period = 20,
                                                             double std_dev_mult = 2.0) const;

    std::optional<MACDSnapshot> calculateMACD(const std::vector<double>& prices,
                                              int fast = 12, int slow = 26, int signal = 9) const;

    std::optional<double> calculateATR(const std::vector<double>& high,
                                       const std::vector<double>& low,
                                       const std::vector<double>& close,
                                       int period = 14) const;

    // 종합 분석. high/low 둘 다 있을 때만 ATR 계산
    IndicatorSnapshot analyze(const std::vector<double>& prices,
                              const std::optional<std::vector<double>>& high = std::nullopt,
                              const std::optional<std::vector<double>>& low = std::nullopt) const;

    IndicatorSnapshot analyze(const PriceSeries& series) const;

    static BandSignal classifyBandPosition(double position);
    static MACDTrend classifyTrend(double macd, double signal, double histogram);
    // MACD 태그만 종합 신호를 결정한다
    static OverallSignal aggregate(const std::vector<std::string>& signals);

private:
    static BollingerSnapshot toSnapshot(const core::BollingerValues& v);
    static MACDSnapshot toSnapshot(const core::MACDValues& v);
    void warnUnavailable() const;

    std::shared_ptr<const core::IIndicatorBackend> backend_;
    IndicatorConfig config_;
    mutable std::once_flag unavailable_warned_;
};

} // namespace analytics
} // namespace thetadesk
