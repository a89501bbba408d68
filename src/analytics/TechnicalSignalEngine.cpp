#include "analytics/TechnicalSignalEngine.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace thetadesk {
namespace analytics {

const char* toString(BandSignal s) {
    switch (s) {
        case BandSignal::OVERSOLD: return "OVERSOLD";
        case BandSignal::OVERBOUGHT: return "OVERBOUGHT";
        default: return "NEUTRAL";
    }
}

const char* toString(MACDTrend t) {
    switch (t) {
        case MACDTrend::BULLISH: return "BULLISH";
        case MACDTrend::BEARISH: return "BEARISH";
        default: return "NEUTRAL";
    }
}

bool IndicatorSnapshot::hasSignal(const std::string& tag) const {
    return std::find(signals.begin(), signals.end(), tag) != signals.end();
}

nlohmann::json IndicatorSnapshot::toJson() const {
    nlohmann::json j;
    if (error) {
        j["error"] = *error;
        return j;
    }

    j["rsi"] = rsi ? nlohmann::json(*rsi) : nlohmann::json(nullptr);

    if (bbands) {
        j["bbands"] = {
            {"upper", bbands->upper},
            {"middle", bbands->middle},
            {"lower", bbands->lower},
            {"width", bbands->width},
            {"position", bbands->position},
            {"signal", toString(bbands->signal)}
        };
    } else {
        j["bbands"] = nullptr;
    }

    if (macd) {
        j["macd"] = {
            {"macd", macd->macd},
            {"signal", macd->signal},
            {"histogram", macd->histogram},
            {"trend", toString(macd->trend)},
            {"crossover", macd->crossover}
        };
    } else {
        j["macd"] = nullptr;
    }

    if (atr) {
        j["atr"] = *atr;
    }
    j["signals"] = signals;
    j["overall_signal"] = toString(overall_signal);
    return j;
}

TechnicalSignalEngine::TechnicalSignalEngine(std::shared_ptr<const core::IIndicatorBackend> backend,
                                             IndicatorConfig config)
    : backend_(std::move(backend))
    , config_(config)
{}

void TechnicalSignalEngine::warnUnavailable() const {
    std::call_once(unavailable_warned_, [] {
        LOG_WARN("Indicator backend not installed - technical indicators unavailable");
    });
}

BandSignal TechnicalSignalEngine::classifyBandPosition(double position) {
    if (position < kBandOversold) return BandSignal::OVERSOLD;
    if (position > kBandOverbought) return BandSignal::OVERBOUGHT;
    return BandSignal::NEUTRAL;
}

MACDTrend TechnicalSignalEngine::classifyTrend(double macd, double signal, double histogram) {
    if (macd > signal && histogram > 0) return MACDTrend::BULLISH;
    if (macd < signal && histogram < 0) return MACDTrend::BEARISH;
    return MACDTrend::NEUTRAL;
}

OverallSignal TechnicalSignalEngine::aggregate(const std::vector<std::string>& signals) {
    auto has = [&](const char* tag) {
        return std::find(signals.begin(), signals.end(), tag) != signals.end();
    };
    if (has("MACD_BULLISH")) return OverallSignal::BULLISH;
    if (has("MACD_BEARISH")) return OverallSignal::BEARISH;
    return OverallSignal::NEUTRAL;
}

BollingerSnapshot TechnicalSignalEngine::toSnapshot(const core::BollingerValues& v) {
    BollingerSnapshot s;
    s.upper = v.upper;
    s.middle = v.middle;
    s.lower = v.lower;
    s.width = v.width;
    s.position = (v.width > 0.0) ? v.position : 0.5;
    s.signal = classifyBandPosition(s.position);
    return s;
}

MACDSnapshot TechnicalSignalEngine::toSnapshot(const core::MACDValues& v) {
    MACDSnapshot s;
    s.macd = v.macd;
    s.signal = v.signal;
    s.histogram = v.histogram;
    s.trend = classifyTrend(v.macd, v.signal, v.histogram);
    s.crossover = std::abs(v.macd - v.signal) < kCrossoverTolerance;
    return s;
}

std::optional<double> TechnicalSignalEngine::calculateRSI(const std::vector<double>& prices, int period) const {
    if (!backend_) {
        warnUnavailable();
        return std::nullopt;
    }
    try {
        return backend_->rsi(prices, period);
    } catch (const std::exception& e) {
        LOG_ERROR("RSI calculation failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<BollingerSnapshot> TechnicalSignalEngine::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) const {
    if (!backend_) {
        warnUnavailable();
        return std::nullopt;
    }
    try {
        auto values = backend_->bollinger(prices, period, std_dev_mult);
        if (!values) return std::nullopt;
        return toSnapshot(*values);
    } catch (const std::exception& e) {
        LOG_ERROR("Bollinger calculation failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<MACDSnapshot> TechnicalSignalEngine::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal
) const {
    if (!backend_) {
        warnUnavailable();
        return std::nullopt;
    }
    try {
        auto values = backend_->macd(prices, fast, slow, signal);
        if (!values) return std::nullopt;
        return toSnapshot(*values);
    } catch (const std::exception& e) {
        LOG_ERROR("MACD calculation failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<double> TechnicalSignalEngine::calculateATR(
    const std::vector<double>& high,
    const std::vector<double>& low,
    const std::vector<double>& close,
    int period
) const {
    if (!backend_) {
        warnUnavailable();
        return std::nullopt;
    }
    try {
        return backend_->atr(high, low, close, period);
    } catch (const std::exception& e) {
        LOG_ERROR("ATR calculation failed: {}", e.what());
        return std::nullopt;
    }
}

IndicatorSnapshot TechnicalSignalEngine::analyze(
    const std::vector<double>& prices,
    const std::optional<std::vector<double>>& high,
    const std::optional<std::vector<double>>& low
) const {
    IndicatorSnapshot analysis;

    if (!backend_) {
        warnUnavailable();
        analysis.error = kBackendUnavailable;
        return analysis;
    }

    try {
        analysis.rsi = backend_->rsi(prices, config_.rsi_period);

        if (auto bb = backend_->bollinger(prices, config_.bb_period, config_.bb_std_mult)) {
            analysis.bbands = toSnapshot(*bb);
        }

        if (auto m = backend_->macd(prices, config_.macd_fast, config_.macd_slow, config_.macd_signal)) {
            analysis.macd = toSnapshot(*m);
        }

        if (high && low) {
            analysis.atr = backend_->atr(*high, *low, prices, config_.atr_period);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Technical analysis failed: {}", e.what());
        IndicatorSnapshot failed;
        failed.error = kBackendUnavailable;
        return failed;
    }

    // 개별 지표 임계값 태그
    if (analysis.rsi) {
        if (*analysis.rsi < kRsiOversold) {
            analysis.signals.push_back("RSI_OVERSOLD");
        } else if (*analysis.rsi > kRsiOverbought) {
            analysis.signals.push_back("RSI_OVERBOUGHT");
        }
    }

    if (analysis.bbands) {
        analysis.signals.push_back(std::string("BB_") + toString(analysis.bbands->signal));
    }

    if (analysis.macd) {
        analysis.signals.push_back(std::string("MACD_") + toString(analysis.macd->trend));
    }

    analysis.overall_signal = aggregate(analysis.signals);

    LOG_DEBUG("Technical analysis: rsi={} signals={} overall={}",
              analysis.rsi ? *analysis.rsi : -1.0,
              analysis.signals.size(),
              toString(analysis.overall_signal));

    return analysis;
}

IndicatorSnapshot TechnicalSignalEngine::analyze(const PriceSeries& series) const {
    const auto closes = extractCloses(series);

    // 모든 bar에 high/low가 있어야 ATR 계산
    bool has_range = !series.empty() &&
        std::all_of(series.begin(), series.end(), [](const PriceBar& b) { return b.has_range; });

    if (!has_range) {
        return analyze(closes);
    }

    std::vector<double> highs;
    std::vector<double> lows;
    highs.reserve(series.size());
    lows.reserve(series.size());
    for (const auto& bar : series) {
        highs.push_back(bar.high);
        lows.push_back(bar.low);
    }
    return analyze(closes, highs, lows);
}

} // namespace analytics
} // namespace thetadesk
