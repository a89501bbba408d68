#include "analytics/BuiltinIndicatorBackend.h"
#include "analytics/TechnicalIndicators.h"

namespace thetadesk {
namespace analytics {

std::optional<double> BuiltinIndicatorBackend::rsi(const std::vector<double>& prices, int period) const {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }
    return TechnicalIndicators::calculateRSI(prices, period);
}

std::optional<core::BollingerValues> BuiltinIndicatorBackend::bollinger(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) const {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }

    auto bb = TechnicalIndicators::calculateBollingerBands(prices, prices.back(), period, std_dev_mult);

    core::BollingerValues out;
    out.upper = bb.upper;
    out.middle = bb.middle;
    out.lower = bb.lower;
    out.width = bb.width;
    out.position = bb.percent_b;
    return out;
}

std::optional<core::MACDValues> BuiltinIndicatorBackend::macd(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal
) const {
    if (fast <= 0 || slow <= 0 || signal <= 0 ||
        prices.size() < static_cast<size_t>(slow + signal)) {
        return std::nullopt;
    }

    auto m = TechnicalIndicators::calculateMACD(prices, fast, slow, signal);

    core::MACDValues out;
    out.macd = m.macd;
    out.signal = m.signal;
    out.histogram = m.histogram;
    return out;
}

std::optional<double> BuiltinIndicatorBackend::atr(
    const std::vector<double>& high,
    const std::vector<double>& low,
    const std::vector<double>& close,
    int period
) const {
    if (period <= 0 || close.size() < static_cast<size_t>(period + 1) ||
        high.size() != close.size() || low.size() != close.size()) {
        return std::nullopt;
    }
    return TechnicalIndicators::calculateATR(high, low, close, period);
}

} // namespace analytics
} // namespace thetadesk
