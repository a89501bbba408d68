#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace thetadesk {
namespace analytics {

// RSI 계산 (Wilder's Smoothing 방식)
double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // 1. 초기 평균 (첫 period 기간)
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    // 2. Wilder's Smoothing 적용 (끝까지 순회)
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss < 0.0000001) {
        // 변동 없음 -> 중립
        return (avg_gain < 0.0000001) ? 50.0 : 100.0;
    }

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

// MACD 계산
TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDResult result;

    if (fast <= 0 || slow <= 0 || signal_period <= 0 ||
        prices.size() < static_cast<size_t>(slow + signal_period)) {
        return result;
    }

    auto fast_ema_vec = calculateEMAVector(prices, fast);
    auto slow_ema_vec = calculateEMAVector(prices, slow);
    if (fast_ema_vec.empty() || slow_ema_vec.empty()) return result;

    // 벡터 길이가 다르므로 끝(최신)에서부터 맞춰 MACD 시계열 생성
    std::vector<double> macd_series;
    size_t min_size = std::min(fast_ema_vec.size(), slow_ema_vec.size());
    size_t offset_fast = fast_ema_vec.size() - min_size;
    size_t offset_slow = slow_ema_vec.size() - min_size;
    macd_series.reserve(min_size);

    for (size_t i = 0; i < min_size; ++i) {
        macd_series.push_back(fast_ema_vec[offset_fast + i] - slow_ema_vec[offset_slow + i]);
    }

    result.macd = macd_series.back();
    // Signal Line = MACD 시계열의 EMA
    result.signal = calculateEMA(macd_series, signal_period);
    result.histogram = result.macd - result.signal;

    return result;
}

// Bollinger Bands 계산
TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    double current_price,
    int period,
    double std_dev_mult
) {
    BollingerBands result;

    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    // 마지막(최신) period 개수만 추출
    std::vector<double> recent_prices(prices.end() - period, prices.end());

    // Middle Band (SMA)
    result.middle = calculateSMA(recent_prices, period);

    double std_dev = calculateStandardDeviation(recent_prices, result.middle);

    result.upper = result.middle + (std_dev * std_dev_mult);
    result.lower = result.middle - (std_dev * std_dev_mult);
    result.width = result.upper - result.lower;

    if (result.width > 0.0) {
        result.percent_b = (current_price - result.lower) / result.width;
    } else {
        result.percent_b = 0.5;
    }

    return result;
}

// ATR 계산 (Average True Range)
double TechnicalIndicators::calculateATR(
    const std::vector<double>& high,
    const std::vector<double>& low,
    const std::vector<double>& close,
    int period
) {
    const size_t n = close.size();
    if (period <= 0 || high.size() != n || low.size() != n ||
        n < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    std::vector<double> tr_values;
    tr_values.reserve(n);

    // 첫 TR은 0번째와 1번째 사이에서 발생
    for (size_t i = 1; i < n; ++i) {
        double tr1 = high[i] - low[i];
        double tr2 = std::abs(high[i] - close[i-1]);
        double tr3 = std::abs(low[i] - close[i-1]);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }

    // 초기 ATR (첫 period 개의 평균)
    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    // Wilder's Smoothing으로 끝까지 갱신
    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }

    return atr;
}

// EMA 계산 (Exponential Moving Average)
double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty()) return 0.0;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return prices.back();

    double multiplier = 2.0 / (period + 1.0);

    // 초기 SMA (앞에서부터 period 개)
    double ema = 0.0;
    for (int i = 0; i < period; ++i) {
        ema += prices[i];
    }
    ema /= period;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
    }

    return ema;
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return ema_values;

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;

    ema_values.push_back(ema); // period 시점의 EMA

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

// SMA 계산 (Simple Moving Average)
double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    // 마지막(최신) period 개수의 평균
    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

std::vector<double> TechnicalIndicators::calculateReturns(const std::vector<double>& prices) {
    std::vector<double> returns;
    if (prices.size() < 2) return returns;
    returns.reserve(prices.size() - 1);

    for (size_t i = 1; i < prices.size(); ++i) {
        double r = prices[i] / prices[i-1] - 1.0;
        if (std::isfinite(r)) {
            returns.push_back(r);
        }
    }
    return returns;
}

std::vector<double> TechnicalIndicators::calculateRollingStdDev(
    const std::vector<double>& values,
    int window
) {
    std::vector<double> out;
    if (window < 2 || values.size() < static_cast<size_t>(window)) return out;
    out.reserve(values.size() - window + 1);

    for (size_t end = window; end <= values.size(); ++end) {
        std::vector<double> slice(values.begin() + (end - window), values.begin() + end);
        out.push_back(calculateSampleStdDev(slice));
    }
    return out;
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

double TechnicalIndicators::calculateSampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double mean = calculateMean(values);
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / (values.size() - 1));
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace analytics
} // namespace thetadesk
