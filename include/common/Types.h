#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <utility>

namespace thetadesk {

using Timestamp = std::chrono::system_clock::time_point;

// 일봉 샘플 - close는 필수, high/low는 데이터 소스에 따라 없을 수 있음
struct PriceBar {
    long long timestamp;    // epoch ms
    double close;
    double high;
    double low;
    bool has_range;         // high/low 유효 여부

    PriceBar() : timestamp(0), close(0), high(0), low(0), has_range(false) {}

    PriceBar(long long t, double c)
        : timestamp(t), close(c), high(0), low(0), has_range(false) {}

    PriceBar(long long t, double c, double h, double l)
        : timestamp(t), close(c), high(h), low(l), has_range(true) {}
};

// ascending by timestamp, no duplicates
using PriceSeries = std::vector<PriceBar>;

enum class TermStructure { CONTANGO, BACKWARDATION, NEUTRAL, UNKNOWN };

enum class OverallSignal { BULLISH, BEARISH, NEUTRAL };

struct OptionQuote {
    std::string symbol;
    double strike;
    double bid;
    double ask;

    OptionQuote() : strike(0), bid(0), ask(0) {}
    OptionQuote(std::string sym, double k, double b, double a)
        : symbol(std::move(sym)), strike(k), bid(b), ask(a) {}
};

inline const char* toString(TermStructure s) {
    switch (s) {
        case TermStructure::CONTANGO: return "CONTANGO";
        case TermStructure::BACKWARDATION: return "BACKWARDATION";
        case TermStructure::NEUTRAL: return "NEUTRAL";
        default: return "UNKNOWN";
    }
}

inline const char* toString(OverallSignal s) {
    switch (s) {
        case OverallSignal::BULLISH: return "BULLISH";
        case OverallSignal::BEARISH: return "BEARISH";
        default: return "NEUTRAL";
    }
}

// Helper: close 가격 배열 추출
inline std::vector<double> extractCloses(const PriceSeries& series) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& bar : series) {
        out.push_back(bar.close);
    }
    return out;
}

inline long long toEpochMs(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

} // namespace thetadesk
