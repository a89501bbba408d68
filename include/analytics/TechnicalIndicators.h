#pragma once

#include <vector>
#include <string>

namespace thetadesk {
namespace analytics {

// Technical Indicators - 검증된 공식으로 구현
// 데이터 부족 시 sentinel 값을 반환하므로, 호출 측에서 샘플 수를 먼저 확인할 것
class TechnicalIndicators {
public:
    // RSI (Relative Strength Index) - 14일 기준
    // 70 이상: 과매수, 30 이하: 과매도
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    // MACD (Moving Average Convergence Divergence)
    struct MACDResult {
        double macd;        // MACD 선
        double signal;      // Signal 선
        double histogram;   // MACD - Signal

        MACDResult() : macd(0), signal(0), histogram(0) {}
    };
    static MACDResult calculateMACD(const std::vector<double>& prices,
                                     int fast = 12, int slow = 26, int signal_period = 9);

    // Bollinger Bands - 가격 밴드
    struct BollingerBands {
        double upper;       // 상단 밴드
        double middle;      // 중간선 (SMA)
        double lower;       // 하단 밴드
        double width;       // 밴드 폭 (upper - lower)
        double percent_b;   // %B (현재가가 밴드 내 어디에 위치하는지, 돌파 시 0~1 밖)

        BollingerBands() : upper(0), middle(0), lower(0), width(0), percent_b(0) {}
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                    double current_price,
                                                    int period = 20,
                                                    double std_dev_mult = 2.0);

    // ATR (Average True Range) - Wilder smoothing
    static double calculateATR(const std::vector<double>& high,
                               const std::vector<double>& low,
                               const std::vector<double>& close,
                               int period = 14);

    // EMA (Exponential Moving Average) - 최근 가격에 더 큰 가중치
    static double calculateEMA(const std::vector<double>& prices, int period);
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // SMA (Simple Moving Average) - 단순 이동평균
    static double calculateSMA(const std::vector<double>& prices, int period);

    // 단순 수익률 (p[i] / p[i-1] - 1), 유한하지 않은 값은 제외
    static std::vector<double> calculateReturns(const std::vector<double>& prices);

    // Rolling 표준편차 (sample, n-1) - window가 모두 채워진 시점부터 1개씩
    static std::vector<double> calculateRollingStdDev(const std::vector<double>& values, int window);

    static double calculateMean(const std::vector<double>& values);
    // population (n) 표준편차
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    // sample (n-1) 표준편차
    static double calculateSampleStdDev(const std::vector<double>& values);
};

} // namespace analytics
} // namespace thetadesk
