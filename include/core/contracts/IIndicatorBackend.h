#pragma once

#include <optional>
#include <vector>

namespace thetadesk {
namespace core {

struct BollingerValues {
    double upper = 0.0;
    double middle = 0.0;
    double lower = 0.0;
    double width = 0.0;
    double position = 0.5;
};

struct MACDValues {
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
};

// 지표 계산 primitive - 입력 길이가 부족하면 nullopt
class IIndicatorBackend {
public:
    virtual ~IIndicatorBackend() = default;

    virtual std::optional<double> rsi(const std::vector<double>& prices, int period) const = 0;

    virtual std::optional<BollingerValues> bollinger(
        const std::vector<double>& prices, int period, double std_dev_mult) const = 0;

    virtual std::optional<MACDValues> macd(
        const std::vector<double>& prices, int fast, int slow, int signal) const = 0;

    virtual std::optional<double> atr(
        const std::vector<double>& high,
        const std::vector<double>& low,
        const std::vector<double>& close,
        int period) const = 0;
};

} // namespace core
} // namespace thetadesk
