#pragma once

#include "core/contracts/IIndicatorBackend.h"

namespace thetadesk {
namespace analytics {

// TechnicalIndicators 기반 기본 backend
class BuiltinIndicatorBackend : public core::IIndicatorBackend {
public:
    std::optional<double> rsi(const std::vector<double>& prices, int period) const override;

    std::optional<core::BollingerValues> bollinger(
        const std::vector<double>& prices, int period, double std_dev_mult) const override;

    std::optional<core::MACDValues> macd(
        const std::vector<double>& prices, int fast, int slow, int signal) const override;

    std::optional<double> atr(
        const std::vector<double>& high,
        const std::vector<double>& low,
        const std::vector<double>& close,
        int period) const override;
};

} // namespace analytics
} // namespace thetadesk
