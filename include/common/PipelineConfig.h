#pragma once

#include <string>

namespace thetadesk {

struct IVRankConfig {
    int cache_ttl_seconds = 3600;   // 1시간
    int lookback_days = 252;
    int hv_window = 20;             // rolling std window (returns)
    int min_samples = 20;
    std::string data_dir = "data";
};

struct IndicatorConfig {
    int rsi_period = 14;
    int bb_period = 20;
    double bb_std_mult = 2.0;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;
    int atr_period = 14;
};

struct DTEConfig {
    std::string model_path = "models/dte_optimizer_rf.json";
};

struct SpreadConfig {
    double max_spread_pct = 0.20;       // 20% of mid
    double max_spread_dollars = 0.50;
    double min_bid = 0.05;
    int required_valid = 2;
};

} // namespace thetadesk
