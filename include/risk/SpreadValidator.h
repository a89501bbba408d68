#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/PipelineConfig.h"
#include "common/Types.h"

namespace thetadesk {
namespace risk {

enum class SpreadAction { PROCEED, SKIP };

enum class SpreadReason {
    ACCEPTABLE,
    BID_TOO_LOW,
    INVALID_PRICES,
    CROSSED_MARKET,     // bid > ask - data error
    SPREAD_PCT_TOO_WIDE,
    SPREAD_DOLLARS_TOO_WIDE
};

const char* toString(SpreadAction action);
const char* toString(SpreadReason reason);

struct SpreadVerdict {
    bool valid = false;
    SpreadReason reason_code = SpreadReason::INVALID_PRICES;
    std::string reason;
    double bid = 0.0;
    double ask = 0.0;
    std::optional<double> mid;
    std::optional<double> spread_pct;
    std::optional<double> spread_dollars;
    SpreadAction action = SpreadAction::SKIP;

    nlohmann::json toJson() const;
};

struct ValidatedOption {
    OptionQuote option;
    SpreadVerdict validation;
};

struct ChainValidation {
    bool valid = false;
    int valid_count = 0;
    int invalid_count = 0;
    int required = 0;
    std::vector<ValidatedOption> valid_options;
    std::vector<ValidatedOption> invalid_options;

    nlohmann::json toJson() const;
};

// Bid-Ask spread 유동성 검증
// 넓은 스프레드 = 유동성 부족, stale 데이터, 마켓메이커 이탈
class SpreadValidator {
public:
    explicit SpreadValidator(SpreadConfig config = SpreadConfig{});

    // 첫 번째 실패 조건에서 즉시 반환
    SpreadVerdict validateOptionSpread(double bid, double ask,
                                       const std::string& symbol = "",
                                       double strike = 0.0) const;

    // quote별 독립 검증, 입력 순서 유지
    ChainValidation validateOptionsChain(const std::vector<OptionQuote>& options,
                                         int required_valid = 2) const;

    const SpreadConfig& config() const { return config_; }

private:
    SpreadConfig config_;
};

} // namespace risk
} // namespace thetadesk
