#include "risk/SpreadValidator.h"
#include "common/Logger.h"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <limits>

namespace thetadesk {
namespace risk {

const char* toString(SpreadAction action) {
    return action == SpreadAction::PROCEED ? "PROCEED" : "SKIP";
}

const char* toString(SpreadReason reason) {
    switch (reason) {
        case SpreadReason::ACCEPTABLE: return "ACCEPTABLE";
        case SpreadReason::BID_TOO_LOW: return "BID_TOO_LOW";
        case SpreadReason::INVALID_PRICES: return "INVALID_PRICES";
        case SpreadReason::CROSSED_MARKET: return "CROSSED_MARKET";
        case SpreadReason::SPREAD_PCT_TOO_WIDE: return "SPREAD_PCT_TOO_WIDE";
        case SpreadReason::SPREAD_DOLLARS_TOO_WIDE: return "SPREAD_DOLLARS_TOO_WIDE";
    }
    return "UNKNOWN";
}

nlohmann::json SpreadVerdict::toJson() const {
    nlohmann::json j = {
        {"valid", valid},
        {"reason_code", toString(reason_code)},
        {"reason", reason},
        {"bid", bid},
        {"ask", ask},
        {"action", toString(action)}
    };
    if (mid) j["mid"] = *mid;
    // +inf는 JSON에서 null로 직렬화됨
    if (spread_pct) j["spread_pct"] = std::isfinite(*spread_pct) ? nlohmann::json(*spread_pct) : nlohmann::json(nullptr);
    if (spread_dollars) j["spread_dollars"] = *spread_dollars;
    return j;
}

nlohmann::json ChainValidation::toJson() const {
    auto rows = [](const std::vector<ValidatedOption>& list) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : list) {
            arr.push_back({
                {"option", {
                    {"symbol", item.option.symbol},
                    {"strike", item.option.strike},
                    {"bid", item.option.bid},
                    {"ask", item.option.ask}
                }},
                {"validation", item.validation.toJson()}
            });
        }
        return arr;
    };

    return {
        {"valid", valid},
        {"valid_count", valid_count},
        {"invalid_count", invalid_count},
        {"required", required},
        {"valid_options", rows(valid_options)},
        {"invalid_options", rows(invalid_options)}
    };
}

SpreadValidator::SpreadValidator(SpreadConfig config)
    : config_(config)
{}

SpreadVerdict SpreadValidator::validateOptionSpread(
    double bid,
    double ask,
    const std::string& symbol,
    double strike
) const {
    SpreadVerdict verdict;
    verdict.bid = bid;
    verdict.ask = ask;
    verdict.action = SpreadAction::SKIP;

    // 1. 최소 bid
    if (bid < config_.min_bid) {
        verdict.reason_code = SpreadReason::BID_TOO_LOW;
        verdict.reason = fmt::format("Bid too low ({:.2f} < {:.2f})", bid, config_.min_bid);
        return verdict;
    }

    // 2. 비정상 가격
    if (bid <= 0.0 || ask <= 0.0) {
        verdict.reason_code = SpreadReason::INVALID_PRICES;
        verdict.reason = fmt::format("Invalid prices (bid={:.2f}, ask={:.2f})", bid, ask);
        return verdict;
    }

    // 3. bid > ask (crossed market)
    if (bid > ask) {
        verdict.reason_code = SpreadReason::CROSSED_MARKET;
        verdict.reason = fmt::format("Bid > Ask ({:.2f} > {:.2f}) - data error", bid, ask);
        return verdict;
    }

    // 4. mid / spread
    const double mid = (bid + ask) / 2.0;
    const double spread_dollars = ask - bid;
    const double spread_pct = (mid > 0.0) ? spread_dollars / mid : std::numeric_limits<double>::infinity();

    verdict.mid = mid;
    verdict.spread_pct = spread_pct;
    verdict.spread_dollars = spread_dollars;

    // 5. 비율 스프레드
    if (spread_pct > config_.max_spread_pct) {
        verdict.reason_code = SpreadReason::SPREAD_PCT_TOO_WIDE;
        verdict.reason = fmt::format("Spread too wide ({:.1f}% > {:.1f}%)",
                                     spread_pct * 100.0, config_.max_spread_pct * 100.0);
        return verdict;
    }

    // 6. 절대 스프레드
    if (spread_dollars > config_.max_spread_dollars) {
        verdict.reason_code = SpreadReason::SPREAD_DOLLARS_TOO_WIDE;
        verdict.reason = fmt::format("Spread too wide (${:.2f} > ${:.2f})",
                                     spread_dollars, config_.max_spread_dollars);
        return verdict;
    }

    LOG_DEBUG("Spread OK: {} {} - Bid={:.2f}, Ask={:.2f}, Mid={:.2f}, Spread={:.1f}% (${:.2f})",
              symbol, strike, bid, ask, mid, spread_pct * 100.0, spread_dollars);

    verdict.valid = true;
    verdict.reason_code = SpreadReason::ACCEPTABLE;
    verdict.reason = "Spread acceptable";
    verdict.action = SpreadAction::PROCEED;
    return verdict;
}

ChainValidation SpreadValidator::validateOptionsChain(
    const std::vector<OptionQuote>& options,
    int required_valid
) const {
    ChainValidation result;
    result.required = required_valid;

    for (const auto& opt : options) {
        auto verdict = validateOptionSpread(opt.bid, opt.ask, opt.symbol, opt.strike);
        if (verdict.valid) {
            result.valid_options.push_back({opt, std::move(verdict)});
        } else {
            result.invalid_options.push_back({opt, std::move(verdict)});
        }
    }

    result.valid_count = static_cast<int>(result.valid_options.size());
    result.invalid_count = static_cast<int>(result.invalid_options.size());
    result.valid = result.valid_count >= required_valid;

    if (!result.valid) {
        LOG_WARN("Options chain rejected: {} valid of {} (required {})",
                 result.valid_count, options.size(), required_valid);
    }
    return result;
}

} // namespace risk
} // namespace thetadesk
