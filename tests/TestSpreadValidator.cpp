#include "risk/SpreadValidator.h"

#include <cassert>
#include <cmath>
#include <iostream>

using thetadesk::OptionQuote;
using thetadesk::SpreadConfig;
using thetadesk::risk::SpreadAction;
using thetadesk::risk::SpreadReason;
using thetadesk::risk::SpreadValidator;

int main() {
    SpreadValidator validator;

    // bid 최소값 미달
    {
        auto v = validator.validateOptionSpread(0.03, 0.10);
        assert(!v.valid);
        assert(v.reason_code == SpreadReason::BID_TOO_LOW);
        assert(v.reason.find("Bid too low") != std::string::npos);
        assert(v.action == SpreadAction::SKIP);
        assert(!v.mid.has_value());
    }

    // crossed market
    {
        auto v = validator.validateOptionSpread(1.00, 0.90);
        assert(!v.valid);
        assert(v.reason_code == SpreadReason::CROSSED_MARKET);
        assert(v.reason.find("data error") != std::string::npos);
        assert(v.action == SpreadAction::SKIP);
    }

    // 26% spread > 20%
    {
        auto v = validator.validateOptionSpread(1.00, 1.30);
        assert(!v.valid);
        assert(v.reason_code == SpreadReason::SPREAD_PCT_TOO_WIDE);
        assert(v.reason.find("Spread too wide") != std::string::npos);
        assert(v.mid.has_value() && v.spread_pct.has_value() && v.spread_dollars.has_value());
        assert(std::abs(*v.spread_pct - 0.30 / 1.15) < 1e-9);
    }

    // 정상
    {
        auto v = validator.validateOptionSpread(1.00, 1.05, "SPY", 450.0);
        assert(v.valid);
        assert(v.action == SpreadAction::PROCEED);
        assert(v.reason_code == SpreadReason::ACCEPTABLE);
        assert(v.mid.has_value() && std::abs(*v.mid - 1.025) < 1e-12);
        assert(v.spread_pct.has_value() && std::abs(*v.spread_pct - 0.0487804878) < 1e-6);
        assert(v.spread_dollars.has_value() && std::abs(*v.spread_dollars - 0.05) < 1e-12);
    }

    // 비율은 통과, 절대값 초과 (mid 10.5, spread 0.6 = 5.7%)
    {
        auto v = validator.validateOptionSpread(10.20, 10.80);
        assert(!v.valid);
        assert(v.reason_code == SpreadReason::SPREAD_DOLLARS_TOO_WIDE);
        assert(v.reason.find("$") != std::string::npos);
    }

    // min_bid가 0이면 non-positive 가격 검사가 적용됨
    {
        SpreadConfig cfg;
        cfg.min_bid = 0.0;
        SpreadValidator permissive(cfg);
        auto v = permissive.validateOptionSpread(0.0, 0.10);
        assert(!v.valid);
        assert(v.reason_code == SpreadReason::INVALID_PRICES);

        auto w = permissive.validateOptionSpread(0.10, -0.10);
        assert(!w.valid);
        assert(w.reason_code == SpreadReason::INVALID_PRICES);
    }

    // 정확히 경계값은 통과 (20% / $0.50 초과만 실패)
    {
        SpreadConfig cfg;
        cfg.max_spread_pct = 0.25;
        SpreadValidator boundary(cfg);
        auto v = boundary.validateOptionSpread(2.00, 2.50);
        assert(v.valid);
    }

    // chain: 2 valid + 1 invalid, required 2
    {
        std::vector<OptionQuote> chain = {
            {"SPY", 440.0, 1.00, 1.05},
            {"SPY", 445.0, 1.00, 0.90},
            {"SPY", 450.0, 2.00, 2.10}
        };
        const auto before = chain;

        auto result = validator.validateOptionsChain(chain, 2);
        assert(result.valid);
        assert(result.valid_count == 2);
        assert(result.invalid_count == 1);
        assert(result.required == 2);
        assert(result.valid_options.size() == 2);
        assert(result.valid_options[0].option.strike == 440.0);
        assert(result.valid_options[1].option.strike == 450.0);
        assert(result.invalid_options[0].validation.reason_code == SpreadReason::CROSSED_MARKET);

        // 입력 불변
        for (size_t i = 0; i < chain.size(); ++i) {
            assert(chain[i].strike == before[i].strike);
            assert(chain[i].bid == before[i].bid);
        }

        auto strict = validator.validateOptionsChain(chain, 3);
        assert(!strict.valid);
        assert(strict.valid_count == 2);
    }

    // 빈 chain
    {
        auto result = validator.validateOptionsChain({}, 2);
        assert(!result.valid);
        assert(result.valid_count == 0 && result.invalid_count == 0);

        auto zero = validator.validateOptionsChain({}, 0);
        assert(zero.valid);
    }

    // JSON 직렬화
    {
        auto v = validator.validateOptionSpread(1.00, 1.05);
        auto j = v.toJson();
        assert(j["action"] == "PROCEED");
        assert(j.contains("mid"));
    }

    std::cout << "[TEST] SpreadValidator PASSED\n";
    return 0;
}
