#include "common/CliArgs.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace thetadesk;

namespace {

bool rejectsLookback(const std::string& value) {
    try {
        cli::parseLookbackDays(value);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting CliArgs Test..." << std::endl;

    // 1. 정상 범위
    assert(cli::parseLookbackDays("252") == 252);
    assert(cli::parseLookbackDays("1") == 1);
    assert(cli::parseLookbackDays("3650") == 3650);

    // 2. int 범위 밖 / 범위 밖 / 음수 / 0
    assert(rejectsLookback("1e10"));
    assert(rejectsLookback("99999999999999999999"));
    assert(rejectsLookback("3651"));
    assert(rejectsLookback("-5"));
    assert(rejectsLookback("0"));

    // 3. 정수가 아닌 입력
    assert(rejectsLookback("252.5"));
    assert(rejectsLookback("abc"));
    assert(rejectsLookback(""));
    assert(rejectsLookback("30days"));

    // 4. 에러 메시지에 flag 포함
    try {
        cli::parseLookbackDays("1e10");
        assert(false);
    } catch (const std::invalid_argument& e) {
        assert(std::string(e.what()).find("--lookback") != std::string::npos);
    }

    // 5. 실수 인자
    assert(std::abs(cli::parseDouble("--vix", "18.5") - 18.5) < 1e-12);
    bool threw = false;
    try {
        cli::parseDouble("--vix", "18.5x");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[TEST] CliArgs PASSED" << std::endl;
    return 0;
}
