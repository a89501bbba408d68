#pragma once

#include <string>

namespace thetadesk {
namespace cli {

// 숫자 인자 파싱 - 전체 문자열이 숫자여야 함, 실패 시 std::invalid_argument
double parseDouble(const std::string& flag, const std::string& value);

// 정수 인자 파싱 + [min_value, max_value] 범위 검사
int parseInt(const std::string& flag, const std::string& value, int min_value, int max_value);

// --lookback: 1 ~ 3650 일
int parseLookbackDays(const std::string& value);

} // namespace cli
} // namespace thetadesk
