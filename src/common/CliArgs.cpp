#include "common/CliArgs.h"

#include <stdexcept>

namespace thetadesk {
namespace cli {

namespace {
constexpr int kMaxLookbackDays = 3650;
}

double parseDouble(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
}

int parseInt(const std::string& flag, const std::string& value, int min_value, int max_value) {
    int v = 0;
    try {
        size_t used = 0;
        v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
    } catch (const std::exception&) {
        // out_of_range 포함 (int 범위 초과)
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (v < min_value || v > max_value) {
        throw std::invalid_argument(flag + " must be between " + std::to_string(min_value) +
                                    " and " + std::to_string(max_value) + ", got " + value);
    }
    return v;
}

int parseLookbackDays(const std::string& value) {
    return parseInt("--lookback", value, 1, kMaxLookbackDays);
}

} // namespace cli
} // namespace thetadesk
