#pragma once

#include <filesystem>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "core/contracts/IModelStore.h"
#include "ml/RegressionForest.h"

namespace thetadesk {
namespace ml {

enum class DTEMode { COLD, WARM };

struct DTEWindow {
    int min_dte;
    int max_dte;

    bool operator==(const DTEWindow& other) const {
        return min_dte == other.min_dte && max_dte == other.max_dte;
    }
    bool operator!=(const DTEWindow& other) const { return !(*this == other); }

    nlohmann::json toJson() const { return {{"min_dte", min_dte}, {"max_dte", max_dte}}; }
};

// VIX term structure (VIX / VIX3M) + IV rank
struct RegimeFeatures {
    double vix_ratio = 1.0;
    TermStructure structure = TermStructure::UNKNOWN;
    double iv_rank = 50.0;
};

// DTE 선택 모델
// - Contango (ratio < 0.95): 45-60일, theta/premium 수집
// - Backwardation (ratio > 1.05) 또는 IV rank > 80: 21-30일, vega crush
// - 그 외: 30-45일
// 학습된 모델이 있으면(WARM) 예측값 +-7일 window, 없으면(COLD) 위 규칙 사용
class DTEOptimizer {
public:
    static constexpr int kMinDTE = 21;
    static constexpr int kMaxDTE = 60;
    static constexpr int kWindowHalfWidth = 7;
    static constexpr double kBackwardationRatio = 1.05;
    static constexpr double kContangoRatio = 0.95;
    static constexpr double kPanicIVRank = 80.0;
    static constexpr size_t kNumFeatures = 2;     // [vix_ratio, iv_rank]

    static constexpr DTEWindow kShortWindow{21, 30};
    static constexpr DTEWindow kLongWindow{45, 60};
    static constexpr DTEWindow kDefaultWindow{30, 45};

    // 생성 시 저장된 모델을 probe - 실패해도 COLD로 시작
    DTEOptimizer(std::shared_ptr<core::IModelStore> store, std::filesystem::path model_path);

    // 항상 21 <= min <= max <= 60. 어떤 실패든 (30, 45)
    DTEWindow predictOptimalDTE(const RegimeFeatures& features) const;

    // X: [vix_ratio, iv_rank] 행, y: optimal DTE
    // 실패 시 기존 모델 유지, false 반환
    bool train(const std::vector<std::vector<double>>& X, const std::vector<double>& y);

    DTEMode mode() const;
    const std::filesystem::path& modelPath() const { return model_path_; }

    static DTEWindow ruleBasedDTE(double vix_ratio, double iv_rank);
    static DTEWindow windowAround(double predicted_dte);
    static TermStructure classifyStructure(double vix_ratio);
    static RegimeFeatures makeFeatures(double vix, double vix3m, double iv_rank);

private:
    std::shared_ptr<const RegressionForest> snapshot() const;

    std::shared_ptr<core::IModelStore> store_;
    std::filesystem::path model_path_;

    mutable std::mutex mutex_;
    std::shared_ptr<const RegressionForest> model_;
};

const char* toString(DTEMode mode);

} // namespace ml
} // namespace thetadesk
