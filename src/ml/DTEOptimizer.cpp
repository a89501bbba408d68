#include "ml/DTEOptimizer.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace thetadesk {
namespace ml {

const char* toString(DTEMode mode) {
    return mode == DTEMode::WARM ? "WARM" : "COLD";
}

DTEOptimizer::DTEOptimizer(std::shared_ptr<core::IModelStore> store, std::filesystem::path model_path)
    : store_(std::move(store))
    , model_path_(std::move(model_path))
{
    if (!store_) {
        LOG_WARN("No model store configured. Using rule-based DTE (Cold Start).");
        return;
    }

    try {
        auto loaded = store_->load(model_path_);
        if (loaded && !loaded->empty() && loaded->numFeatures() != kNumFeatures) {
            LOG_ERROR("DTE model {} expects {} features (need {}). Using rule-based fallback (Cold Start).",
                      model_path_.string(), loaded->numFeatures(), kNumFeatures);
        } else if (loaded && !loaded->empty()) {
            model_ = std::make_shared<const RegressionForest>(std::move(*loaded));
            LOG_INFO("Loaded DTE Optimizer model ({} trees) from {}", model_->numTrees(), model_path_.string());
        } else {
            LOG_INFO("No trained DTE model found. Using rule-based fallback (Cold Start).");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading DTE model: {}", e.what());
        model_.reset();
    }
}

DTEMode DTEOptimizer::mode() const {
    return snapshot() ? DTEMode::WARM : DTEMode::COLD;
}

std::shared_ptr<const RegressionForest> DTEOptimizer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

TermStructure DTEOptimizer::classifyStructure(double vix_ratio) {
    if (!std::isfinite(vix_ratio) || vix_ratio <= 0.0) return TermStructure::UNKNOWN;
    if (vix_ratio > kBackwardationRatio) return TermStructure::BACKWARDATION;
    if (vix_ratio < kContangoRatio) return TermStructure::CONTANGO;
    return TermStructure::NEUTRAL;
}

RegimeFeatures DTEOptimizer::makeFeatures(double vix, double vix3m, double iv_rank) {
    RegimeFeatures f;
    f.iv_rank = iv_rank;
    if (!std::isfinite(vix) || !std::isfinite(vix3m) || vix <= 0.0 || vix3m <= 0.0) {
        f.vix_ratio = 1.0;
        f.structure = TermStructure::UNKNOWN;
        return f;
    }
    f.vix_ratio = vix / vix3m;
    f.structure = classifyStructure(f.vix_ratio);
    return f;
}

DTEWindow DTEOptimizer::ruleBasedDTE(double vix_ratio, double iv_rank) {
    // BACKWARDATION (Panic) -> Short DTE
    if (vix_ratio > kBackwardationRatio || iv_rank > kPanicIVRank) {
        LOG_INFO("Term Structure: BACKWARDATION (Ratio {:.2f}, IV rank {:.1f}). Targeting short expiration (Vega Crush).",
                 vix_ratio, iv_rank);
        return kShortWindow;
    }

    // CONTANGO (Calm) -> Long DTE
    if (vix_ratio < kContangoRatio) {
        LOG_INFO("Term Structure: CONTANGO (Ratio {:.2f}). Targeting long expiration (Theta/Premium).", vix_ratio);
        return kLongWindow;
    }

    LOG_INFO("Term Structure: NEUTRAL (Ratio {:.2f}). Using standard expiration.", vix_ratio);
    return kDefaultWindow;
}

DTEWindow DTEOptimizer::windowAround(double predicted_dte) {
    // 중심값을 먼저 [21, 60]에 고정해야 min <= max 보장
    const double clamped = std::clamp(predicted_dte, static_cast<double>(kMinDTE), static_cast<double>(kMaxDTE));
    const int center = static_cast<int>(clamped);
    return DTEWindow{
        std::max(kMinDTE, center - kWindowHalfWidth),
        std::min(kMaxDTE, center + kWindowHalfWidth)
    };
}

DTEWindow DTEOptimizer::predictOptimalDTE(const RegimeFeatures& features) const {
    try {
        if (!std::isfinite(features.vix_ratio) || !std::isfinite(features.iv_rank)) {
            LOG_ERROR("Error predicting DTE: non-finite features (ratio={}, iv_rank={})",
                      features.vix_ratio, features.iv_rank);
            return kDefaultWindow;
        }

        auto model = snapshot();
        if (!model) {
            return ruleBasedDTE(features.vix_ratio, features.iv_rank);
        }

        const double predicted = model->predict({features.vix_ratio, features.iv_rank});
        if (!std::isfinite(predicted)) {
            LOG_ERROR("Error predicting DTE: model returned non-finite value");
            return kDefaultWindow;
        }

        const DTEWindow window = windowAround(predicted);
        LOG_INFO("ML DTE Prediction: {:.1f} days (Window: {}-{})", predicted, window.min_dte, window.max_dte);
        return window;

    } catch (const std::exception& e) {
        LOG_ERROR("Error predicting DTE: {}", e.what());
        return kDefaultWindow;
    }
}

bool DTEOptimizer::train(const std::vector<std::vector<double>>& X, const std::vector<double>& y) {
    if (!store_) {
        LOG_ERROR("Error training DTE model: no model store configured");
        return false;
    }

    // 예측은 항상 [vix_ratio, iv_rank] - 다른 폭의 모델은 저장/교체하지 않음
    for (const auto& row : X) {
        if (row.size() != kNumFeatures) {
            LOG_ERROR("Error training DTE model: expected {} features per row, got {}",
                      kNumFeatures, row.size());
            return false;
        }
    }

    try {
        auto fitted = std::make_shared<RegressionForest>();
        fitted->fit(X, y);

        if (!store_->save(*fitted, model_path_)) {
            LOG_ERROR("Error training DTE model: failed to save {}", model_path_.string());
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            model_ = std::move(fitted);
        }
        LOG_INFO("Trained and saved DTE Optimizer model ({} samples) to {}", X.size(), model_path_.string());
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Error training DTE model: {}", e.what());
        return false;
    }
}

} // namespace ml
} // namespace thetadesk
