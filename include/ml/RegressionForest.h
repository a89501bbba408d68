#pragma once

#include <cstdint>
#include <random>
#include <vector>
#include <nlohmann/json.hpp>

namespace thetadesk {
namespace ml {

// CART 회귀 트리 (분산 감소 기준 분할)
class RegressionTree {
public:
    struct TreeNode {
        int feature_idx = -1;   // -1 = leaf
        double threshold = 0.0;
        int left_child = -1;
        int right_child = -1;
        double leaf_value = 0.0;
    };

    void fit(const std::vector<std::vector<double>>& X,
             const std::vector<double>& y,
             const std::vector<size_t>& sample_indices,
             int max_depth,
             int min_samples_split);

    double predict(const std::vector<double>& x) const;

    const std::vector<TreeNode>& nodes() const { return nodes_; }
    nlohmann::json toJson() const;
    static RegressionTree fromJson(const nlohmann::json& j);

private:
    int build(const std::vector<std::vector<double>>& X,
              const std::vector<double>& y,
              std::vector<size_t>& indices,
              int depth,
              int max_depth,
              int min_samples_split);

    std::vector<TreeNode> nodes_;
};

// Bootstrap 앙상블 (random forest 회귀). 하이퍼파라미터는 고정
class RegressionForest {
public:
    static constexpr int kNumTrees = 100;
    static constexpr int kMaxDepth = 5;
    static constexpr int kMinSamplesSplit = 2;
    static constexpr uint32_t kRandomSeed = 42;
    static constexpr int kSchemaVersion = 1;

    // 입력 오류 시 std::invalid_argument
    void fit(const std::vector<std::vector<double>>& X, const std::vector<double>& y);

    // 학습 전이거나 feature 수가 다르면 std::invalid_argument
    double predict(const std::vector<double>& x) const;

    bool empty() const { return trees_.empty(); }
    size_t numTrees() const { return trees_.size(); }
    size_t numFeatures() const { return num_features_; }

    nlohmann::json toJson() const;
    // 형식 오류 시 std::invalid_argument / nlohmann::json::exception
    static RegressionForest fromJson(const nlohmann::json& j);

private:
    std::vector<RegressionTree> trees_;
    size_t num_features_ = 0;
};

} // namespace ml
} // namespace thetadesk
