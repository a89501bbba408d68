#include "ml/RegressionForest.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace thetadesk {
namespace ml {

namespace {
double meanOf(const std::vector<double>& y, const std::vector<size_t>& indices) {
    double sum = 0.0;
    for (size_t i : indices) sum += y[i];
    return indices.empty() ? 0.0 : sum / static_cast<double>(indices.size());
}
}

void RegressionTree::fit(const std::vector<std::vector<double>>& X,
                         const std::vector<double>& y,
                         const std::vector<size_t>& sample_indices,
                         int max_depth,
                         int min_samples_split) {
    nodes_.clear();
    std::vector<size_t> indices = sample_indices;
    build(X, y, indices, 0, max_depth, min_samples_split);
}

int RegressionTree::build(const std::vector<std::vector<double>>& X,
                          const std::vector<double>& y,
                          std::vector<size_t>& indices,
                          int depth,
                          int max_depth,
                          int min_samples_split) {
    const int node_idx = static_cast<int>(nodes_.size());
    TreeNode leaf;
    leaf.leaf_value = meanOf(y, indices);
    nodes_.push_back(leaf);

    const size_t n = indices.size();
    if (depth >= max_depth || n < static_cast<size_t>(min_samples_split)) {
        return node_idx;
    }

    // 부모 SSE
    double sum = 0.0, sum_sq = 0.0;
    for (size_t i : indices) {
        sum += y[i];
        sum_sq += y[i] * y[i];
    }
    const double parent_sse = sum_sq - (sum * sum) / static_cast<double>(n);
    if (parent_sse <= 1e-12) {
        return node_idx;    // 모든 target 동일
    }

    int best_feature = -1;
    double best_threshold = 0.0;
    double best_sse = std::numeric_limits<double>::infinity();

    const size_t num_features = X[indices.front()].size();
    std::vector<size_t> sorted = indices;

    for (size_t f = 0; f < num_features; ++f) {
        std::sort(sorted.begin(), sorted.end(),
                  [&](size_t a, size_t b) { return X[a][f] < X[b][f]; });

        double left_sum = 0.0, left_sq = 0.0;
        for (size_t k = 1; k < n; ++k) {
            const double yv = y[sorted[k - 1]];
            left_sum += yv;
            left_sq += yv * yv;

            const double lo = X[sorted[k - 1]][f];
            const double hi = X[sorted[k]][f];
            if (!(lo < hi)) continue;

            const double nl = static_cast<double>(k);
            const double nr = static_cast<double>(n - k);
            const double right_sum = sum - left_sum;
            const double right_sq = sum_sq - left_sq;
            const double sse = (left_sq - left_sum * left_sum / nl) +
                               (right_sq - right_sum * right_sum / nr);

            if (sse < best_sse) {
                best_sse = sse;
                best_feature = static_cast<int>(f);
                double mid = lo + (hi - lo) / 2.0;
                best_threshold = (mid < hi) ? mid : lo;
            }
        }
    }

    if (best_feature < 0 || best_sse >= parent_sse) {
        return node_idx;
    }

    std::vector<size_t> left_idx, right_idx;
    for (size_t i : indices) {
        if (X[i][best_feature] <= best_threshold) left_idx.push_back(i);
        else right_idx.push_back(i);
    }
    if (left_idx.empty() || right_idx.empty()) {
        return node_idx;
    }

    const int left = build(X, y, left_idx, depth + 1, max_depth, min_samples_split);
    const int right = build(X, y, right_idx, depth + 1, max_depth, min_samples_split);

    // push_back 이후이므로 인덱스로 다시 접근
    nodes_[node_idx].feature_idx = best_feature;
    nodes_[node_idx].threshold = best_threshold;
    nodes_[node_idx].left_child = left;
    nodes_[node_idx].right_child = right;
    return node_idx;
}

double RegressionTree::predict(const std::vector<double>& x) const {
    if (nodes_.empty()) {
        throw std::invalid_argument("empty regression tree");
    }
    int idx = 0;
    while (nodes_[idx].feature_idx >= 0) {
        const auto& node = nodes_[idx];
        idx = (x[node.feature_idx] <= node.threshold) ? node.left_child : node.right_child;
    }
    return nodes_[idx].leaf_value;
}

nlohmann::json RegressionTree::toJson() const {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& n : nodes_) {
        rows.push_back({n.feature_idx, n.threshold, n.left_child, n.right_child, n.leaf_value});
    }
    return {{"nodes", rows}};
}

RegressionTree RegressionTree::fromJson(const nlohmann::json& j) {
    RegressionTree tree;
    const auto& rows = j.at("nodes");
    if (!rows.is_array() || rows.empty()) {
        throw std::invalid_argument("tree without nodes");
    }

    for (const auto& row : rows) {
        if (!row.is_array() || row.size() != 5) {
            throw std::invalid_argument("malformed tree node");
        }
        TreeNode n;
        n.feature_idx = row[0].get<int>();
        n.threshold = row[1].get<double>();
        n.left_child = row[2].get<int>();
        n.right_child = row[3].get<int>();
        n.leaf_value = row[4].get<double>();
        tree.nodes_.push_back(n);
    }

    // 자식 인덱스는 항상 부모보다 뒤 (pre-order) - 순환 방지
    const int count = static_cast<int>(tree.nodes_.size());
    for (int i = 0; i < count; ++i) {
        const auto& n = tree.nodes_[i];
        if (n.feature_idx < 0) continue;
        if (n.left_child <= i || n.right_child <= i || n.left_child >= count || n.right_child >= count) {
            throw std::invalid_argument("tree node child index out of range");
        }
    }
    return tree;
}

void RegressionForest::fit(const std::vector<std::vector<double>>& X, const std::vector<double>& y) {
    if (X.empty() || X.size() != y.size()) {
        throw std::invalid_argument("feature/target size mismatch");
    }
    const size_t num_features = X.front().size();
    if (num_features == 0) {
        throw std::invalid_argument("empty feature vector");
    }
    for (size_t i = 0; i < X.size(); ++i) {
        if (X[i].size() != num_features) {
            throw std::invalid_argument("ragged feature matrix");
        }
        for (double v : X[i]) {
            if (!std::isfinite(v)) throw std::invalid_argument("non-finite feature value");
        }
        if (!std::isfinite(y[i])) throw std::invalid_argument("non-finite target value");
    }

    std::mt19937 rng(kRandomSeed);
    std::uniform_int_distribution<size_t> pick(0, X.size() - 1);

    std::vector<RegressionTree> trees;
    trees.reserve(kNumTrees);
    std::vector<size_t> bootstrap(X.size());

    for (int t = 0; t < kNumTrees; ++t) {
        for (auto& idx : bootstrap) idx = pick(rng);
        RegressionTree tree;
        tree.fit(X, y, bootstrap, kMaxDepth, kMinSamplesSplit);
        trees.push_back(std::move(tree));
    }

    trees_ = std::move(trees);
    num_features_ = num_features;
}

double RegressionForest::predict(const std::vector<double>& x) const {
    if (trees_.empty()) {
        throw std::invalid_argument("model not trained");
    }
    if (x.size() != num_features_) {
        throw std::invalid_argument("feature count mismatch");
    }
    double sum = 0.0;
    for (const auto& tree : trees_) {
        sum += tree.predict(x);
    }
    return sum / static_cast<double>(trees_.size());
}

nlohmann::json RegressionForest::toJson() const {
    nlohmann::json trees = nlohmann::json::array();
    for (const auto& tree : trees_) {
        trees.push_back(tree.toJson());
    }
    return {
        {"schema_version", kSchemaVersion},
        {"type", "random_forest_regressor"},
        {"num_features", num_features_},
        {"hyperparameters", {
            {"n_estimators", kNumTrees},
            {"max_depth", kMaxDepth},
            {"random_state", kRandomSeed}
        }},
        {"trees", trees}
    };
}

RegressionForest RegressionForest::fromJson(const nlohmann::json& j) {
    if (j.value("type", "") != "random_forest_regressor") {
        throw std::invalid_argument("unexpected model type");
    }

    RegressionForest forest;
    forest.num_features_ = j.at("num_features").get<size_t>();
    if (forest.num_features_ == 0) {
        throw std::invalid_argument("model without features");
    }

    for (const auto& t : j.at("trees")) {
        auto tree = RegressionTree::fromJson(t);
        for (const auto& n : tree.nodes()) {
            if (n.feature_idx >= static_cast<int>(forest.num_features_)) {
                throw std::invalid_argument("tree references unknown feature");
            }
        }
        forest.trees_.push_back(std::move(tree));
    }
    if (forest.trees_.empty()) {
        throw std::invalid_argument("model without trees");
    }
    return forest;
}

} // namespace ml
} // namespace thetadesk
