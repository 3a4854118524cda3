#include "random_forest.hpp"
#include "../scenario.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace cashalloc {

// ============================================================================
// ForestParams Implementation
// ============================================================================

ForestParams::ForestParams()
    : n_estimators(100),
      max_depth(0),
      min_samples_split(2),
      min_samples_leaf(1),
      seed(42) {}

// ============================================================================
// RegressionTree Implementation
// ============================================================================

void RegressionTree::fit(const std::vector<FeatureVector>& X,
                         const std::vector<double>& y,
                         std::vector<size_t> indices,
                         const ForestParams& params) {
    if (X.size() != y.size()) {
        throw std::invalid_argument("Feature and target counts differ");
    }
    if (indices.empty()) {
        throw std::invalid_argument("Cannot fit a regression tree on zero samples");
    }
    nodes_.clear();
    build(X, y, indices, 0, indices.size(), 0, params);
}

int RegressionTree::build(const std::vector<FeatureVector>& X,
                          const std::vector<double>& y,
                          std::vector<size_t>& indices,
                          size_t begin, size_t end,
                          size_t depth,
                          const ForestParams& params) {
    const size_t n = end - begin;
    const double count = static_cast<double>(n);

    double sum = 0.0;
    double sum_sq = 0.0;
    for (size_t k = begin; k < end; ++k) {
        double v = y[indices[k]];
        sum += v;
        sum_sq += v * v;
    }

    const int node_index = static_cast<int>(nodes_.size());
    nodes_.push_back(Node{-1, 0.0, -1, -1, sum / count});

    const size_t min_leaf = std::max<size_t>(1, params.min_samples_leaf);
    bool depth_reached = params.max_depth > 0 && depth >= params.max_depth;
    if (depth_reached || n < params.min_samples_split || n < 2 * min_leaf) {
        return node_index;
    }

    const double parent_sse = sum_sq - sum * sum / count;
    if (parent_sse <= 0.0) {
        return node_index;
    }

    // Exhaustive search over every feature and every boundary between distinct values
    int best_feature = -1;
    double best_threshold = 0.0;
    double best_sse = parent_sse;

    std::vector<size_t> sorted(indices.begin() + begin, indices.begin() + end);
    for (size_t f = 0; f < NUM_FEATURES; ++f) {
        std::sort(sorted.begin(), sorted.end(),
                  [&X, f](size_t a, size_t b) { return X[a][f] < X[b][f]; });

        double left_sum = 0.0;
        double left_sq = 0.0;
        for (size_t k = 0; k + 1 < n; ++k) {
            double v = y[sorted[k]];
            left_sum += v;
            left_sq += v * v;

            size_t left_n = k + 1;
            size_t right_n = n - left_n;
            if (left_n < min_leaf) continue;
            if (right_n < min_leaf) break;

            double x_here = X[sorted[k]][f];
            double x_next = X[sorted[k + 1]][f];
            if (!(x_here < x_next)) continue;

            double right_sum = sum - left_sum;
            double right_sq = sum_sq - left_sq;
            double sse = (left_sq - left_sum * left_sum / static_cast<double>(left_n)) +
                         (right_sq - right_sum * right_sum / static_cast<double>(right_n));

            if (sse < best_sse) {
                best_sse = sse;
                best_feature = static_cast<int>(f);
                best_threshold = x_here + (x_next - x_here) / 2.0;
                if (!(best_threshold < x_next)) {
                    best_threshold = x_here;
                }
            }
        }
    }

    if (best_feature < 0 || !(best_sse < parent_sse * (1.0 - 1e-12))) {
        return node_index;
    }

    auto middle = std::partition(indices.begin() + begin, indices.begin() + end,
                                 [&](size_t i) { return X[i][best_feature] <= best_threshold; });
    const size_t split = static_cast<size_t>(middle - indices.begin());
    if (split == begin || split == end) {
        return node_index;
    }

    int left = build(X, y, indices, begin, split, depth + 1, params);
    int right = build(X, y, indices, split, end, depth + 1, params);

    // nodes_ may have reallocated during recursion, index rather than hold a reference
    nodes_[node_index].feature = best_feature;
    nodes_[node_index].threshold = best_threshold;
    nodes_[node_index].left = left;
    nodes_[node_index].right = right;
    return node_index;
}

double RegressionTree::predict(const FeatureVector& x) const {
    if (nodes_.empty()) {
        throw std::logic_error("RegressionTree used before fit");
    }
    int index = 0;
    while (nodes_[index].feature >= 0) {
        const Node& node = nodes_[index];
        index = x[static_cast<size_t>(node.feature)] <= node.threshold ? node.left : node.right;
    }
    return nodes_[index].value;
}

size_t RegressionTree::depth() const {
    if (nodes_.empty()) {
        return 0;
    }
    size_t max_depth = 0;
    std::vector<std::pair<int, size_t>> stack = {{0, 0}};
    while (!stack.empty()) {
        auto [index, d] = stack.back();
        stack.pop_back();
        max_depth = std::max(max_depth, d);
        const Node& node = nodes_[index];
        if (node.feature >= 0) {
            stack.push_back({node.left, d + 1});
            stack.push_back({node.right, d + 1});
        }
    }
    return max_depth;
}

nlohmann::json RegressionTree::to_json() const {
    std::vector<int> feature, left, right;
    std::vector<double> threshold, value;
    feature.reserve(nodes_.size());
    left.reserve(nodes_.size());
    right.reserve(nodes_.size());
    threshold.reserve(nodes_.size());
    value.reserve(nodes_.size());

    for (const Node& node : nodes_) {
        feature.push_back(node.feature);
        threshold.push_back(node.threshold);
        left.push_back(node.left);
        right.push_back(node.right);
        value.push_back(node.value);
    }

    nlohmann::json j;
    j["feature"] = feature;
    j["threshold"] = threshold;
    j["left"] = left;
    j["right"] = right;
    j["value"] = value;
    return j;
}

RegressionTree RegressionTree::from_json(const nlohmann::json& j) {
    auto feature = j.at("feature").get<std::vector<int>>();
    auto threshold = j.at("threshold").get<std::vector<double>>();
    auto left = j.at("left").get<std::vector<int>>();
    auto right = j.at("right").get<std::vector<int>>();
    auto value = j.at("value").get<std::vector<double>>();

    const size_t n = feature.size();
    if (n == 0 || threshold.size() != n || left.size() != n ||
        right.size() != n || value.size() != n) {
        throw std::runtime_error("Malformed regression tree blob");
    }

    RegressionTree tree;
    tree.nodes_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (feature[i] >= static_cast<int>(NUM_FEATURES) ||
            (feature[i] >= 0 && (left[i] <= static_cast<int>(i) || right[i] <= static_cast<int>(i) ||
                                 left[i] >= static_cast<int>(n) || right[i] >= static_cast<int>(n)))) {
            throw std::runtime_error("Malformed regression tree node " + std::to_string(i));
        }
        tree.nodes_.push_back(Node{feature[i], threshold[i], left[i], right[i], value[i]});
    }
    return tree;
}

// ============================================================================
// RandomForestRegressor Implementation
// ============================================================================

RandomForestRegressor::RandomForestRegressor() = default;

RandomForestRegressor::RandomForestRegressor(const ForestParams& params)
    : params_(params) {}

void RandomForestRegressor::fit(const std::vector<FeatureVector>& X, const std::vector<double>& y) {
    if (X.empty()) {
        throw std::invalid_argument("Cannot fit a random forest on zero samples");
    }
    if (X.size() != y.size()) {
        throw std::invalid_argument("Feature and target counts differ");
    }
    if (params_.n_estimators == 0) {
        throw std::invalid_argument("n_estimators must be positive");
    }

    // One seed per tree, drawn up front so results do not depend on thread count
    RandomEngine seeder(params_.seed);
    std::vector<uint64_t> tree_seeds(params_.n_estimators);
    for (auto& seed : tree_seeds) {
        seed = seeder();
    }

    std::vector<RegressionTree> trees(params_.n_estimators);
    const long long tree_count = static_cast<long long>(params_.n_estimators);
    const size_t n = X.size();

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
#endif
    for (long long t = 0; t < tree_count; ++t) {
        RandomEngine rng(tree_seeds[static_cast<size_t>(t)]);
        std::uniform_int_distribution<size_t> pick(0, n - 1);

        std::vector<size_t> bootstrap(n);
        for (auto& index : bootstrap) {
            index = pick(rng);
        }
        trees[static_cast<size_t>(t)].fit(X, y, std::move(bootstrap), params_);
    }

    trees_ = std::move(trees);
}

double RandomForestRegressor::predict(const FeatureVector& x) const {
    if (trees_.empty()) {
        throw std::logic_error("RandomForestRegressor used before fit");
    }
    double sum = 0.0;
    for (const auto& tree : trees_) {
        sum += tree.predict(x);
    }
    return sum / static_cast<double>(trees_.size());
}

std::vector<double> RandomForestRegressor::predict(const std::vector<FeatureVector>& X) const {
    std::vector<double> predictions;
    predictions.reserve(X.size());
    for (const auto& x : X) {
        predictions.push_back(predict(x));
    }
    return predictions;
}

double RandomForestRegressor::score(const std::vector<FeatureVector>& X,
                                    const std::vector<double>& y) const {
    if (X.size() != y.size() || y.empty()) {
        throw std::invalid_argument("score requires matching, non-empty features and targets");
    }

    double mean = std::accumulate(y.begin(), y.end(), 0.0) / static_cast<double>(y.size());
    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (size_t i = 0; i < y.size(); ++i) {
        double residual = y[i] - predict(X[i]);
        double deviation = y[i] - mean;
        ss_res += residual * residual;
        ss_tot += deviation * deviation;
    }

    if (ss_tot == 0.0) {
        return ss_res == 0.0 ? 1.0 : 0.0;
    }
    return 1.0 - ss_res / ss_tot;
}

nlohmann::json RandomForestRegressor::to_json() const {
    nlohmann::json j;
    j["type"] = "random_forest_regressor";
    j["n_features"] = NUM_FEATURES;
    j["params"] = {
        {"n_estimators", params_.n_estimators},
        {"max_depth", params_.max_depth},
        {"min_samples_split", params_.min_samples_split},
        {"min_samples_leaf", params_.min_samples_leaf},
        {"seed", params_.seed}
    };

    nlohmann::json trees = nlohmann::json::array();
    for (const auto& tree : trees_) {
        trees.push_back(tree.to_json());
    }
    j["trees"] = std::move(trees);
    return j;
}

RandomForestRegressor RandomForestRegressor::from_json(const nlohmann::json& j) {
    if (j.value("type", std::string()) != "random_forest_regressor") {
        throw std::runtime_error("Blob is not a random forest regressor");
    }
    if (j.at("n_features").get<size_t>() != NUM_FEATURES) {
        throw std::runtime_error("Random forest blob was trained on a different feature count");
    }

    const auto& p = j.at("params");
    ForestParams params;
    params.n_estimators = p.at("n_estimators").get<size_t>();
    params.max_depth = p.at("max_depth").get<size_t>();
    params.min_samples_split = p.at("min_samples_split").get<size_t>();
    params.min_samples_leaf = p.at("min_samples_leaf").get<size_t>();
    params.seed = p.at("seed").get<uint64_t>();

    RandomForestRegressor forest(params);
    for (const auto& tree_json : j.at("trees")) {
        forest.trees_.push_back(RegressionTree::from_json(tree_json));
    }
    if (forest.trees_.empty()) {
        throw std::runtime_error("Random forest blob contains no trees");
    }
    return forest;
}

} // namespace cashalloc
