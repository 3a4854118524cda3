#ifndef CASHALLOC_MODEL_RANDOM_FOREST_HPP
#define CASHALLOC_MODEL_RANDOM_FOREST_HPP

#include "features.hpp"
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace cashalloc {

struct ForestParams {
    size_t n_estimators;        // Number of trees
    size_t max_depth;           // 0 = grow until leaves are pure or too small
    size_t min_samples_split;   // Minimum samples required to split a node
    size_t min_samples_leaf;    // Minimum samples in each child
    uint64_t seed;              // Seed for bootstrap sampling

    ForestParams();
};

// CART regression tree, split on mean squared error over all features.
// Nodes are stored flat; a node with feature == -1 is a leaf.
class RegressionTree {
public:
    struct Node {
        int feature;
        double threshold;     // Go left when x[feature] <= threshold
        int left;
        int right;
        double value;         // Mean target of the samples reaching the node
    };

    RegressionTree() = default;

    // Fit on the given sample indices (duplicates allowed, as in a bootstrap)
    void fit(const std::vector<FeatureVector>& X,
             const std::vector<double>& y,
             std::vector<size_t> indices,
             const ForestParams& params);

    double predict(const FeatureVector& x) const;

    size_t node_count() const { return nodes_.size(); }
    size_t depth() const;

    nlohmann::json to_json() const;
    static RegressionTree from_json(const nlohmann::json& j);

private:
    std::vector<Node> nodes_;

    int build(const std::vector<FeatureVector>& X,
              const std::vector<double>& y,
              std::vector<size_t>& indices,
              size_t begin, size_t end,
              size_t depth,
              const ForestParams& params);
};

// Bootstrap-aggregated regression trees; prediction is the mean over trees.
// Trees are grown in parallel when built with OpenMP.
class RandomForestRegressor {
public:
    RandomForestRegressor();
    explicit RandomForestRegressor(const ForestParams& params);

    void fit(const std::vector<FeatureVector>& X, const std::vector<double>& y);

    double predict(const FeatureVector& x) const;
    std::vector<double> predict(const std::vector<FeatureVector>& X) const;

    // Coefficient of determination R² on the given data
    double score(const std::vector<FeatureVector>& X, const std::vector<double>& y) const;

    bool is_fitted() const { return !trees_.empty(); }
    size_t tree_count() const { return trees_.size(); }
    const ForestParams& params() const { return params_; }

    nlohmann::json to_json() const;
    static RandomForestRegressor from_json(const nlohmann::json& j);

private:
    ForestParams params_;
    std::vector<RegressionTree> trees_;
};

} // namespace cashalloc

#endif // CASHALLOC_MODEL_RANDOM_FOREST_HPP
