#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <numeric>
#include <vector>
#include "model/random_forest.hpp"

using namespace cashalloc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

FeatureVector point(double x0, double x1 = 0.0) {
    FeatureVector x{};
    x[0] = x0;
    x[1] = x1;
    return x;
}

// y = 10 for x0 < 50, 30 otherwise
void step_function(std::vector<FeatureVector>& X, std::vector<double>& y) {
    for (int i = 0; i < 100; ++i) {
        X.push_back(point(static_cast<double>(i), static_cast<double>(i % 3)));
        y.push_back(i < 50 ? 10.0 : 30.0);
    }
}

std::vector<size_t> all_indices(size_t n) {
    std::vector<size_t> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    return indices;
}

} // anonymous namespace

// ============================================================================
// RegressionTree Tests
// ============================================================================

TEST_CASE("ForestParams defaults", "[random_forest]") {
    ForestParams params;

    REQUIRE(params.n_estimators == 100);
    REQUIRE(params.max_depth == 0);
    REQUIRE(params.min_samples_split == 2);
    REQUIRE(params.min_samples_leaf == 1);
    REQUIRE(params.seed == 42);
}

TEST_CASE("Regression tree learns a step with a single split", "[random_forest][tree]") {
    std::vector<FeatureVector> X;
    std::vector<double> y;
    step_function(X, y);

    RegressionTree tree;
    tree.fit(X, y, all_indices(X.size()), ForestParams());

    REQUIRE(tree.node_count() == 3);
    REQUIRE(tree.depth() == 1);
    REQUIRE(tree.predict(point(0.0)) == 10.0);
    REQUIRE(tree.predict(point(49.0)) == 10.0);
    REQUIRE(tree.predict(point(50.0)) == 30.0);
    REQUIRE(tree.predict(point(99.0)) == 30.0);
    // Threshold sits midway between 49 and 50
    REQUIRE(tree.predict(point(49.4)) == 10.0);
    REQUIRE(tree.predict(point(49.6)) == 30.0);
}

TEST_CASE("Regression tree respects max_depth", "[random_forest][tree]") {
    std::vector<FeatureVector> X;
    std::vector<double> y;
    for (int i = 0; i < 64; ++i) {
        X.push_back(point(static_cast<double>(i)));
        y.push_back(static_cast<double>(i));
    }

    ForestParams params;
    params.max_depth = 2;
    RegressionTree tree;
    tree.fit(X, y, all_indices(X.size()), params);

    REQUIRE(tree.depth() == 2);
    REQUIRE(tree.node_count() <= 7);

    ForestParams unlimited;
    RegressionTree deep;
    deep.fit(X, y, all_indices(X.size()), unlimited);
    REQUIRE(deep.depth() > 2);
    REQUIRE(deep.predict(point(17.0)) == 17.0);
}

TEST_CASE("Regression tree respects min_samples_leaf", "[random_forest][tree]") {
    std::vector<FeatureVector> X;
    std::vector<double> y;
    for (int i = 0; i < 20; ++i) {
        X.push_back(point(static_cast<double>(i)));
        y.push_back(i == 0 ? 100.0 : 0.0);
    }

    ForestParams params;
    params.min_samples_leaf = 5;
    RegressionTree tree;
    tree.fit(X, y, all_indices(X.size()), params);

    // The outlier cannot be isolated, it is averaged with at least four others
    REQUIRE(tree.predict(point(0.0)) <= 20.0 + 1e-9);
}

TEST_CASE("Regression tree misuse", "[random_forest][tree][error]") {
    RegressionTree tree;
    REQUIRE_THROWS_AS(tree.predict(point(1.0)), std::logic_error);

    std::vector<FeatureVector> X{point(1.0), point(2.0)};
    std::vector<double> y{1.0};
    REQUIRE_THROWS_AS(tree.fit(X, y, {0}, ForestParams()), std::invalid_argument);
}

// ============================================================================
// RandomForestRegressor Tests
// ============================================================================

TEST_CASE("Random forest fits a step function", "[random_forest]") {
    std::vector<FeatureVector> X;
    std::vector<double> y;
    step_function(X, y);

    ForestParams params;
    params.n_estimators = 25;
    RandomForestRegressor forest(params);
    forest.fit(X, y);

    REQUIRE(forest.is_fitted());
    REQUIRE(forest.tree_count() == 25);
    REQUIRE_THAT(forest.predict(point(20.0)), WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(forest.predict(point(80.0)), WithinAbs(30.0, 1e-9));
    REQUIRE(forest.score(X, y) > 0.95);

    std::vector<double> predictions = forest.predict(X);
    REQUIRE(predictions.size() == X.size());
}

TEST_CASE("Random forest is reproducible for a given seed", "[random_forest]") {
    std::vector<FeatureVector> X;
    std::vector<double> y;
    for (int i = 0; i < 80; ++i) {
        X.push_back(point(static_cast<double>(i % 17), static_cast<double>(i % 5)));
        y.push_back(static_cast<double>((i % 17) * (i % 5)));
    }

    ForestParams params;
    params.n_estimators = 10;
    params.seed = 7;

    RandomForestRegressor a(params);
    RandomForestRegressor b(params);
    a.fit(X, y);
    b.fit(X, y);

    REQUIRE(a.predict(X) == b.predict(X));
    REQUIRE(a.to_json() == b.to_json());
}

TEST_CASE("Random forest score", "[random_forest]") {
    std::vector<FeatureVector> X;
    std::vector<double> y;
    step_function(X, y);

    ForestParams params;
    params.n_estimators = 5;
    RandomForestRegressor forest(params);
    forest.fit(X, y);

    SECTION("Constant target predicted exactly scores 1") {
        RandomForestRegressor flat(params);
        std::vector<double> constant(X.size(), 4.0);
        flat.fit(X, constant);
        REQUIRE(flat.score(X, constant) == 1.0);
    }

    SECTION("Mismatched sizes are rejected") {
        std::vector<double> short_y(3, 1.0);
        REQUIRE_THROWS_AS(forest.score(X, short_y), std::invalid_argument);
    }
}

TEST_CASE("Random forest misuse", "[random_forest][error]") {
    RandomForestRegressor forest;
    REQUIRE_FALSE(forest.is_fitted());
    REQUIRE_THROWS_AS(forest.predict(point(1.0)), std::logic_error);
    REQUIRE_THROWS_AS(forest.fit({}, {}), std::invalid_argument);

    std::vector<FeatureVector> X{point(1.0), point(2.0)};
    std::vector<double> y{1.0, 2.0, 3.0};
    REQUIRE_THROWS_AS(forest.fit(X, y), std::invalid_argument);
}

TEST_CASE("Random forest JSON persistence", "[random_forest][serialization]") {
    std::vector<FeatureVector> X;
    std::vector<double> y;
    step_function(X, y);

    ForestParams params;
    params.n_estimators = 8;
    params.max_depth = 4;
    RandomForestRegressor forest(params);
    forest.fit(X, y);

    nlohmann::json j = forest.to_json();
    REQUIRE(j["type"] == "random_forest_regressor");
    REQUIRE(j["trees"].size() == 8);

    RandomForestRegressor restored = RandomForestRegressor::from_json(j);
    REQUIRE(restored.tree_count() == 8);
    REQUIRE(restored.params().max_depth == 4);
    REQUIRE(restored.predict(X) == forest.predict(X));

    SECTION("Wrong type tag") {
        j["type"] = "standard_scaler";
        REQUIRE_THROWS_AS(RandomForestRegressor::from_json(j), std::runtime_error);
    }

    SECTION("Wrong feature count") {
        j["n_features"] = 4;
        REQUIRE_THROWS_AS(RandomForestRegressor::from_json(j), std::runtime_error);
    }

    SECTION("Dangling child index") {
        j["trees"][0]["left"][0] = 100000;
        REQUIRE_THROWS_AS(RandomForestRegressor::from_json(j), std::runtime_error);
    }

    SECTION("No trees") {
        j["trees"] = nlohmann::json::array();
        REQUIRE_THROWS_AS(RandomForestRegressor::from_json(j), std::runtime_error);
    }
}
