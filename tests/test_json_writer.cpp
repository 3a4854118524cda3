#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "advisor.hpp"
#include "evaluation.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"

using namespace cashalloc;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

ParameterSet reference_firm() {
    return ParameterSet(100000.0, 15000.0, 8000.0, 3000.0, 0.15, 0.3, 6);
}

EvaluationOutcome reference_outcome() {
    ParameterSet params = reference_firm();
    RandomEngine rng(42);
    return evaluate(params, suggest(params), false, rng);
}

} // anonymous namespace

TEST_CASE("Evaluation JSON carries every section", "[io][json]") {
    quiet_logger();
    ParameterSet params = reference_firm();
    EvaluationOutcome outcome = reference_outcome();

    json j = io::evaluation_outcome_to_json(outcome, params);

    REQUIRE(j["valid"] == true);
    REQUIRE(j["timestamp"] == outcome.timestamp);

    REQUIRE_THAT(j["allocation"]["reserve_pct"].get<double>(), WithinAbs(16.2, 1e-9));
    REQUIRE_THAT(j["allocation"]["growth_pct"].get<double>(), WithinAbs(76.26, 1e-9));
    REQUIRE_THAT(j["allocation"]["risk_pct"].get<double>(), WithinAbs(7.54, 1e-9));
    REQUIRE(j["allocation"]["total_cash"].get<double>() == 100000.0);
    REQUIRE(j["allocation"].contains("reserve_amount"));

    REQUIRE(j["parameters"]["protected_months"] == 6);
    REQUIRE(j["parameters"]["cash_on_hand"].get<double>() == 100000.0);
    REQUIRE(j["parameters"]["investments"]["safe_return"].get<double>() ==
            params.investments().safe_return);

    REQUIRE(j["bad_case"]["survival_probability"].get<double>() == 1.0);
    REQUIRE(j["bad_case"]["monte_carlo"] == false);
    REQUIRE(j["bad_case"]["monte_carlo_runs"] == 0);
}

TEST_CASE("Infinite times to zero render as null", "[io][json]") {
    quiet_logger();
    ParameterSet params = reference_firm();
    EvaluationOutcome outcome = reference_outcome();

    json j = io::evaluation_outcome_to_json(outcome, params);

    REQUIRE(j["bad_case"]["time_to_zero"].is_null());
    REQUIRE(j["scenarios"]["bad"]["months_to_zero"].is_null());
    REQUIRE(j["scenarios"]["bad"]["survived"] == true);
}

TEST_CASE("Failing firm renders a finite time to zero", "[io][json]") {
    quiet_logger();
    ParameterSet params(1000.0, 0.0, 500.0, 0.0, 0.2, 0.3, 6);
    RandomEngine rng(3);
    EvaluationOutcome outcome = evaluate(params, AllocationStrategy(100.0, 0.0, 0.0), false, rng);

    json j = io::evaluation_outcome_to_json(outcome, params);

    REQUIRE(j["valid"] == false);
    REQUIRE(j["bad_case"]["time_to_zero"].is_number());
    REQUIRE(j["scenarios"]["bad"]["survived"] == false);
    REQUIRE(j["scenarios"]["bad"]["final_cash"].get<double>() == 0.0);
}

TEST_CASE("Scenario entries hold full trajectories", "[io][json]") {
    quiet_logger();
    ParameterSet params = reference_firm();
    EvaluationOutcome outcome = reference_outcome();

    json j = io::evaluation_outcome_to_json(outcome, params);

    for (const char* name : {"good", "neutral", "bad"}) {
        const json& s = j["scenarios"][name];
        REQUIRE(s["scenario"] == name);
        REQUIRE(s["trajectory"].size() == 19);
        REQUIRE(s["trajectory"][0].get<double>() == outcome.result_for(parse_scenario_kind(name)).trajectory[0]);
        REQUIRE_FALSE(s.contains("tiers"));
    }
}

TEST_CASE("Evaluation JSON writers", "[io][json]") {
    quiet_logger();
    ParameterSet params = reference_firm();
    EvaluationOutcome outcome = reference_outcome();

    SECTION("Compact stream output is a single line") {
        std::ostringstream os;
        io::write_evaluation_outcome_json(os, outcome, params, false);

        std::string text = os.str();
        REQUIRE(text.back() == '\n');
        REQUIRE(text.find('\n') == text.size() - 1);
        REQUIRE(json::parse(text)["valid"] == true);
    }

    SECTION("Pretty output is indented") {
        std::ostringstream os;
        io::write_evaluation_outcome_json(os, outcome, params);

        REQUIRE_THAT(os.str(), Catch::Matchers::ContainsSubstring("\n  \"allocation\""));
    }

    SECTION("File output round-trips through the parser") {
        std::string path = (std::filesystem::temp_directory_path() / "cashalloc_test_outcome.json").string();
        io::write_evaluation_outcome_json(path, outcome, params);

        std::ifstream file(path);
        json j = json::parse(file);
        REQUIRE(j["allocation"]["total_cash"].get<double>() == 100000.0);

        file.close();
        std::filesystem::remove(path);
    }

    SECTION("Unwritable path throws") {
        std::string path = (std::filesystem::temp_directory_path() /
                            "cashalloc_missing_dir" / "nested" / "outcome.json").string();
        REQUIRE_THROWS_AS(io::write_evaluation_outcome_json(path, outcome, params), std::runtime_error);
    }
}
