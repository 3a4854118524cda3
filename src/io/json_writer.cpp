#include "json_writer.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace cashalloc {
namespace io {

namespace {

json finite_or_null(double value) {
    if (std::isfinite(value)) {
        return value;
    }
    return nullptr;
}

json simulation_result_to_json(const SimulationResult& result) {
    json j;
    j["scenario"] = scenario_name(result.scenario);
    j["survived"] = result.survived;
    j["months_to_zero"] = finite_or_null(result.months_to_zero);
    j["survival_probability"] = result.survival_probability;
    j["final_cash"] = result.final_cash();
    j["trajectory"] = result.trajectory;

    if (!result.tiers.empty()) {
        json tiers = json::array();
        for (const auto& t : result.tiers) {
            tiers.push_back({{"reserve", t.reserve}, {"growth", t.growth}, {"risk", t.risk}});
        }
        j["tiers"] = std::move(tiers);
    }
    return j;
}

} // anonymous namespace

json evaluation_outcome_to_json(const EvaluationOutcome& outcome, const ParameterSet& params) {
    json j;

    j["valid"] = outcome.valid;
    j["timestamp"] = outcome.timestamp;

    j["allocation"] = {
        {"reserve_pct", outcome.reserve_pct},
        {"growth_pct", outcome.growth_pct},
        {"risk_pct", outcome.risk_pct},
        {"total_cash", outcome.total_cash},
        {"reserve_amount", outcome.reserve_amount},
        {"growth_amount", outcome.growth_amount},
        {"risk_amount", outcome.risk_amount}
    };

    const InvestmentOpportunities& inv = params.investments();
    j["parameters"] = {
        {"cash_on_hand", params.cash_on_hand()},
        {"expected_monthly_cash", params.expected_monthly_cash()},
        {"fixed_expenses", params.fixed_expenses()},
        {"variable_expenses", params.variable_expenses()},
        {"cash_volatility", params.cash_volatility()},
        {"risk_tolerance", params.risk_tolerance()},
        {"protected_months", params.protected_months()},
        {"investments", {
            {"safe_return", inv.safe_return},
            {"medium_return", inv.medium_return},
            {"high_return", inv.high_return},
            {"safe_volatility", inv.safe_volatility},
            {"medium_volatility", inv.medium_volatility},
            {"high_volatility", inv.high_volatility}
        }}
    };

    j["bad_case"] = {
        {"survival_probability", outcome.bad_survival_probability},
        {"time_to_zero", finite_or_null(outcome.bad_time_to_zero)},
        {"monte_carlo", outcome.used_monte_carlo},
        {"monte_carlo_runs", outcome.monte_carlo_runs}
    };

    json scenarios;
    for (ScenarioKind kind : ALL_SCENARIOS) {
        scenarios[scenario_name(kind)] = simulation_result_to_json(outcome.result_for(kind));
    }
    j["scenarios"] = std::move(scenarios);

    return j;
}

void write_evaluation_outcome_json(std::ostream& os, const EvaluationOutcome& outcome,
                                   const ParameterSet& params, bool pretty_print) {
    json j = evaluation_outcome_to_json(outcome, params);
    os << (pretty_print ? j.dump(2) : j.dump()) << "\n";
}

void write_evaluation_outcome_json(const std::string& filepath, const EvaluationOutcome& outcome,
                                   const ParameterSet& params, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_evaluation_outcome_json(file, outcome, params, pretty_print);
}

} // namespace io
} // namespace cashalloc
