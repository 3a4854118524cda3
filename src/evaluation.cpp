#include "evaluation.hpp"
#include "advisor.hpp"
#include "logger.hpp"
#include "monte_carlo.hpp"
#include "model/allocation_model.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace cashalloc {

// ============================================================================
// EvaluationConfig / EvaluationOutcome Implementation
// ============================================================================

EvaluationConfig::EvaluationConfig()
    : monte_carlo_runs(EVALUATION_MONTE_CARLO_RUNS),
      survival_threshold(SURVIVAL_THRESHOLD) {}

EvaluationOutcome::EvaluationOutcome()
    : valid(false),
      reserve_pct(0.0),
      growth_pct(0.0),
      risk_pct(0.0),
      bad_survival_probability(0.0),
      bad_time_to_zero(std::numeric_limits<double>::infinity()),
      total_cash(0.0),
      reserve_amount(0.0),
      growth_amount(0.0),
      risk_amount(0.0),
      used_monte_carlo(false),
      monte_carlo_runs(0) {}

const SimulationResult& EvaluationOutcome::result_for(ScenarioKind kind) const {
    switch (kind) {
        case ScenarioKind::Good: return good;
        case ScenarioKind::Neutral: return neutral;
        case ScenarioKind::Bad: return bad;
    }
    return bad;
}

namespace {

std::string current_timestamp() {
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// Evaluation Implementation
// ============================================================================

EvaluationOutcome evaluate(
    const ParameterSet& params,
    const AllocationStrategy& allocation,
    bool use_monte_carlo,
    RandomEngine& rng,
    const EvaluationConfig& config)
{
    EvaluationOutcome outcome;

    // Single runs of each scenario, kept for display
    outcome.good = simulate(params, allocation, ScenarioKind::Good, rng);
    outcome.neutral = simulate(params, allocation, ScenarioKind::Neutral, rng);
    outcome.bad = simulate(params, allocation, ScenarioKind::Bad, rng);

    if (use_monte_carlo) {
        SurvivalEstimate mc = estimate(params, allocation, ScenarioKind::Bad,
                                       config.monte_carlo_runs, rng);
        outcome.bad_survival_probability = mc.survival_probability;
        outcome.bad_time_to_zero = mc.mean_time_to_zero;
        outcome.used_monte_carlo = true;
        outcome.monte_carlo_runs = mc.runs;
    } else {
        outcome.bad_survival_probability = outcome.bad.survived ? 1.0 : 0.0;
        outcome.bad_time_to_zero = outcome.bad.months_to_zero;
    }

    outcome.reserve_pct = allocation.reserve_pct();
    outcome.growth_pct = allocation.growth_pct();
    outcome.risk_pct = allocation.risk_pct();

    TierAmounts amounts = allocation.amounts(params.cash_on_hand());
    outcome.total_cash = params.cash_on_hand();
    outcome.reserve_amount = amounts.reserve;
    outcome.growth_amount = amounts.growth;
    outcome.risk_amount = amounts.risk;

    outcome.valid = outcome.bad_survival_probability >= config.survival_threshold;
    outcome.timestamp = current_timestamp();

    return outcome;
}

// ============================================================================
// AllocationEvaluator Implementation
// ============================================================================

AllocationEvaluator::AllocationEvaluator(const EvaluationConfig& config,
                                         std::shared_ptr<const AllocationModel> model)
    : config_(config), model_(std::move(model)) {}

bool AllocationEvaluator::has_model() const {
    return model_ && model_->is_trained();
}

EvaluationOutcome AllocationEvaluator::evaluate(const ParameterSet& params,
                                                const AllocationStrategy& allocation,
                                                bool use_monte_carlo,
                                                RandomEngine& rng) const {
    return run("caller", params, allocation, use_monte_carlo, rng);
}

EvaluationOutcome AllocationEvaluator::evaluate_suggested(const ParameterSet& params,
                                                          bool use_monte_carlo,
                                                          RandomEngine& rng) const {
    return run("advisor", params, suggest(params), use_monte_carlo, rng);
}

EvaluationOutcome AllocationEvaluator::evaluate_predicted(const ParameterSet& params,
                                                          bool use_monte_carlo,
                                                          RandomEngine& rng) const {
    if (!model_) {
        throw NotTrainedError("No allocation model attached to the evaluator");
    }
    // predict() throws NotTrainedError for an untrained model
    AllocationStrategy allocation = model_->predict(params);
    return run("model", params, allocation, use_monte_carlo, rng);
}

EvaluationOutcome AllocationEvaluator::run(const std::string& source,
                                           const ParameterSet& params,
                                           const AllocationStrategy& allocation,
                                           bool use_monte_carlo,
                                           RandomEngine& rng) const {
    EvaluationOutcome outcome =
        cashalloc::evaluate(params, allocation, use_monte_carlo, rng, config_);
    Logger::get_instance().log_evaluation_complete(source, outcome);
    return outcome;
}

} // namespace cashalloc
