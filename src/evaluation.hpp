#ifndef CASHALLOC_EVALUATION_HPP
#define CASHALLOC_EVALUATION_HPP

#include "parameters.hpp"
#include "scenario.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace cashalloc {

class AllocationModel;

// Decision gate: an allocation is valid iff its bad-case survival
// probability reaches this threshold
constexpr double SURVIVAL_THRESHOLD = 0.70;
constexpr size_t EVALUATION_MONTE_CARLO_RUNS = 500;

struct EvaluationConfig {
    size_t monte_carlo_runs;       // Runs used for the bad-case estimate
    double survival_threshold;     // Minimum bad-case survival probability

    EvaluationConfig();
};

// Decision object handed to reporting layers (read-only for them)
struct EvaluationOutcome {
    bool valid;
    double reserve_pct;
    double growth_pct;
    double risk_pct;

    double bad_survival_probability;
    double bad_time_to_zero;          // +infinity if cash never hit zero

    SimulationResult good;
    SimulationResult neutral;
    SimulationResult bad;

    double total_cash;
    double reserve_amount;
    double growth_amount;
    double risk_amount;

    bool used_monte_carlo;
    size_t monte_carlo_runs;          // 0 when Monte Carlo was not used
    std::string timestamp;            // "YYYY-MM-DD HH:MM:SS", local time

    EvaluationOutcome();

    const SimulationResult& result_for(ScenarioKind kind) const;
};

// Evaluate an allocation:
//   1. Simulate good, neutral and bad once each (for display)
//   2. Bad-case survival: Monte Carlo estimate if requested, else the single bad run
//   3. valid = bad-case survival >= config.survival_threshold
EvaluationOutcome evaluate(
    const ParameterSet& params,
    const AllocationStrategy& allocation,
    bool use_monte_carlo,
    RandomEngine& rng,
    const EvaluationConfig& config = EvaluationConfig()
);

// Orchestrator with an injected, shared read-only model handle.
// The model is optional; only evaluate_predicted() needs it.
class AllocationEvaluator {
public:
    explicit AllocationEvaluator(const EvaluationConfig& config = EvaluationConfig(),
                                 std::shared_ptr<const AllocationModel> model = nullptr);

    const EvaluationConfig& config() const { return config_; }
    bool has_model() const;

    // Evaluate a caller-supplied allocation
    EvaluationOutcome evaluate(const ParameterSet& params,
                               const AllocationStrategy& allocation,
                               bool use_monte_carlo,
                               RandomEngine& rng) const;

    // Evaluate the advisor's closed-form suggestion
    EvaluationOutcome evaluate_suggested(const ParameterSet& params,
                                         bool use_monte_carlo,
                                         RandomEngine& rng) const;

    // Evaluate the model's predicted allocation, validated by simulation.
    // Throws NotTrainedError if no trained model was injected.
    EvaluationOutcome evaluate_predicted(const ParameterSet& params,
                                         bool use_monte_carlo,
                                         RandomEngine& rng) const;

private:
    EvaluationConfig config_;
    std::shared_ptr<const AllocationModel> model_;

    EvaluationOutcome run(const std::string& source,
                          const ParameterSet& params,
                          const AllocationStrategy& allocation,
                          bool use_monte_carlo,
                          RandomEngine& rng) const;
};

} // namespace cashalloc

#endif // CASHALLOC_EVALUATION_HPP
