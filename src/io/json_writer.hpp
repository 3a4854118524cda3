#ifndef CASHALLOC_IO_JSON_WRITER_HPP
#define CASHALLOC_IO_JSON_WRITER_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "../evaluation.hpp"
#include "../parameters.hpp"

namespace cashalloc {
namespace io {

// Render an evaluation as a JSON document:
//   decision, allocation (percent and amounts), parameters, bad-case survival,
//   per-scenario results with trajectories, timestamp.
// Infinite times to zero are rendered as null.
nlohmann::json evaluation_outcome_to_json(const EvaluationOutcome& outcome,
                                          const ParameterSet& params);

// Write an evaluation as JSON
void write_evaluation_outcome_json(std::ostream& os, const EvaluationOutcome& outcome,
                                   const ParameterSet& params, bool pretty_print = true);

// Write an evaluation as JSON to a file
void write_evaluation_outcome_json(const std::string& filepath, const EvaluationOutcome& outcome,
                                   const ParameterSet& params, bool pretty_print = true);

} // namespace io
} // namespace cashalloc

#endif // CASHALLOC_IO_JSON_WRITER_HPP
