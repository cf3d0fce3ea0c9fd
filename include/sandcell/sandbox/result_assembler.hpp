/*
 * sandcell - Result Assembler
 *
 * Turns an ExecutionOutcome into the fixed JSON record returned to
 * callers. Every field is always present:
 *
 *   status, stdout, stderr, figures[{index, encoding, data}],
 *   findings[{kind, location, detail}], error{message, trace} | null,
 *   limit_kind | null, duration_ms
 */
#ifndef sandcell_SANDBOX_RESULT_ASSEMBLER_HPP
#define sandcell_SANDBOX_RESULT_ASSEMBLER_HPP

#include <sandcell/sandbox/outcome.hpp>
#include <sandcell/core/json.hpp>

#include <vector>

namespace sandcell {

Json assemble_result(const ExecutionOutcome& outcome);

// {"kind", "location", "detail"} per finding, in order
Json findings_to_json(const std::vector<ValidationFinding>& findings);

} // namespace sandcell

#endif // sandcell_SANDBOX_RESULT_ASSEMBLER_HPP
