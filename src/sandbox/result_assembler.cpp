/*
 * sandcell - Result Assembler Implementation
 */
#include <sandcell/sandbox/result_assembler.hpp>
#include <sandcell/core/utils.hpp>

namespace sandcell {

Json findings_to_json(const std::vector<ValidationFinding>& findings) {
    Json arr = Json::array();
    for (size_t i = 0; i < findings.size(); ++i) {
        Json f;
        f["kind"] = finding_kind_name(findings[i].kind);
        f["location"] = findings[i].location();
        f["detail"] = sanitize_utf8(findings[i].detail);
        arr.push_back(f);
    }
    return arr;
}

Json assemble_result(const ExecutionOutcome& outcome) {
    Json result;
    result["status"] = outcome_status_name(outcome.status);
    result["stdout"] = sanitize_utf8(outcome.stdout_text);
    result["stderr"] = sanitize_utf8(outcome.stderr_text);

    Json figures = Json::array();
    for (size_t i = 0; i < outcome.figures.size(); ++i) {
        const CapturedFigure& fig = outcome.figures[i];
        Json f;
        f["index"] = fig.sequence_index;
        f["encoding"] = fig.encoding;
        f["data"] = base64_encode(fig.bytes);
        figures.push_back(f);
    }
    result["figures"] = figures;
    result["findings"] = findings_to_json(outcome.findings);

    if (outcome.status == OutcomeStatus::Completed) {
        result["error"] = nullptr;
    } else {
        Json error;
        error["message"] = sanitize_utf8(outcome.message);
        error["trace"] = sanitize_utf8(outcome.trace);
        result["error"] = error;
    }

    if (outcome.limit_kind == LimitKind::None) {
        result["limit_kind"] = nullptr;
    } else {
        result["limit_kind"] = limit_kind_name(outcome.limit_kind);
    }
    result["duration_ms"] = outcome.duration_ms;
    return result;
}

} // namespace sandcell
