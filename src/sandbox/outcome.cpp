/*
 * sandcell - Execution Outcome Implementation
 */
#include <sandcell/sandbox/outcome.hpp>

#include <cstdio>

namespace sandcell {

const char* outcome_status_name(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Rejected: return "validated_rejected";
        case OutcomeStatus::Completed: return "completed";
        case OutcomeStatus::TimedOut: return "timed_out";
        case OutcomeStatus::ResourceExceeded: return "resource_exceeded";
        case OutcomeStatus::RuntimeFailure: return "runtime_failure";
        case OutcomeStatus::SystemFailure: return "system_failure";
    }
    return "system_failure";
}

const char* limit_kind_name(LimitKind kind) {
    switch (kind) {
        case LimitKind::Memory: return "memory";
        case LimitKind::Cpu: return "cpu";
        case LimitKind::Output: return "output";
        case LimitKind::None: break;
    }
    return "";
}

ExecutionOutcome ExecutionOutcome::rejected(const std::vector<ValidationFinding>& findings) {
    ExecutionOutcome o;
    o.status = OutcomeStatus::Rejected;
    o.findings = findings;
    o.message = "code rejected by validation: " + std::to_string(findings.size()) + " finding(s)";
    return o;
}

ExecutionOutcome ExecutionOutcome::completed(const std::string& out, const std::string& err,
                                             const std::vector<CapturedFigure>& figures,
                                             int64_t duration_ms) {
    ExecutionOutcome o;
    o.status = OutcomeStatus::Completed;
    o.stdout_text = out;
    o.stderr_text = err;
    o.figures = figures;
    o.duration_ms = duration_ms;
    return o;
}

ExecutionOutcome ExecutionOutcome::timed_out(const std::string& partial_out, const std::string& partial_err,
                                             int64_t duration_ms, double timeout_seconds) {
    ExecutionOutcome o;
    o.status = OutcomeStatus::TimedOut;
    o.stdout_text = partial_out;
    o.stderr_text = partial_err;
    o.duration_ms = duration_ms;
    char buf[96];
    snprintf(buf, sizeof(buf), "execution timed out after %g seconds", timeout_seconds);
    o.message = buf;
    return o;
}

ExecutionOutcome ExecutionOutcome::resource_exceeded(LimitKind kind, const std::string& message,
                                                     const std::string& out, const std::string& err,
                                                     int64_t duration_ms) {
    ExecutionOutcome o;
    o.status = OutcomeStatus::ResourceExceeded;
    o.limit_kind = kind;
    o.message = message;
    o.stdout_text = out;
    o.stderr_text = err;
    o.duration_ms = duration_ms;
    return o;
}

ExecutionOutcome ExecutionOutcome::runtime_failure(const std::string& message, const std::string& trace,
                                                   const std::string& out, const std::string& err,
                                                   int64_t duration_ms) {
    ExecutionOutcome o;
    o.status = OutcomeStatus::RuntimeFailure;
    o.message = message;
    o.trace = trace;
    o.stdout_text = out;
    o.stderr_text = err;
    o.duration_ms = duration_ms;
    return o;
}

ExecutionOutcome ExecutionOutcome::system_failure(const std::string& message,
                                                  const std::string& out, const std::string& err,
                                                  int64_t duration_ms) {
    ExecutionOutcome o;
    o.status = OutcomeStatus::SystemFailure;
    o.message = message;
    o.stdout_text = out;
    o.stderr_text = err;
    o.duration_ms = duration_ms;
    return o;
}

} // namespace sandcell
