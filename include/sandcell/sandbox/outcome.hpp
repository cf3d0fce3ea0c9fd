/*
 * sandcell - Execution Outcome
 *
 * Exactly one outcome is produced per request. The status selects which
 * fields carry meaning; the factories below are the only way outcomes
 * are created.
 */
#ifndef sandcell_SANDBOX_OUTCOME_HPP
#define sandcell_SANDBOX_OUTCOME_HPP

#include <sandcell/sandbox/validator.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sandcell {

enum class OutcomeStatus {
    Rejected,
    Completed,
    TimedOut,
    ResourceExceeded,
    RuntimeFailure,
    SystemFailure
};

enum class LimitKind {
    None,
    Memory,
    Cpu,
    Output
};

// "validated_rejected", "completed", ...
const char* outcome_status_name(OutcomeStatus status);

// "memory", "cpu", "output"; empty for None
const char* limit_kind_name(LimitKind kind);

struct CapturedFigure {
    int sequence_index;
    std::string encoding;   // "png"
    std::string bytes;

    CapturedFigure() : sequence_index(0), encoding("png") {}
};

struct ExecutionOutcome {
    OutcomeStatus status;
    std::vector<ValidationFinding> findings;
    std::string stdout_text;
    std::string stderr_text;
    std::vector<CapturedFigure> figures;
    int64_t duration_ms;
    LimitKind limit_kind;
    std::string message;
    std::string trace;

    ExecutionOutcome()
        : status(OutcomeStatus::SystemFailure), duration_ms(0), limit_kind(LimitKind::None) {}

    bool ok() const { return status == OutcomeStatus::Completed; }

    static ExecutionOutcome rejected(const std::vector<ValidationFinding>& findings);
    static ExecutionOutcome completed(const std::string& out, const std::string& err,
                                      const std::vector<CapturedFigure>& figures,
                                      int64_t duration_ms);
    static ExecutionOutcome timed_out(const std::string& partial_out, const std::string& partial_err,
                                      int64_t duration_ms, double timeout_seconds);
    static ExecutionOutcome resource_exceeded(LimitKind kind, const std::string& message,
                                              const std::string& out, const std::string& err,
                                              int64_t duration_ms);
    static ExecutionOutcome runtime_failure(const std::string& message, const std::string& trace,
                                            const std::string& out, const std::string& err,
                                            int64_t duration_ms);
    static ExecutionOutcome system_failure(const std::string& message,
                                           const std::string& out = "", const std::string& err = "",
                                           int64_t duration_ms = 0);
};

} // namespace sandcell

#endif // sandcell_SANDBOX_OUTCOME_HPP
