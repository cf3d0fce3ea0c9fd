/*
 * sandcell - Code Sandbox Implementation
 */
#include <sandcell/sandbox/code_sandbox.hpp>
#include <sandcell/sandbox/namespace_builder.hpp>
#include <sandcell/core/logger.hpp>

#include <exception>

namespace sandcell {

CodeSandbox::CodeSandbox(PolicyPtr policy, const RuntimeSettings& settings)
    : policy_(policy)
    , worker_(settings) {}

std::vector<ValidationFinding> CodeSandbox::validate(const std::string& source) const {
    Validator validator(*policy_);
    return validator.validate(source);
}

ExecutionLimits CodeSandbox::effective_limits(double timeout_override) const {
    ExecutionLimits limits = policy_->limits;
    if (timeout_override > 0.0 && timeout_override < limits.timeout_seconds) {
        limits.timeout_seconds = timeout_override;
    }
    return limits;
}

ExecutionOutcome CodeSandbox::execute(const ExecutionRequest& request) const {
    try {
        std::vector<ValidationFinding> findings = validate(request.source);
        if (!findings.empty()) {
            LOG_INFO("[Sandbox] Rejected: %zu finding(s), first at %s: %s",
                     findings.size(), findings[0].location().c_str(), findings[0].detail.c_str());
            return ExecutionOutcome::rejected(findings);
        }

        NamespaceHandle ns = build_namespace(*policy_);
        ExecutionLimits limits = effective_limits(request.timeout_seconds);

        LOG_DEBUG("[Sandbox] Executing %zu bytes (namespace %s, timeout %.1fs)",
                  request.source.size(), ns.id.c_str(), limits.timeout_seconds);

        ExecutionOutcome outcome = worker_.run(request.source, ns, limits);

        LOG_INFO("[Sandbox] %s in %lld ms%s%s",
                 outcome_status_name(outcome.status), (long long)outcome.duration_ms,
                 outcome.message.empty() ? "" : ": ", outcome.message.c_str());
        return outcome;
    } catch (const std::exception& e) {
        LOG_ERROR("[Sandbox] Execution failed: %s", e.what());
        return ExecutionOutcome::system_failure(std::string("internal error: ") + e.what());
    }
}

} // namespace sandcell
