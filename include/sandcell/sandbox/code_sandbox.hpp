/*
 * sandcell - Code Sandbox
 *
 * Entry point for one execution request:
 *
 *   validate -> (rejected) | build namespace -> run worker -> outcome
 *
 * Code that fails validation never reaches the worker. execute() never
 * throws; every failure is reported as an outcome. One instance is shared
 * by all request threads; the only shared state is the read-only policy.
 */
#ifndef sandcell_SANDBOX_CODE_SANDBOX_HPP
#define sandcell_SANDBOX_CODE_SANDBOX_HPP

#include <sandcell/sandbox/outcome.hpp>
#include <sandcell/sandbox/policy.hpp>
#include <sandcell/sandbox/validator.hpp>
#include <sandcell/sandbox/worker.hpp>

#include <string>
#include <vector>

namespace sandcell {

struct ExecutionRequest {
    std::string source;
    // Per-request wall clock; <= 0 means the policy default. Never raises it.
    double timeout_seconds;

    ExecutionRequest() : timeout_seconds(0.0) {}
    explicit ExecutionRequest(const std::string& src, double timeout = 0.0)
        : source(src), timeout_seconds(timeout) {}
};

class CodeSandbox {
public:
    CodeSandbox(PolicyPtr policy, const RuntimeSettings& settings);

    ExecutionOutcome execute(const ExecutionRequest& request) const;

    std::vector<ValidationFinding> validate(const std::string& source) const;

    // Policy limits with the request timeout applied
    ExecutionLimits effective_limits(double timeout_override) const;

    const Policy& policy() const { return *policy_; }
    const RuntimeSettings& settings() const { return worker_.settings(); }

private:
    PolicyPtr policy_;
    Worker worker_;
};

} // namespace sandcell

#endif // sandcell_SANDBOX_CODE_SANDBOX_HPP
