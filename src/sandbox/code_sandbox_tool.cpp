/*
 * sandcell - Code Sandbox Tool Implementation
 */
#include <sandcell/sandbox/code_sandbox_tool.hpp>
#include <sandcell/sandbox/result_assembler.hpp>
#include <sandcell/core/config.hpp>
#include <sandcell/core/logger.hpp>

#include <exception>

namespace sandcell {

namespace {

// Source text from "source", or its alias "code"
bool get_source(const Json& params, std::string& out) {
    if (!params.is_object()) return false;
    const char* keys[] = { "source", "code" };
    for (int i = 0; i < 2; ++i) {
        if (params.contains(keys[i]) && params[keys[i]].is_string()) {
            out = params[keys[i]].get<std::string>();
            return true;
        }
    }
    return false;
}

const OutcomeStatus kAllStatuses[] = {
    OutcomeStatus::Rejected,
    OutcomeStatus::Completed,
    OutcomeStatus::TimedOut,
    OutcomeStatus::ResourceExceeded,
    OutcomeStatus::RuntimeFailure,
    OutcomeStatus::SystemFailure
};

} // namespace

CodeSandboxTool::CodeSandboxTool()
    : validations_(0)
    , total_duration_ms_(0) {
    for (int i = 0; i < kStatusCount; ++i) status_counts_[i] = 0;
}

CodeSandboxTool::~CodeSandboxTool() {}

bool CodeSandboxTool::init(const Config& cfg) {
    PolicyPtr policy = std::make_shared<const Policy>(Policy::from_config(cfg));
    RuntimeSettings settings = RuntimeSettings::from_config(cfg);

    sandbox_.reset(new CodeSandbox(policy, settings));
    initialized_ = true;

    LOG_INFO("[CodeSandbox] Initialized: python=%s launcher=%s timeout=%.1fs memory=%lld MiB modules=%zu",
             settings.python_path.c_str(), settings.launcher_path.c_str(),
             policy->limits.timeout_seconds,
             (long long)(policy->limits.max_memory_bytes / (1024 * 1024)),
             policy->allowed_modules.size());
    return true;
}

void CodeSandboxTool::shutdown() {
    sandbox_.reset();
    initialized_ = false;
}

std::vector<std::string> CodeSandboxTool::actions() const {
    return { "execute_code", "validate_code", "sandbox_stats" };
}

ToolResult CodeSandboxTool::execute(const std::string& action, const Json& params) {
    if (!initialized_ || !sandbox_) {
        return ToolResult::fail("Code sandbox not initialized");
    }

    try {
        if (action == "execute_code")  return do_execute_code(params);
        if (action == "validate_code") return do_validate_code(params);
        if (action == "sandbox_stats") return do_sandbox_stats(params);
    } catch (const std::exception& e) {
        LOG_ERROR("[CodeSandbox] %s failed: %s", action.c_str(), e.what());
        return ToolResult::fail(std::string("Internal error: ") + e.what());
    }

    return ToolResult::fail("Unknown action: " + action);
}

ToolResult CodeSandboxTool::do_execute_code(const Json& params) {
    std::string source;
    if (!get_source(params, source)) {
        return ToolResult::fail("Missing required parameter: source");
    }

    double timeout = 0.0;
    if (params.contains("timeout_seconds")) {
        if (!params["timeout_seconds"].is_number()) {
            return ToolResult::fail("Parameter timeout_seconds must be a number");
        }
        timeout = params["timeout_seconds"].get<double>();
    }

    ExecutionOutcome outcome = sandbox_->execute(ExecutionRequest(source, timeout));

    status_counts_[static_cast<int>(outcome.status)]++;
    total_duration_ms_ += outcome.duration_ms;

    return ToolResult::ok(assemble_result(outcome));
}

ToolResult CodeSandboxTool::do_validate_code(const Json& params) {
    std::string source;
    if (!get_source(params, source)) {
        return ToolResult::fail("Missing required parameter: source");
    }

    std::vector<ValidationFinding> findings = sandbox_->validate(source);
    validations_++;

    Json result;
    result["valid"] = findings.empty();
    result["findings"] = findings_to_json(findings);
    return ToolResult::ok(result);
}

ToolResult CodeSandboxTool::do_sandbox_stats(const Json& /*params*/) {
    Json counts = Json::object();
    uint64_t executions = 0;
    for (int i = 0; i < kStatusCount; ++i) {
        uint64_t n = status_counts_[i].load();
        counts[outcome_status_name(kAllStatuses[i])] = n;
        executions += n;
    }

    const ExecutionLimits& limits = sandbox_->policy().limits;

    Json result;
    result["executions"] = executions;
    result["by_status"] = counts;
    result["validations"] = validations_.load();
    result["total_duration_ms"] = total_duration_ms_.load();
    result["limits"] = {
        {"timeout_seconds", limits.timeout_seconds},
        {"cpu_time_seconds", limits.cpu_time_seconds},
        {"max_memory_bytes", limits.max_memory_bytes},
        {"max_output_bytes", limits.max_output_bytes},
        {"max_figures", limits.max_figures}
    };
    result["allowed_modules"] = sandbox_->policy().allowed_modules;
    return ToolResult::ok(result);
}

std::vector<ToolSpec> CodeSandboxTool::get_tool_specs() const {
    std::vector<ToolSpec> specs;

    {
        ToolSpec spec("execute_code",
            "Run a Python snippet in a restricted sandbox. Only allow-listed modules "
            "(numpy, pandas, matplotlib, ...) can be imported; file, network and process "
            "access are blocked. Returns stdout, stderr, PNG figures and the error trace.");
        spec.params.push_back(ToolParamSchema("source", "string", "Python source to execute", true));
        spec.params.push_back(ToolParamSchema("timeout_seconds", "number",
            "Wall-clock limit for this run; cannot exceed the configured limit", false));
        specs.push_back(spec);
    }
    {
        ToolSpec spec("validate_code",
            "Check Python source against the sandbox rules without running it.");
        spec.params.push_back(ToolParamSchema("source", "string", "Python source to check", true));
        specs.push_back(spec);
    }
    {
        ToolSpec spec("sandbox_stats", "Execution counters per outcome status and the active limits.");
        specs.push_back(spec);
    }

    return specs;
}

} // namespace sandcell
