/*
 * sandcell - Code Sandbox Tool
 *
 * ToolProvider exposing the sandbox to agents.
 *
 * Actions:
 *   execute_code   - Validate and run Python source, return the result record
 *   validate_code  - Static check only, return {valid, findings}
 *   sandbox_stats  - Counters per outcome status since start-up
 */
#ifndef sandcell_SANDBOX_CODE_SANDBOX_TOOL_HPP
#define sandcell_SANDBOX_CODE_SANDBOX_TOOL_HPP

#include <sandcell/core/tool.hpp>
#include <sandcell/sandbox/code_sandbox.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace sandcell {

class CodeSandboxTool : public ToolProvider {
public:
    CodeSandboxTool();
    virtual ~CodeSandboxTool();

    const char* name() const override { return "code_sandbox"; }
    const char* description() const override {
        return "Restricted Python execution with resource limits and figure capture";
    }
    const char* version() const override { return "1.0.0"; }

    bool init(const Config& cfg) override;
    void shutdown() override;

    const char* tool_id() const override { return "code_sandbox"; }
    std::vector<std::string> actions() const override;
    ToolResult execute(const std::string& action, const Json& params) override;

    std::vector<ToolSpec> get_tool_specs() const override;

    const CodeSandbox* sandbox() const { return sandbox_.get(); }

private:
    static const int kStatusCount = 6;

    ToolResult do_execute_code(const Json& params);
    ToolResult do_validate_code(const Json& params);
    ToolResult do_sandbox_stats(const Json& params);

    std::unique_ptr<CodeSandbox> sandbox_;
    std::atomic<uint64_t> status_counts_[kStatusCount];
    std::atomic<uint64_t> validations_;
    std::atomic<int64_t> total_duration_ms_;
};

} // namespace sandcell

#endif // sandcell_SANDBOX_CODE_SANDBOX_TOOL_HPP
