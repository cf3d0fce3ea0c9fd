#include <sandcell/sandbox/code_sandbox_tool.hpp>
#include <sandcell/core/config.hpp>

#include <cassert>
#include <string>

static sandcell::Config test_config() {
    sandcell::Config cfg;
    std::string doc = std::string("{\"sandbox\": {\"timeout_seconds\": 5, \"launcher_path\": \"")
                      + SANDCELL_TEST_LAUNCHER + "\"}}";
    assert(cfg.load_string(doc));
    return cfg;
}

static void testUninitialized() {
    sandcell::CodeSandboxTool tool;
    assert(!tool.is_initialized());
    sandcell::ToolResult r = tool.execute("validate_code", {{"source", "x = 1"}});
    assert(!r.success);
    assert(r.error == "Code sandbox not initialized");
}

static void testActionsAndSpecs() {
    sandcell::CodeSandboxTool tool;
    assert(tool.init(test_config()));
    assert(tool.is_initialized());
    assert(std::string(tool.tool_id()) == "code_sandbox");
    assert(tool.actions().size() == 3);
    assert(tool.has_action("execute_code"));
    assert(tool.has_action("validate_code"));
    assert(tool.has_action("sandbox_stats"));
    assert(!tool.has_action("run_shell"));

    std::vector<sandcell::ToolSpec> specs = tool.get_tool_specs();
    assert(specs.size() == 3);
    sandcell::Json exec = specs[0].to_json();
    assert(exec["name"] == "execute_code");
    assert(exec["input_schema"]["properties"].contains("source"));
    assert(exec["input_schema"]["properties"].contains("timeout_seconds"));
    assert(exec["input_schema"]["required"].size() == 1);
    assert(exec["input_schema"]["required"][0] == "source");

    tool.shutdown();
    assert(!tool.is_initialized());
}

static void testValidateCode() {
    sandcell::CodeSandboxTool tool;
    assert(tool.init(test_config()));

    sandcell::ToolResult ok = tool.execute("validate_code", {{"source", "import numpy as np\nprint(np.ones(3).sum())\n"}});
    assert(ok.success);
    assert(ok.data["valid"] == true);
    assert(ok.data["findings"].empty());

    // "code" is accepted as an alias of "source"
    sandcell::ToolResult bad = tool.execute("validate_code", {{"code", "import os\nopen('x')\n"}});
    assert(bad.success);
    assert(bad.data["valid"] == false);
    assert(bad.data["findings"].size() == 2);
    assert(bad.data["findings"][0]["kind"] == "disallowed_import");
    assert(bad.data["findings"][0]["location"] == "1:8");
    assert(bad.data["findings"][1]["location"] == "2:1");
}

static void testParameterErrors() {
    sandcell::CodeSandboxTool tool;
    assert(tool.init(test_config()));

    sandcell::ToolResult missing = tool.execute("execute_code", sandcell::Json::object());
    assert(!missing.success);
    assert(missing.error == "Missing required parameter: source");

    sandcell::ToolResult wrong_type = tool.execute("validate_code", {{"source", 42}});
    assert(!wrong_type.success);

    sandcell::ToolResult bad_timeout = tool.execute("execute_code",
        {{"source", "x = 1"}, {"timeout_seconds", "soon"}});
    assert(!bad_timeout.success);
    assert(bad_timeout.error.find("timeout_seconds") != std::string::npos);

    sandcell::ToolResult unknown = tool.execute("drop_tables", sandcell::Json::object());
    assert(!unknown.success);
    assert(unknown.error == "Unknown action: drop_tables");
}

static void testRejectedExecutionAndStats() {
    sandcell::CodeSandboxTool tool;
    assert(tool.init(test_config()));

    sandcell::ToolResult r = tool.execute("execute_code", {{"source", "import subprocess\n"}});
    assert(r.success);
    assert(r.data["status"] == "validated_rejected");
    assert(r.data["duration_ms"] == 0);
    assert(r.data["findings"].size() == 1);
    assert(r.data["error"].is_object());

    assert(tool.execute("validate_code", {{"source", "x = 1"}}).success);

    sandcell::ToolResult stats = tool.execute("sandbox_stats", sandcell::Json::object());
    assert(stats.success);
    assert(stats.data["executions"] == 1);
    assert(stats.data["validations"] == 1);
    assert(stats.data["by_status"]["validated_rejected"] == 1);
    assert(stats.data["by_status"]["completed"] == 0);
    assert(stats.data["by_status"].size() == 6);
    assert(stats.data["limits"]["timeout_seconds"] == 5.0);
    assert(stats.data["allowed_modules"].is_array());
    assert(!stats.data["allowed_modules"].empty());
}

int main() {
    testUninitialized();
    testActionsAndSpecs();
    testValidateCode();
    testParameterErrors();
    testRejectedExecutionAndStats();
    return 0;
}
