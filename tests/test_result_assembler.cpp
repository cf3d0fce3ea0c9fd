#include <sandcell/sandbox/result_assembler.hpp>
#include <sandcell/sandbox/worker.hpp>

#include <cassert>
#include <string>

static void testCompletedRecord() {
    std::vector<sandcell::CapturedFigure> figs(2);
    figs[0].sequence_index = 0;
    figs[0].bytes = "foo";
    figs[1].sequence_index = 1;
    figs[1].bytes = std::string("\x89PNG", 4);

    sandcell::ExecutionOutcome o = sandcell::ExecutionOutcome::completed("4\n", "", figs, 42);
    sandcell::Json r = sandcell::assemble_result(o);

    assert(r["status"] == "completed");
    assert(r["stdout"] == "4\n");
    assert(r["stderr"] == "");
    assert(r["error"].is_null());
    assert(r["limit_kind"].is_null());
    assert(r["duration_ms"] == 42);
    assert(r["findings"].is_array() && r["findings"].empty());
    assert(r["figures"].size() == 2);
    assert(r["figures"][0]["index"] == 0);
    assert(r["figures"][0]["encoding"] == "png");
    assert(r["figures"][0]["data"] == "Zm9v");
    assert(r["figures"][1]["index"] == 1);
}

static void testRejectedRecord() {
    std::vector<sandcell::ValidationFinding> findings;
    findings.push_back(sandcell::ValidationFinding(sandcell::FindingKind::DisallowedImport, 1, 8,
                                                   "module 'os' is not in the allow-list"));
    findings.push_back(sandcell::ValidationFinding(sandcell::FindingKind::ForbiddenSyntax, 2, 1,
                                                   "use of 'eval' is not allowed"));

    sandcell::Json r = sandcell::assemble_result(sandcell::ExecutionOutcome::rejected(findings));
    assert(r["status"] == "validated_rejected");
    assert(r["duration_ms"] == 0);
    assert(r["stdout"] == "");
    assert(r["figures"].empty());
    assert(r["findings"].size() == 2);
    assert(r["findings"][0]["kind"] == "disallowed_import");
    assert(r["findings"][0]["location"] == "1:8");
    assert(r["findings"][0]["detail"] == "module 'os' is not in the allow-list");
    assert(r["findings"][1]["kind"] == "forbidden_syntax");
    assert(r["findings"][1]["location"] == "2:1");
    assert(r["error"].is_object());
    assert(r["error"]["message"].get<std::string>().find("2 finding(s)") != std::string::npos);
}

static void testLimitRecords() {
    sandcell::ExecutionOutcome mem = sandcell::ExecutionOutcome::resource_exceeded(
        sandcell::LimitKind::Memory, "memory limit of 64 MiB exceeded", "partial", "", 900);
    sandcell::Json r = sandcell::assemble_result(mem);
    assert(r["status"] == "resource_exceeded");
    assert(r["limit_kind"] == "memory");
    assert(r["stdout"] == "partial");
    assert(r["error"]["message"] == "memory limit of 64 MiB exceeded");
    assert(r["error"]["trace"] == "");

    sandcell::Json t = sandcell::assemble_result(
        sandcell::ExecutionOutcome::timed_out("tick\n", "", 2000, 2));
    assert(t["status"] == "timed_out");
    assert(t["limit_kind"].is_null());
    assert(t["stdout"] == "tick\n");
    assert(t["error"]["message"] == "execution timed out after 2 seconds");
}

static void testInvalidUtf8IsReplaced() {
    sandcell::ExecutionOutcome o = sandcell::ExecutionOutcome::runtime_failure(
        "ValueError: bad \xFF", "trace", "out \xFF", "", 5);
    sandcell::Json r = sandcell::assemble_result(o);
    assert(r["status"] == "runtime_failure");
    assert(r["stdout"] == "out \xEF\xBF\xBD");
    assert(r["error"]["message"] == "ValueError: bad \xEF\xBF\xBD");
    // The record always serializes
    std::string text = r.dump();
    assert(!text.empty());
}

static void testGeneratedTrace() {
    std::string source = "x = 1\ndef f():\n    return 1 / 0\nf()\n";
    sandcell::Json frames = sandcell::Json::array();
    frames.push_back({{"file", "<harness>"}, {"line", 10}, {"name", "run"}});
    frames.push_back({{"file", "<generated>"}, {"line", 4}, {"name", "<module>"}});
    frames.push_back({{"file", "<generated>"}, {"line", 3}, {"name", "f"}});
    frames.push_back({{"file", "/usr/lib/python3/numpy/core.py"}, {"line", 99}, {"name", "g"}});

    std::string trace = sandcell::format_generated_trace(frames, source, "ZeroDivisionError",
                                                         "division by zero");
    assert(trace ==
           "Traceback (most recent call last):\n"
           "  File \"<generated>\", line 4, in <module>\n"
           "    f()\n"
           "  File \"<generated>\", line 3, in f\n"
           "    return 1 / 0\n"
           "ZeroDivisionError: division by zero");
    assert(trace.find("harness") == std::string::npos);
    assert(trace.find("numpy") == std::string::npos);

    // No user frames and no message
    assert(sandcell::format_generated_trace(sandcell::Json::array(), source, "KeyboardInterrupt", "")
           == "KeyboardInterrupt");
}

int main() {
    testCompletedRecord();
    testRejectedRecord();
    testLimitRecords();
    testInvalidUtf8IsReplaced();
    testGeneratedTrace();
    return 0;
}
