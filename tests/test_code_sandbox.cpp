// End-to-end runs through sandcell-confine and the system interpreter
#include <sandcell/sandbox/code_sandbox.hpp>
#include <sandcell/sandbox/result_assembler.hpp>
#include <sandcell/core/config.hpp>
#include <sandcell/core/logger.hpp>

#include <cassert>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

static const char* kPython = "/usr/bin/python3";

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static sandcell::CodeSandbox make_sandbox(const std::string& sandbox_json) {
    sandcell::Config cfg;
    assert(cfg.load_string("{\"sandbox\": " + sandbox_json + "}"));

    sandcell::RuntimeSettings settings;
    settings.python_path = kPython;
    settings.launcher_path = SANDCELL_TEST_LAUNCHER;
    settings.require_confinement = false;

    sandcell::PolicyPtr policy = std::make_shared<const sandcell::Policy>(sandcell::Policy::from_config(cfg));
    return sandcell::CodeSandbox(policy, settings);
}

static void testCompletedRun() {
    sandcell::CodeSandbox sb = make_sandbox("{\"timeout_seconds\": 20}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "values = [i * i for i in range(5)]\n"
        "print(sum(values))\n"
        "print('done')\n"));
    assert(o.status == sandcell::OutcomeStatus::Completed);
    assert(o.stdout_text == "30\ndone\n");
    assert(o.figures.empty());
    assert(o.duration_ms >= 0);

    sandcell::Json r = sandcell::assemble_result(o);
    assert(r["status"] == "completed");
    assert(r["error"].is_null());
}

static void testRejectedNeverRuns() {
    sandcell::CodeSandbox sb = make_sandbox("{}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "import os\nos.system('touch /tmp/sandcell-should-not-exist')\n"));
    assert(o.status == sandcell::OutcomeStatus::Rejected);
    assert(o.duration_ms == 0);
    assert(o.stdout_text.empty());
    assert(!o.findings.empty());
    assert(o.findings[0].kind == sandcell::FindingKind::DisallowedImport);
    assert(access("/tmp/sandcell-should-not-exist", F_OK) != 0);
}

static void testRuntimeFailureTrace() {
    sandcell::CodeSandbox sb = make_sandbox("{\"timeout_seconds\": 20}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "print('before')\n"
        "def divide(a, b):\n"
        "    return a / b\n"
        "divide(1, 0)\n"));
    assert(o.status == sandcell::OutcomeStatus::RuntimeFailure);
    assert(o.stdout_text == "before\n");
    assert(o.message == "ZeroDivisionError: division by zero");
    assert(contains(o.trace, "File \"<generated>\", line 4, in <module>"));
    assert(contains(o.trace, "File \"<generated>\", line 3, in divide"));
    assert(contains(o.trace, "return a / b"));
    assert(!contains(o.trace, "harness"));
    assert(!contains(o.trace, "<string>"));
}

static void testAllowedImportAtRuntime() {
    sandcell::CodeSandbox sb = make_sandbox("{\"timeout_seconds\": 20}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "try:\n"
        "    import json\n"
        "    print(json.dumps({'a': 1}))\n"
        "except ImportError:\n"
        "    print('blocked')\n"));
    assert(o.status == sandcell::OutcomeStatus::Completed);
    assert(o.stdout_text == "{\"a\": 1}\n");
}

static void testTimeout() {
    sandcell::CodeSandbox sb = make_sandbox("{\"timeout_seconds\": 20}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "print('start')\n"
        "while True:\n"
        "    pass\n", 1.0));
    assert(o.status == sandcell::OutcomeStatus::TimedOut);
    assert(o.duration_ms >= 1000);
    assert(o.duration_ms < 2000);
    assert(o.stdout_text == "start\n");
    assert(o.message == "execution timed out after 1 seconds");
}

static void testTimeoutOverrideIsClamped() {
    sandcell::CodeSandbox sb = make_sandbox("{\"timeout_seconds\": 10}");
    assert(sb.effective_limits(0.0).timeout_seconds == 10.0);
    assert(sb.effective_limits(-3.0).timeout_seconds == 10.0);
    assert(sb.effective_limits(2.5).timeout_seconds == 2.5);
    assert(sb.effective_limits(600.0).timeout_seconds == 10.0);
}

static void testMemoryLimit() {
    sandcell::CodeSandbox sb = make_sandbox(
        "{\"timeout_seconds\": 20, \"max_memory_mb\": 256}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "print('allocating')\n"
        "block = bytearray(2 * 1024 * 1024 * 1024)\n"
        "print(len(block))\n"));
    assert(o.status == sandcell::OutcomeStatus::ResourceExceeded);
    assert(o.limit_kind == sandcell::LimitKind::Memory);
    assert(o.message == "memory limit of 256 MiB exceeded");
    assert(o.stdout_text == "allocating\n");
}

static void testMemoryLimitGrowingAllocation() {
    sandcell::CodeSandbox sb = make_sandbox(
        "{\"timeout_seconds\": 20, \"max_memory_mb\": 64}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "print('growing')\n"
        "chunks = []\n"
        "while True:\n"
        "    chunks.append(bytearray(8 << 20))\n"));
    assert(o.status == sandcell::OutcomeStatus::ResourceExceeded);
    assert(o.limit_kind == sandcell::LimitKind::Memory);
    assert(o.message == "memory limit of 64 MiB exceeded");
    assert(o.stdout_text == "growing\n");
}

static void testOutputTruncation() {
    sandcell::CodeSandbox sb = make_sandbox(
        "{\"timeout_seconds\": 20, \"max_output_bytes\": 100}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "print('x' * 1000)\n"));
    assert(o.status == sandcell::OutcomeStatus::Completed);
    assert(o.stdout_text.compare(0, 100, std::string(100, 'x')) == 0);
    assert(contains(o.stdout_text, "[output truncated: 901 bytes omitted]"));
}

static bool figures_available(const sandcell::ExecutionOutcome& o) {
    if (o.status == sandcell::OutcomeStatus::Completed) return true;
    fprintf(stderr, "skipping figure checks: %s\n", o.message.c_str());
    return false;
}

static void testFiguresInCreationOrder() {
    sandcell::CodeSandbox sb = make_sandbox(
        "{\"timeout_seconds\": 60, \"max_memory_mb\": 1024, \"figure_dpi\": 20}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "for n in range(3):\n"
        "    plt.figure()\n"
        "    plt.plot([0, n])\n"
        "print('plotted')\n"));
    if (!figures_available(o)) return;
    assert(o.stdout_text == "plotted\n");
    assert(o.figures.size() == 3);
    for (int i = 0; i < 3; ++i) {
        assert(o.figures[i].sequence_index == i);
        assert(o.figures[i].bytes.compare(0, 4, "\x89PNG") == 0);
    }

    // Identical source renders identical images
    sandcell::ExecutionOutcome again = sb.execute(sandcell::ExecutionRequest(
        "for n in range(3):\n"
        "    plt.figure()\n"
        "    plt.plot([0, n])\n"
        "print('plotted')\n"));
    assert(again.status == sandcell::OutcomeStatus::Completed);
    assert(again.figures.size() == 3);
    for (int i = 0; i < 3; ++i) {
        assert(again.figures[i].bytes == o.figures[i].bytes);
    }
}

static void testFigureLimitIsReported() {
    sandcell::CodeSandbox sb = make_sandbox(
        "{\"timeout_seconds\": 60, \"max_memory_mb\": 1024, \"max_figures\": 1, \"figure_dpi\": 20}");
    sandcell::ExecutionOutcome o = sb.execute(sandcell::ExecutionRequest(
        "plt.plot([1, 2, 3])\n"
        "plt.figure()\n"
        "plt.plot([3, 2, 1])\n"));
    if (!figures_available(o)) return;
    assert(o.figures.size() == 1);
    assert(o.figures[0].sequence_index == 0);
    assert(contains(o.stderr_text, "[1 figure(s) not captured: limit of 1 reached]"));
}

static void testDeterministicOutput() {
    sandcell::CodeSandbox sb = make_sandbox("{\"timeout_seconds\": 20}");
    // Set iteration order depends on the hash seed, which is fixed per run
    const char* source =
        "words = {'alpha', 'beta', 'gamma', 'delta', 'epsilon'}\n"
        "print(list(words))\n"
        "print(hash('sandcell'))\n";
    sandcell::ExecutionOutcome first = sb.execute(sandcell::ExecutionRequest(source));
    sandcell::ExecutionOutcome second = sb.execute(sandcell::ExecutionRequest(source));
    assert(first.status == sandcell::OutcomeStatus::Completed);
    assert(second.status == sandcell::OutcomeStatus::Completed);
    assert(!first.stdout_text.empty());
    assert(first.stdout_text == second.stdout_text);
}

static void testConcurrentRunsAreIsolated() {
    sandcell::CodeSandbox sb = make_sandbox("{\"timeout_seconds\": 30}");
    const int kRuns = 4;
    sandcell::ExecutionOutcome outcomes[kRuns];
    std::vector<std::thread> threads;
    for (int i = 0; i < kRuns; ++i) {
        threads.emplace_back([&sb, &outcomes, i] {
            std::string tag = std::to_string(i);
            outcomes[i] = sb.execute(sandcell::ExecutionRequest(
                "for n in range(200):\n"
                "    print('run-" + tag + "')\n"));
        });
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();

    for (int i = 0; i < kRuns; ++i) {
        std::string line = "run-" + std::to_string(i) + "\n";
        std::string expected;
        for (int n = 0; n < 200; ++n) expected += line;
        assert(outcomes[i].status == sandcell::OutcomeStatus::Completed);
        assert(outcomes[i].stdout_text == expected);
    }
}

int main() {
    if (access(kPython, X_OK) != 0) {
        fprintf(stderr, "skipping: %s not available\n", kPython);
        return 0;
    }
    sandcell::Logger::instance().set_level(sandcell::LogLevel::WARN);

    testRejectedNeverRuns();
    testTimeoutOverrideIsClamped();
    testCompletedRun();
    testRuntimeFailureTrace();
    testAllowedImportAtRuntime();
    testTimeout();
    testMemoryLimit();
    testMemoryLimitGrowingAllocation();
    testOutputTruncation();
    testDeterministicOutput();
    testConcurrentRunsAreIsolated();
    testFiguresInCreationOrder();
    testFigureLimitIsReported();
    return 0;
}
