/*
 * sandcell - Execution Worker
 *
 * Runs one validated program in a fresh confined child process:
 *
 *   worker --fork--> sandcell-confine --exec--> python3 -c <harness>
 *
 * The worker owns the child's lifetime. It streams the request over a
 * socketpair on fd 3, drains stdout and stderr into bounded buffers,
 * enforces the wall-clock deadline by killing the process group and
 * classifies the way the child ended into an ExecutionOutcome.
 */
#ifndef sandcell_SANDBOX_WORKER_HPP
#define sandcell_SANDBOX_WORKER_HPP

#include <sandcell/sandbox/namespace_builder.hpp>
#include <sandcell/sandbox/outcome.hpp>
#include <sandcell/sandbox/policy.hpp>

#include <string>
#include <vector>

namespace sandcell {

class Config;

// Where the interpreter and launcher live and how strict confinement is
struct RuntimeSettings {
    std::string python_path;
    std::string launcher_path;
    std::string scratch_root;
    bool require_confinement;
    std::vector<std::string> readonly_paths;

    RuntimeSettings()
        : python_path("/usr/bin/python3"), scratch_root("/tmp"), require_confinement(false) {}

    // "sandbox.python_path", "sandbox.launcher_path", ... ; an empty
    // launcher path means "sandcell-confine next to this executable"
    static RuntimeSettings from_config(const Config& cfg);
};

// Directory of the running executable, empty when /proc is unavailable
std::string executable_dir();

class Worker {
public:
    explicit Worker(const RuntimeSettings& settings);

    // Blocks until the child has exited or been killed
    ExecutionOutcome run(const std::string& source, const NamespaceHandle& ns,
                         const ExecutionLimits& limits) const;

    const RuntimeSettings& settings() const { return settings_; }

private:
    std::vector<std::string> build_argv(const ExecutionLimits& limits,
                                        const std::string& scratch) const;
    std::vector<std::string> build_env(const std::string& scratch) const;

    RuntimeSettings settings_;
};

// Builds the traceback text shown to callers from the harness frames:
// only "<generated>" frames survive, each with its source line.
std::string format_generated_trace(const Json& frames, const std::string& source,
                                   const std::string& type, const std::string& message);

} // namespace sandcell

#endif // sandcell_SANDBOX_WORKER_HPP
