/*
 * sandcell-confine - Confinement launcher
 *
 * Applies resource limits, Landlock filesystem rules and a seccomp filter
 * to itself, changes into the scratch directory and execs the given
 * program. Started by the execution worker for every request; single
 * threaded so the restrictions apply to the whole process.
 *
 * Usage:
 *   sandcell-confine [options] -- <program> [args...]
 *
 * Exit codes (before exec): 2 usage, 126 confinement failed,
 * 125 exec of the program failed.
 */
#include <sandcell/sandbox/confinement.hpp>
#include <sandcell/sandbox/harness.hpp>
#include <sandcell/core/logger.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <unistd.h>

namespace {

void print_usage(const char* prog) {
    fprintf(stderr,
        "Usage: %s [options] -- <program> [args...]\n"
        "\n"
        "Options:\n"
        "  --memory BYTES      Address space limit (RLIMIT_AS)\n"
        "  --cpu SECONDS       CPU time limit (RLIMIT_CPU)\n"
        "  --fsize BYTES       Largest file the program may write\n"
        "  --nofile N          Open file limit\n"
        "  --readonly PATH     Extra read-only path (repeatable)\n"
        "  --exec PATH         Path the program may execute from (repeatable)\n"
        "  --scratch DIR       Read-write working directory (required)\n"
        "  --strict            Fail when Landlock or seccomp is unavailable\n"
        "  --support           Print kernel support and exit\n"
        "  --help, -h          Show this help\n",
        prog);
}

bool parse_number(const char* text, long long& out) {
    char* end = nullptr;
    errno = 0;
    long long v = strtoll(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || v < 0) return false;
    out = v;
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    sandcell::ConfinementSpec spec;
    int cmd_start = -1;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        long long n = 0;

        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(arg, "--support") == 0) {
            sandcell::ConfinementSupport s = sandcell::detect_confinement();
            printf("landlock=%d abi=%d seccomp=%d\n", s.landlock ? 1 : 0, s.landlock_abi, s.seccomp ? 1 : 0);
            return 0;
        } else if (strcmp(arg, "--strict") == 0) {
            spec.strict = true;
        } else if (strcmp(arg, "--memory") == 0 && has_value && parse_number(argv[i + 1], n)) {
            spec.memory_bytes = n;
            ++i;
        } else if (strcmp(arg, "--cpu") == 0 && has_value && parse_number(argv[i + 1], n)) {
            spec.cpu_seconds = static_cast<int>(n);
            ++i;
        } else if (strcmp(arg, "--fsize") == 0 && has_value && parse_number(argv[i + 1], n)) {
            spec.file_bytes = n;
            ++i;
        } else if (strcmp(arg, "--nofile") == 0 && has_value && parse_number(argv[i + 1], n)) {
            spec.open_files = static_cast<int>(n);
            ++i;
        } else if (strcmp(arg, "--readonly") == 0 && has_value) {
            spec.readonly_paths.push_back(argv[++i]);
        } else if (strcmp(arg, "--exec") == 0 && has_value) {
            spec.exec_paths.push_back(argv[++i]);
        } else if (strcmp(arg, "--scratch") == 0 && has_value) {
            spec.scratch_dir = argv[++i];
        } else if (strcmp(arg, "--") == 0) {
            cmd_start = i + 1;
            break;
        } else {
            fprintf(stderr, "sandcell-confine: invalid option: %s\n", arg);
            print_usage(argv[0]);
            return 2;
        }
    }

    if (cmd_start < 0 || cmd_start >= argc || spec.scratch_dir.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    // Only failures are worth reporting; stderr belongs to the sandboxed program
    sandcell::Logger::instance().set_level(sandcell::LogLevel::ERROR);

    sandcell::Confinement confinement(spec);
    if (!confinement.apply_all()) {
        fprintf(stderr, "sandcell-confine: %s\n", confinement.error().c_str());
        return sandcell::kLauncherConfinementFailed;
    }

    if (chdir(spec.scratch_dir.c_str()) < 0) {
        fprintf(stderr, "sandcell-confine: chdir(%s) failed: %s\n",
                spec.scratch_dir.c_str(), strerror(errno));
        return sandcell::kLauncherConfinementFailed;
    }

    execv(argv[cmd_start], argv + cmd_start);
    fprintf(stderr, "sandcell-confine: exec %s failed: %s\n", argv[cmd_start], strerror(errno));
    return sandcell::kLauncherExecPythonFailed;
}
