/*
 * sandcell - Process Confinement (rlimits, Landlock, seccomp)
 *
 * Applied by the sandcell-confine launcher to itself right before it execs
 * the interpreter, so the restrictions cover the interpreter and nothing
 * else. Landlock restricts filesystem access to read-only system paths and
 * a read-write scratch directory; the seccomp filter denies networking,
 * process creation, signals to other processes and kernel administration
 * syscalls. Under /proc only the process's own entry is readable.
 *
 * Landlock needs Linux >= 5.13. When confinement is not strict, a kernel
 * without Landlock or seccomp support degrades to rlimits only.
 */
#ifndef sandcell_SANDBOX_CONFINEMENT_HPP
#define sandcell_SANDBOX_CONFINEMENT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace sandcell {

struct ConfinementSpec {
    int64_t memory_bytes;      // RLIMIT_AS, 0 = unlimited
    int cpu_seconds;           // RLIMIT_CPU soft limit, 0 = unlimited
    int64_t file_bytes;        // RLIMIT_FSIZE
    int open_files;            // RLIMIT_NOFILE
    std::vector<std::string> readonly_paths;
    std::vector<std::string> exec_paths;
    std::string scratch_dir;
    bool strict;

    ConfinementSpec()
        : memory_bytes(0), cpu_seconds(0), file_bytes(0), open_files(64), strict(false) {}
};

struct ConfinementSupport {
    bool landlock;
    int landlock_abi;
    bool seccomp;

    ConfinementSupport() : landlock(false), landlock_abi(0), seccomp(false) {}
};

// Kernel feature detection; safe to call from any process
ConfinementSupport detect_confinement();

class Confinement {
public:
    explicit Confinement(const ConfinementSpec& spec);

    // Each step returns false on failure and leaves a message in error().
    // Unsupported features are skipped unless strict is set.
    bool apply_resource_limits();
    bool apply_landlock();
    bool apply_seccomp();

    // All three in order plus no_new_privs
    bool apply_all();

    const std::string& error() const { return error_; }
    bool landlock_active() const { return landlock_active_; }
    bool seccomp_active() const { return seccomp_active_; }

private:
    bool fail(const std::string& msg);
    // fail() when strict, otherwise note and continue
    bool degrade(const std::string& msg);

    ConfinementSpec spec_;
    ConfinementSupport support_;
    std::string error_;
    bool landlock_active_;
    bool seccomp_active_;
};

} // namespace sandcell

#endif // sandcell_SANDBOX_CONFINEMENT_HPP
