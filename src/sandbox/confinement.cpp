/*
 * sandcell - Process Confinement Implementation
 *
 * Landlock has no glibc wrappers; the raw syscalls are used. Rules are
 * added per path with O_PATH descriptors. Paths that do not exist on this
 * system are skipped.
 */
#include <sandcell/sandbox/confinement.hpp>
#include <sandcell/core/logger.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <linux/landlock.h>
#include <seccomp.h>

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

#ifndef LANDLOCK_CREATE_RULESET_VERSION
#define LANDLOCK_CREATE_RULESET_VERSION (1U << 0)
#endif

// Filesystem access rights of Landlock ABI v1
#define SANDCELL_LANDLOCK_FS_V1 ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_WRITE_FILE       | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         | \
    LANDLOCK_ACCESS_FS_REMOVE_DIR       | \
    LANDLOCK_ACCESS_FS_REMOVE_FILE      | \
    LANDLOCK_ACCESS_FS_MAKE_CHAR        | \
    LANDLOCK_ACCESS_FS_MAKE_DIR         | \
    LANDLOCK_ACCESS_FS_MAKE_REG         | \
    LANDLOCK_ACCESS_FS_MAKE_SOCK        | \
    LANDLOCK_ACCESS_FS_MAKE_FIFO        | \
    LANDLOCK_ACCESS_FS_MAKE_BLOCK       | \
    LANDLOCK_ACCESS_FS_MAKE_SYM         \
)

// Rights that apply to regular files (rules on non-directories)
#define SANDCELL_LANDLOCK_FILE_RIGHTS ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_WRITE_FILE       | \
    LANDLOCK_ACCESS_FS_READ_FILE        \
)

static inline int landlock_create_ruleset(
    const struct landlock_ruleset_attr* attr,
    size_t size, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

static inline int landlock_add_rule(
    int ruleset_fd, enum landlock_rule_type type,
    const void* attr, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags));
}

static inline int landlock_restrict_self(int ruleset_fd, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_restrict_self, ruleset_fd, flags));
}

namespace sandcell {

namespace {

const char* const kSystemReadonly[] = {
    "/usr", "/lib", "/lib64", "/etc", "/dev", "/sys", NULL
};

// Only the interpreter's own /proc entry plus CPU and memory summaries.
// Other processes under /proc stay unreadable.
const char* const kProcReadonly[] = {
    "/proc/self", "/proc/cpuinfo", "/proc/meminfo", "/proc/stat", NULL
};

// Denied with EPERM. execve stays allowed: the launcher still has to exec
// the interpreter after the filter is loaded.
const int kDeniedSyscalls[] = {
    SCMP_SYS(socket), SCMP_SYS(connect), SCMP_SYS(bind), SCMP_SYS(listen),
    SCMP_SYS(accept), SCMP_SYS(accept4),
    SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
    SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
    SCMP_SYS(unshare), SCMP_SYS(setns),
    SCMP_SYS(kexec_load), SCMP_SYS(init_module), SCMP_SYS(finit_module),
    SCMP_SYS(delete_module), SCMP_SYS(bpf), SCMP_SYS(perf_event_open),
    SCMP_SYS(keyctl), SCMP_SYS(add_key), SCMP_SYS(request_key),
    SCMP_SYS(userfaultfd), SCMP_SYS(reboot), SCMP_SYS(swapon), SCMP_SYS(swapoff),
    SCMP_SYS(syslog), SCMP_SYS(acct), SCMP_SYS(settimeofday), SCMP_SYS(clock_settime),
    SCMP_SYS(fork), SCMP_SYS(vfork), SCMP_SYS(execveat),
    SCMP_SYS(tkill), SCMP_SYS(pidfd_open), SCMP_SYS(pidfd_send_signal),
    SCMP_SYS(pidfd_getfd),
};

// Signal syscalls whose first argument is a target process; allowed only
// when it names the confined process itself
const int kSignalSyscalls[] = {
    SCMP_SYS(kill), SCMP_SYS(tgkill),
    SCMP_SYS(rt_sigqueueinfo), SCMP_SYS(rt_tgsigqueueinfo),
};

int landlock_abi_version() {
    int abi = landlock_create_ruleset(NULL, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi < 0 ? 0 : abi;
}

} // namespace

ConfinementSupport detect_confinement() {
    ConfinementSupport s;
    s.landlock_abi = landlock_abi_version();
    s.landlock = s.landlock_abi > 0;
    s.seccomp = prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
    return s;
}

Confinement::Confinement(const ConfinementSpec& spec)
    : spec_(spec)
    , support_(detect_confinement())
    , landlock_active_(false)
    , seccomp_active_(false)
{
}

bool Confinement::fail(const std::string& msg) {
    error_ = msg;
    LOG_ERROR("[Confine] %s", msg.c_str());
    return false;
}

bool Confinement::degrade(const std::string& msg) {
    if (spec_.strict) return fail(msg);
    LOG_DEBUG("[Confine] %s (continuing without it)", msg.c_str());
    return true;
}

bool Confinement::apply_resource_limits() {
    // glibc types the resource argument as an enum in C++
    typedef decltype(RLIMIT_CORE) Resource;
    struct Limit {
        Resource resource;
        rlim_t soft;
        rlim_t hard;
        const char* name;
    };

    std::vector<Limit> limits;
    if (spec_.memory_bytes > 0) {
        rlim_t mem = static_cast<rlim_t>(spec_.memory_bytes);
        limits.push_back(Limit{RLIMIT_AS, mem, mem, "RLIMIT_AS"});
    }
    if (spec_.cpu_seconds > 0) {
        // SIGXCPU at the soft limit, SIGKILL one second later
        rlim_t cpu = static_cast<rlim_t>(spec_.cpu_seconds);
        limits.push_back(Limit{RLIMIT_CPU, cpu, cpu + 1, "RLIMIT_CPU"});
    }
    if (spec_.file_bytes >= 0) {
        rlim_t fsize = static_cast<rlim_t>(spec_.file_bytes);
        limits.push_back(Limit{RLIMIT_FSIZE, fsize, fsize, "RLIMIT_FSIZE"});
    }
    if (spec_.open_files > 0) {
        rlim_t nofile = static_cast<rlim_t>(spec_.open_files);
        limits.push_back(Limit{RLIMIT_NOFILE, nofile, nofile, "RLIMIT_NOFILE"});
    }
    limits.push_back(Limit{RLIMIT_CORE, 0, 0, "RLIMIT_CORE"});

    for (size_t i = 0; i < limits.size(); ++i) {
        struct rlimit rl;
        rl.rlim_cur = limits[i].soft;
        rl.rlim_max = limits[i].hard;

        // Never raise an inherited hard limit
        struct rlimit current;
        if (getrlimit(limits[i].resource, &current) == 0 && current.rlim_max != RLIM_INFINITY) {
            if (rl.rlim_max > current.rlim_max) rl.rlim_max = current.rlim_max;
            if (rl.rlim_cur > rl.rlim_max) rl.rlim_cur = rl.rlim_max;
        }
        if (setrlimit(limits[i].resource, &rl) < 0) {
            return fail(std::string("setrlimit(") + limits[i].name + ") failed: " + strerror(errno));
        }
    }
    return true;
}

bool Confinement::apply_landlock() {
    if (!support_.landlock) {
        if (spec_.strict) {
            return fail("Landlock is not supported by this kernel (Linux >= 5.13 required)");
        }
        return true;
    }

    __u64 handled = SANDCELL_LANDLOCK_FS_V1;
#ifdef LANDLOCK_ACCESS_FS_REFER
    if (support_.landlock_abi >= 2) handled |= LANDLOCK_ACCESS_FS_REFER;
#endif
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
    if (support_.landlock_abi >= 3) handled |= LANDLOCK_ACCESS_FS_TRUNCATE;
#endif

    struct landlock_ruleset_attr ruleset_attr;
    memset(&ruleset_attr, 0, sizeof(ruleset_attr));
    ruleset_attr.handled_access_fs = handled;

    int ruleset_fd = landlock_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0);
    if (ruleset_fd < 0) {
        return degrade(std::string("Failed to create Landlock ruleset: ") + strerror(errno));
    }

    // Returns 1 on success, 0 when the path does not exist, -1 on error
    auto add_rule = [&](const std::string& path, __u64 access) -> int {
        int fd = open(path.c_str(), O_PATH | O_CLOEXEC);
        if (fd < 0) {
            return errno == ENOENT ? 0 : -1;
        }
        struct stat st;
        if (fstat(fd, &st) == 0 && !S_ISDIR(st.st_mode)) {
            access &= SANDCELL_LANDLOCK_FILE_RIGHTS;
        }

        struct landlock_path_beneath_attr path_attr;
        memset(&path_attr, 0, sizeof(path_attr));
        path_attr.allowed_access = access & handled;
        path_attr.parent_fd = fd;

        int ret = landlock_add_rule(ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &path_attr, 0);
        int saved = errno;
        close(fd);
        errno = saved;
        return ret < 0 ? -1 : 1;
    };

    const __u64 read_only = LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;

    // Read-write scratch directory
    if (add_rule(spec_.scratch_dir, handled) != 1) {
        int err = errno;
        close(ruleset_fd);
        return fail("Cannot add Landlock rule for scratch '" + spec_.scratch_dir + "': " + strerror(err));
    }

    for (int i = 0; kSystemReadonly[i] != NULL; ++i) {
        add_rule(kSystemReadonly[i], read_only);
    }
    // O_PATH follows /proc/self to /proc/<pid>, which stays valid across exec
    for (int i = 0; kProcReadonly[i] != NULL; ++i) {
        add_rule(kProcReadonly[i], read_only);
    }
    for (size_t i = 0; i < spec_.readonly_paths.size(); ++i) {
        if (add_rule(spec_.readonly_paths[i], read_only) < 0) {
            int err = errno;
            close(ruleset_fd);
            return fail("Cannot add Landlock rule for '" + spec_.readonly_paths[i] + "': " + strerror(err));
        }
    }
    for (size_t i = 0; i < spec_.exec_paths.size(); ++i) {
        if (add_rule(spec_.exec_paths[i], read_only | LANDLOCK_ACCESS_FS_EXECUTE) < 0) {
            int err = errno;
            close(ruleset_fd);
            return fail("Cannot add Landlock rule for '" + spec_.exec_paths[i] + "': " + strerror(err));
        }
    }

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        int err = errno;
        close(ruleset_fd);
        return fail(std::string("Failed to set no_new_privs: ") + strerror(err));
    }

    if (landlock_restrict_self(ruleset_fd, 0) < 0) {
        int err = errno;
        close(ruleset_fd);
        return degrade(std::string("Failed to restrict self: ") + strerror(err));
    }
    close(ruleset_fd);
    landlock_active_ = true;
    return true;
}

bool Confinement::apply_seccomp() {
    if (!support_.seccomp) {
        if (spec_.strict) {
            return fail("seccomp is not supported by this kernel");
        }
        return true;
    }

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        return degrade("seccomp_init failed");
    }

    for (size_t i = 0; i < sizeof(kDeniedSyscalls) / sizeof(kDeniedSyscalls[0]); ++i) {
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), kDeniedSyscalls[i], 0);
        // Syscalls absent on this architecture are reported as -EDOM/-EINVAL
        if (rc != 0 && rc != -EDOM && rc != -EINVAL) {
            seccomp_release(ctx);
            return fail(std::string("seccomp_rule_add failed: ") + strerror(-rc));
        }
    }

    // Signals may only target this process: kill(0) and negative process
    // group targets are denied along with every other pid
    const scmp_datum_t self = static_cast<scmp_datum_t>(getpid());
    for (size_t i = 0; i < sizeof(kSignalSyscalls) / sizeof(kSignalSyscalls[0]); ++i) {
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), kSignalSyscalls[i], 1,
                                  SCMP_A0(SCMP_CMP_NE, self));
        if (rc != 0 && rc != -EDOM && rc != -EINVAL) {
            seccomp_release(ctx);
            return fail(std::string("seccomp signal rule failed: ") + strerror(-rc));
        }
    }

    // Threads are allowed, new processes are not
    int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(clone), 1,
                              SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_THREAD, 0));
    if (rc != 0) {
        seccomp_release(ctx);
        return fail(std::string("seccomp clone rule failed: ") + strerror(-rc));
    }
    // clone3 flags live in user memory; make libc fall back to clone
    rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(clone3), 0);
    if (rc != 0 && rc != -EDOM && rc != -EINVAL) {
        seccomp_release(ctx);
        return fail(std::string("seccomp clone3 rule failed: ") + strerror(-rc));
    }

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        int err = errno;
        seccomp_release(ctx);
        return fail(std::string("Failed to set no_new_privs: ") + strerror(err));
    }

    rc = seccomp_load(ctx);
    seccomp_release(ctx);
    if (rc != 0) {
        return degrade(std::string("seccomp_load failed: ") + strerror(-rc));
    }
    seccomp_active_ = true;
    return true;
}

bool Confinement::apply_all() {
    if (!apply_resource_limits()) return false;
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        return fail(std::string("Failed to set no_new_privs: ") + strerror(errno));
    }
    if (!apply_landlock()) return false;
    if (!apply_seccomp()) return false;
    return true;
}

} // namespace sandcell
