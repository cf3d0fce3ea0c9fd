/*
 * sandcell - Execution Worker Implementation
 */
#include <sandcell/sandbox/worker.hpp>
#include <sandcell/sandbox/harness.hpp>
#include <sandcell/sandbox/output_buffer.hpp>
#include <sandcell/core/config.hpp>
#include <sandcell/core/logger.hpp>
#include <sandcell/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandcell {

namespace {

const int kPollIntervalMs = 50;
const size_t kReadChunk = 65536;
const size_t kDiagnosticTail = 2048;

// Loader and library directories the interpreter needs execute rights on
const char* const kLibraryDirs[] = {
    "/lib", "/lib64", "/usr/lib", "/usr/lib64", "/usr/local/lib", NULL
};

bool path_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

std::string dirname_of(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string resolve_path(const std::string& path) {
    char buf[PATH_MAX];
    if (realpath(path.c_str(), buf) == NULL) return path;
    return std::string(buf);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Resident set size from /proc/<pid>/status, -1 when unreadable
int64_t sample_rss_bytes(pid_t pid) {
    std::ifstream status("/proc/" + std::to_string(pid) + "/status");
    if (!status.is_open()) return -1;
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 6, "VmRSS:") == 0) {
            return static_cast<int64_t>(strtoll(line.c_str() + 6, NULL, 10)) * 1024;
        }
    }
    return -1;
}

// Read whatever is available. Returns false once the peer closed the fd.
bool drain_fd(int fd, OutputBuffer& buffer) {
    char chunk[kReadChunk];
    for (;;) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

std::string mib_text(int64_t bytes) {
    return std::to_string(bytes / (1024 * 1024)) + " MiB";
}

std::string launcher_failure_message(int code, const std::string& stderr_tail) {
    std::string msg;
    switch (code) {
        case kWorkerExecLauncherFailed: msg = "failed to start the confinement launcher"; break;
        case kLauncherConfinementFailed: msg = "confinement setup failed"; break;
        default: msg = "failed to start the interpreter"; break;
    }
    std::string detail = trim(stderr_tail);
    if (!detail.empty()) msg += ": " + detail;
    return msg;
}

} // namespace

// ============ RuntimeSettings ============

RuntimeSettings RuntimeSettings::from_config(const Config& cfg) {
    RuntimeSettings s;
    s.python_path = cfg.get_string("sandbox.python_path", s.python_path);
    s.launcher_path = cfg.get_string("sandbox.launcher_path", "");
    s.scratch_root = cfg.get_string("sandbox.scratch_root", s.scratch_root);
    s.require_confinement = cfg.get_bool("sandbox.require_confinement", false);
    s.readonly_paths = cfg.get_string_list("sandbox.readonly_paths");

    if (s.launcher_path.empty()) {
        std::string dir = executable_dir();
        s.launcher_path = dir.empty() ? "sandcell-confine" : join_path(dir, "sandcell-confine");
    }
    return s;
}

std::string executable_dir() {
    char buf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return "";
    buf[n] = '\0';
    return dirname_of(std::string(buf));
}

// ============ Worker ============

Worker::Worker(const RuntimeSettings& settings)
    : settings_(settings) {}

std::vector<std::string> Worker::build_argv(const ExecutionLimits& limits,
                                            const std::string& scratch) const {
    std::string python_real = resolve_path(settings_.python_path);
    std::string prefix = dirname_of(dirname_of(python_real));

    std::vector<std::string> argv;
    argv.push_back(settings_.launcher_path);
    argv.push_back("--memory");
    argv.push_back(std::to_string(limits.max_memory_bytes));
    argv.push_back("--cpu");
    argv.push_back(std::to_string(limits.cpu_time_seconds));
    argv.push_back("--fsize");
    argv.push_back(std::to_string(limits.max_file_bytes));
    argv.push_back("--nofile");
    argv.push_back(std::to_string(limits.max_open_files));
    argv.push_back("--scratch");
    argv.push_back(scratch);
    if (settings_.require_confinement) argv.push_back("--strict");

    if (path_exists(prefix)) {
        argv.push_back("--readonly");
        argv.push_back(prefix);
    }
    for (size_t i = 0; i < settings_.readonly_paths.size(); ++i) {
        if (!path_exists(settings_.readonly_paths[i])) {
            LOG_WARN("[Worker] Read-only path '%s' does not exist, skipped",
                     settings_.readonly_paths[i].c_str());
            continue;
        }
        argv.push_back("--readonly");
        argv.push_back(settings_.readonly_paths[i]);
    }

    argv.push_back("--exec");
    argv.push_back(settings_.python_path);
    if (python_real != settings_.python_path) {
        argv.push_back("--exec");
        argv.push_back(python_real);
    }
    for (int i = 0; kLibraryDirs[i] != NULL; ++i) {
        if (!path_exists(kLibraryDirs[i])) continue;
        argv.push_back("--exec");
        argv.push_back(kLibraryDirs[i]);
    }

    argv.push_back("--");
    argv.push_back(settings_.python_path);
    argv.push_back("-s");
    argv.push_back("-B");
    argv.push_back("-u");
    argv.push_back("-c");
    argv.push_back(harness_source());
    return argv;
}

std::vector<std::string> Worker::build_env(const std::string& scratch) const {
    std::vector<std::string> env;
    env.push_back("PATH=/usr/bin:/bin");
    env.push_back("HOME=" + scratch);
    env.push_back("TMPDIR=" + scratch);
    env.push_back("MPLCONFIGDIR=" + scratch);
    env.push_back("MPLBACKEND=Agg");
    env.push_back("OPENBLAS_NUM_THREADS=1");
    env.push_back("OMP_NUM_THREADS=1");
    env.push_back("MKL_NUM_THREADS=1");
    env.push_back("PYTHONHASHSEED=0");
    env.push_back("PYTHONDONTWRITEBYTECODE=1");
    env.push_back("PYTHONUNBUFFERED=1");
    env.push_back("PYTHONNOUSERSITE=1");
    env.push_back("PYTHONSAFEPATH=1");
    env.push_back("LANG=C.UTF-8");
    env.push_back("PYTHONIOENCODING=utf-8");
    return env;
}

ExecutionOutcome Worker::run(const std::string& source, const NamespaceHandle& ns,
                             const ExecutionLimits& limits) const {
    int64_t start_ms = monotonic_ms();

    // Scratch directory, removed on every path out of this function
    std::string tmpl = join_path(settings_.scratch_root, "sandcell-XXXXXX");
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');
    if (mkdtemp(tmpl_buf.data()) == NULL) {
        LOG_ERROR("[Worker] mkdtemp under %s failed: %s", settings_.scratch_root.c_str(), strerror(errno));
        return ExecutionOutcome::system_failure("cannot create scratch directory: " + std::string(strerror(errno)));
    }
    std::string scratch(tmpl_buf.data());

    struct ScratchGuard {
        std::string path;
        ~ScratchGuard() {
            if (!remove_directory_tree(path)) {
                LOG_WARN("[Worker] Could not remove scratch directory %s", path.c_str());
            }
        }
    } scratch_guard = { scratch };

    Json request;
    request["manifest"] = ns.to_manifest();
    request["source"] = source;
    std::string payload = request.dump(-1, ' ', false, Json::error_handler_t::replace);

    // argv and envp are built before fork; the child only calls async-signal-safe functions
    std::vector<std::string> args = build_argv(limits, scratch);
    std::vector<std::string> env = build_env(scratch);
    std::vector<char*> argv_ptrs;
    for (size_t i = 0; i < args.size(); ++i) argv_ptrs.push_back(const_cast<char*>(args[i].c_str()));
    argv_ptrs.push_back(NULL);
    std::vector<char*> env_ptrs;
    for (size_t i = 0; i < env.size(); ++i) env_ptrs.push_back(const_cast<char*>(env[i].c_str()));
    env_ptrs.push_back(NULL);

    long open_max = sysconf(_SC_OPEN_MAX);
    int max_fd = (open_max > 0 && open_max < 65536) ? static_cast<int>(open_max) : 65536;

    int out_pipe[2] = { -1, -1 };
    int err_pipe[2] = { -1, -1 };
    int channel[2] = { -1, -1 };
    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
        socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) < 0) {
        std::string err = strerror(errno);
        LOG_ERROR("[Worker] Cannot create pipes: %s", err.c_str());
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(channel[0]); close_fd(channel[1]);
        return ExecutionOutcome::system_failure("cannot create pipes: " + err);
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string err = strerror(errno);
        LOG_ERROR("[Worker] fork failed: %s", err.c_str());
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(channel[0]); close_fd(channel[1]);
        return ExecutionOutcome::system_failure("fork failed: " + err);
    }

    if (pid == 0) {
        // Child
        setpgid(0, 0);
        int targets[3] = { STDOUT_FILENO, STDERR_FILENO, kChannelFd };
        int sources[3] = { out_pipe[1], err_pipe[1], channel[1] };
        for (int i = 0; i < 3; ++i) {
            if (sources[i] == targets[i]) {
                fcntl(targets[i], F_SETFD, 0);
            } else if (dup2(sources[i], targets[i]) < 0) {
                _exit(kWorkerExecLauncherFailed);
            }
        }
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0 && devnull != STDIN_FILENO) {
            dup2(devnull, STDIN_FILENO);
        }
        for (int fd = kChannelFd + 1; fd < max_fd; ++fd) close(fd);

        execve(argv_ptrs[0], argv_ptrs.data(), env_ptrs.data());
        _exit(kWorkerExecLauncherFailed);
    }

    // Parent. Either side may win the setpgid race; EACCES after exec is expected.
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(channel[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    int chan_fd = channel[0];
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);
    set_nonblocking(chan_fd);

    LOG_DEBUG("[Worker] Started pid %d in %s (%zu bytes of source)", (int)pid, scratch.c_str(), source.size());

    OutputBuffer out_buf(limits.max_output_bytes);
    OutputBuffer err_buf(limits.max_output_bytes);
    std::string frame;
    size_t written = 0;
    bool write_done = false;

    int64_t timeout_ms = static_cast<int64_t>(limits.timeout_seconds * 1000.0);
    int64_t deadline = start_ms + timeout_ms;
    bool timed_out = false;
    bool memory_killed = false;
    bool frame_overflow = false;
    bool killed = false;

    while (out_fd >= 0 || err_fd >= 0 || chan_fd >= 0) {
        int64_t now = monotonic_ms();
        if (now >= deadline) {
            timed_out = true;
            break;
        }

        struct pollfd fds[3];
        int nfds = 0;
        int out_idx = -1, err_idx = -1, chan_idx = -1;
        if (out_fd >= 0) { out_idx = nfds; fds[nfds].fd = out_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; ++nfds; }
        if (err_fd >= 0) { err_idx = nfds; fds[nfds].fd = err_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; ++nfds; }
        if (chan_fd >= 0) {
            chan_idx = nfds;
            fds[nfds].fd = chan_fd;
            fds[nfds].events = POLLIN | (write_done ? 0 : POLLOUT);
            fds[nfds].revents = 0;
            ++nfds;
        }

        int wait_ms = static_cast<int>(std::min<int64_t>(kPollIntervalMs, deadline - now));
        int ready = poll(fds, nfds, wait_ms);
        if (ready < 0 && errno != EINTR) {
            LOG_ERROR("[Worker] poll failed: %s", strerror(errno));
            break;
        }

        if (ready > 0) {
            if (out_idx >= 0 && fds[out_idx].revents != 0 && !drain_fd(out_fd, out_buf)) close_fd(out_fd);
            if (err_idx >= 0 && fds[err_idx].revents != 0 && !drain_fd(err_fd, err_buf)) close_fd(err_fd);

            if (chan_idx >= 0 && !write_done && (fds[chan_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
                while (written < payload.size()) {
                    ssize_t n = send(chan_fd, payload.data() + written, payload.size() - written, MSG_NOSIGNAL);
                    if (n > 0) { written += static_cast<size_t>(n); continue; }
                    if (n < 0 && errno == EINTR) continue;
                    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                    // Peer gone; the exit status tells what happened
                    written = payload.size();
                }
                if (written >= payload.size()) {
                    shutdown(chan_fd, SHUT_WR);
                    write_done = true;
                }
            }

            if (chan_idx >= 0 && (fds[chan_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
                char chunk[kReadChunk];
                for (;;) {
                    ssize_t n = recv(chan_fd, chunk, sizeof(chunk), 0);
                    if (n > 0) {
                        frame.append(chunk, static_cast<size_t>(n));
                        if (frame.size() > limits.max_result_bytes) {
                            frame_overflow = true;
                            break;
                        }
                        continue;
                    }
                    if (n < 0 && errno == EINTR) continue;
                    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                    close_fd(chan_fd);
                    break;
                }
                if (frame_overflow) break;
            }
        }

        int64_t rss = sample_rss_bytes(pid);
        if (limits.max_memory_bytes > 0 && rss > limits.max_memory_bytes) {
            memory_killed = true;
            break;
        }
    }

    if (timed_out || memory_killed || frame_overflow) {
        kill(-pid, SIGKILL);
        killed = true;
    }

    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    int status = 0;
    pid_t waited = 0;

    // All streams closed does not mean the child is gone; keep the deadline
    while (!killed) {
        waited = wait4(pid, &status, WNOHANG, &usage);
        if (waited != 0 && !(waited < 0 && errno == EINTR)) break;
        if (monotonic_ms() >= deadline) {
            timed_out = true;
            kill(-pid, SIGKILL);
            killed = true;
            break;
        }
        sleep_ms(5);
    }
    if (killed) {
        do {
            waited = wait4(pid, &status, 0, &usage);
        } while (waited < 0 && errno == EINTR);
    }

    // Collect what was written before the child went away
    if (out_fd >= 0) { drain_fd(out_fd, out_buf); close_fd(out_fd); }
    if (err_fd >= 0) { drain_fd(err_fd, err_buf); close_fd(err_fd); }
    close_fd(chan_fd);

    int64_t duration = monotonic_ms() - start_ms;
    std::string out_text = out_buf.str();
    std::string err_text = err_buf.str();

    if (waited < 0) {
        LOG_ERROR("[Worker] wait4(%d) failed: %s", (int)pid, strerror(errno));
        return ExecutionOutcome::system_failure("lost track of the child process", out_text, err_text, duration);
    }

    if (killed) {
        LOG_DEBUG("[Worker] Killed pid %d (timeout=%d memory=%d overflow=%d)",
                  (int)pid, timed_out, memory_killed, frame_overflow);
    }
    if (timed_out) {
        return ExecutionOutcome::timed_out(out_text, err_text, duration, limits.timeout_seconds);
    }
    if (memory_killed) {
        return ExecutionOutcome::resource_exceeded(LimitKind::Memory,
            "memory limit of " + mib_text(limits.max_memory_bytes) + " exceeded",
            out_text, err_text, duration);
    }
    if (frame_overflow) {
        return ExecutionOutcome::resource_exceeded(LimitKind::Output,
            "result exceeded " + std::to_string(limits.max_result_bytes) + " bytes",
            out_text, err_text, duration);
    }

    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        int64_t peak_rss = static_cast<int64_t>(usage.ru_maxrss) * 1024;
        int64_t cpu_used = static_cast<int64_t>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec);
        if (sig == SIGXCPU || (limits.cpu_time_seconds > 0 && cpu_used >= limits.cpu_time_seconds)) {
            return ExecutionOutcome::resource_exceeded(LimitKind::Cpu,
                "CPU time limit of " + std::to_string(limits.cpu_time_seconds) + " seconds exceeded",
                out_text, err_text, duration);
        }
        if (sig == SIGXFSZ) {
            return ExecutionOutcome::resource_exceeded(LimitKind::Output,
                "file size limit of " + std::to_string(limits.max_file_bytes) + " bytes exceeded",
                out_text, err_text, duration);
        }
        if (limits.max_memory_bytes > 0 && peak_rss * 10 >= limits.max_memory_bytes * 9) {
            return ExecutionOutcome::resource_exceeded(LimitKind::Memory,
                "memory limit of " + mib_text(limits.max_memory_bytes) + " exceeded",
                out_text, err_text, duration);
        }
        const char* name = strsignal(sig);
        return ExecutionOutcome::runtime_failure(
            "terminated by signal " + std::to_string(sig) + (name ? std::string(" (") + name + ")" : ""),
            "", out_text, err_text, duration);
    }

    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (code == kWorkerExecLauncherFailed || code == kLauncherConfinementFailed ||
        code == kLauncherExecPythonFailed) {
        std::string msg = launcher_failure_message(code, err_buf.tail(kDiagnosticTail));
        LOG_ERROR("[Worker] %s", msg.c_str());
        return ExecutionOutcome::system_failure(msg, out_text, err_text, duration);
    }
    if (code == kHarnessMemoryExit) {
        return ExecutionOutcome::resource_exceeded(LimitKind::Memory,
            "memory limit of " + mib_text(limits.max_memory_bytes) + " exceeded",
            out_text, err_text, duration);
    }

    if (frame.empty()) {
        LOG_ERROR("[Worker] Child %d exited with status %d without a result", (int)pid, code);
        return ExecutionOutcome::system_failure(
            "interpreter exited with status " + std::to_string(code) + " without a result",
            out_text, err_text, duration);
    }

    Json result = Json::parse(frame, nullptr, false);
    if (result.is_discarded() || !result.is_object()) {
        LOG_ERROR("[Worker] Invalid result frame (%zu bytes)", frame.size());
        return ExecutionOutcome::system_failure("invalid result from the interpreter", out_text, err_text, duration);
    }

    std::string kind = result.value("status", "");
    if (kind == "ok") {
        std::vector<CapturedFigure> figures;
        if (result.contains("figures") && result["figures"].is_array()) {
            for (const auto& f : result["figures"]) {
                CapturedFigure fig;
                fig.sequence_index = f.value("seq", 0);
                if (!base64_decode(f.value("png", ""), fig.bytes)) {
                    LOG_WARN("[Worker] Figure %d has invalid image data, skipped", fig.sequence_index);
                    continue;
                }
                figures.push_back(fig);
            }
        }
        std::stable_sort(figures.begin(), figures.end(),
                         [](const CapturedFigure& a, const CapturedFigure& b) {
                             return a.sequence_index < b.sequence_index;
                         });
        int dropped = result.value("figures_dropped", 0);
        if (dropped > 0) {
            err_text += "[" + std::to_string(dropped) + " figure(s) not captured: limit of " +
                        std::to_string(limits.max_figures) + " reached]\n";
        }
        return ExecutionOutcome::completed(out_text, err_text, figures, duration);
    }
    if (kind == "memory") {
        return ExecutionOutcome::resource_exceeded(LimitKind::Memory,
            "memory limit of " + mib_text(limits.max_memory_bytes) + " exceeded",
            out_text, err_text, duration);
    }
    if (kind == "error") {
        std::string type = result.value("type", "Exception");
        std::string msg = result.value("message", "");
        Json frames = result.contains("frames") ? result["frames"] : Json::array();
        std::string trace = format_generated_trace(frames, source, type, msg);
        return ExecutionOutcome::runtime_failure(msg.empty() ? type : type + ": " + msg,
                                                 trace, out_text, err_text, duration);
    }
    if (kind == "harness_error") {
        std::string msg = "sandbox harness error: " + result.value("message", std::string("unknown"));
        LOG_ERROR("[Worker] %s", msg.c_str());
        return ExecutionOutcome::system_failure(msg, out_text, err_text, duration);
    }

    LOG_ERROR("[Worker] Unknown result status '%s'", kind.c_str());
    return ExecutionOutcome::system_failure("unknown result status '" + kind + "'", out_text, err_text, duration);
}

std::string format_generated_trace(const Json& frames, const std::string& source,
                                   const std::string& type, const std::string& message) {
    std::vector<std::string> lines = split(source, '\n');
    std::ostringstream trace;
    bool header = false;

    if (frames.is_array()) {
        for (const auto& f : frames) {
            if (!f.is_object() || f.value("file", "") != "<generated>") continue;
            if (!header) {
                trace << "Traceback (most recent call last):\n";
                header = true;
            }
            int line = f.value("line", 0);
            trace << "  File \"<generated>\", line " << line << ", in " << f.value("name", "<module>") << "\n";
            if (line >= 1 && static_cast<size_t>(line) <= lines.size()) {
                std::string text = trim(lines[line - 1]);
                if (!text.empty()) trace << "    " << text << "\n";
            }
        }
    }

    trace << type;
    if (!message.empty()) trace << ": " << message;
    return trace.str();
}

} // namespace sandcell
