/*
 * sandcell - Python Harness
 *
 * The fixed Python program the interpreter runs inside the confined
 * child. It reads one request from fd 3 ({"manifest": ..., "source": ...}
 * until EOF), builds the restricted namespace, executes the source as
 * "<generated>", captures figures and writes one JSON result frame back
 * to fd 3:
 *
 *   {"status": "ok", "figures": [{"seq", "png"}], "figures_dropped": n}
 *   {"status": "error", "type", "message", "frames": [{"file", "line", "name"}]}
 *   {"status": "memory"}
 *   {"status": "harness_error", "message"}
 *
 * When even the memory report cannot be sent the harness exits with
 * kHarnessMemoryExit.
 */
#ifndef sandcell_SANDBOX_HARNESS_HPP
#define sandcell_SANDBOX_HARNESS_HPP

namespace sandcell {

// Channel fd inside the child
const int kChannelFd = 3;

// Exit codes shared by the worker, launcher and harness
const int kHarnessMemoryExit = 86;
const int kLauncherExecPythonFailed = 125;
const int kLauncherConfinementFailed = 126;
const int kWorkerExecLauncherFailed = 127;

const char* harness_source();

} // namespace sandcell

#endif // sandcell_SANDBOX_HARNESS_HPP
