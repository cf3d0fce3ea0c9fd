/*
 * sandcell - Python Harness Source
 */
#include <sandcell/sandbox/harness.hpp>

namespace sandcell {

namespace {

const char* const kHarness = R"PY(
import base64
import builtins
import gc
import importlib
import io
import json
import os
import sys
import traceback

CHANNEL = 3


def send(obj):
    data = json.dumps(obj).encode("utf-8")
    view = memoryview(data)
    while view:
        written = os.write(CHANNEL, view)
        view = view[written:]


def read_request():
    chunks = []
    while True:
        chunk = os.read(CHANNEL, 65536)
        if not chunk:
            break
        chunks.append(chunk)
    return json.loads(b"".join(chunks).decode("utf-8"))


def make_module_check(allowed):
    exact = set()
    prefixes = []
    for entry in allowed:
        if entry.endswith(".*"):
            prefixes.append(entry[:-2])
        else:
            exact.add(entry)

    def module_allowed(name):
        if name in exact:
            return True
        for base in prefixes:
            if name == base or name.startswith(base + "."):
                return True
        return False

    return module_allowed


class FigureRecorder(object):
    def __init__(self, enabled, limit, dpi):
        self.enabled = enabled
        self.limit = limit
        self.dpi = dpi
        self.hooked = False
        self.counter = 0
        self.sequence = {}
        self.tagged = []
        self.captured = set()
        self.figures = []
        self.dropped = 0

    def pyplot(self):
        return sys.modules.get("matplotlib.pyplot")

    def install(self):
        if self.hooked or not self.enabled:
            return
        plt = self.pyplot()
        if plt is None:
            return
        self.hooked = True
        recorder = self
        original_figure = plt.figure
        original_close = plt.close

        def figure(*args, **kwargs):
            fig = original_figure(*args, **kwargs)
            recorder.tag(fig)
            return fig

        def show(*args, **kwargs):
            for fig in recorder.open_figures():
                recorder.capture(fig)
            original_close("all")

        def close(fig=None):
            for target in recorder.resolve(fig):
                recorder.capture(target)
            return original_close(fig)

        figure.__doc__ = original_figure.__doc__
        plt.figure = figure
        plt.show = show
        plt.close = close

    def tag(self, fig):
        key = id(fig)
        if key not in self.sequence:
            # Hold the figure so its id() is never reused
            self.tagged.append(fig)
            self.sequence[key] = self.counter
            self.counter += 1
        return self.sequence[key]

    def open_figures(self):
        from matplotlib import _pylab_helpers
        figs = [m.canvas.figure for m in _pylab_helpers.Gcf.get_all_fig_managers()]
        return sorted(figs, key=self.tag)

    def resolve(self, arg):
        from matplotlib import _pylab_helpers
        from matplotlib.figure import Figure
        if arg is None:
            manager = _pylab_helpers.Gcf.get_active()
            return [manager.canvas.figure] if manager is not None else []
        if isinstance(arg, str) and arg == "all":
            return self.open_figures()
        if isinstance(arg, Figure):
            return [arg]
        if isinstance(arg, int):
            manager = _pylab_helpers.Gcf.get_fig_manager(arg)
            return [manager.canvas.figure] if manager is not None else []
        if isinstance(arg, str):
            return [f for f in self.open_figures() if f.get_label() == arg]
        return []

    def capture(self, fig):
        key = id(fig)
        if key in self.captured:
            return
        self.captured.add(key)
        seq = self.tag(fig)
        if len(self.figures) >= self.limit:
            self.dropped += 1
            return
        buf = io.BytesIO()
        fig.savefig(buf, format="png", dpi=self.dpi, metadata={"Software": None})
        self.figures.append((seq, buf.getvalue()))

    def finish(self):
        if not self.hooked:
            return
        for fig in self.open_figures():
            self.capture(fig)
        plt = self.pyplot()
        if plt is not None:
            plt.close("all")

    def report(self):
        ordered = sorted(self.figures, key=lambda item: item[0])
        return [{"seq": seq, "png": base64.b64encode(png).decode("ascii")}
                for seq, png in ordered]


def main():
    try:
        request = read_request()
        manifest = request["manifest"]
        source = request["source"]
    except Exception as exc:
        send({"status": "harness_error", "message": "bad request: %s" % exc})
        return

    module_allowed = make_module_check(manifest.get("allowed_modules", []))
    blocked = set(manifest.get("blocked_names", []))
    recorder = FigureRecorder(bool(manifest.get("capture_figures")),
                              int(manifest.get("max_figures", 16)),
                              int(manifest.get("figure_dpi", 100)))
    real_import = builtins.__import__

    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        if level != 0:
            raise ImportError("relative imports are not allowed")
        for part in name.split("."):
            if part.startswith("_") or part in blocked:
                raise ImportError("import of '%s' is not allowed" % name)
        if not module_allowed(name):
            raise ImportError("import of '%s' is not allowed" % name)
        for item in fromlist or ():
            if item != "*" and (item.startswith("_") or item in blocked):
                raise ImportError("import of '%s' from '%s' is not allowed" % (item, name))
        module = real_import(name, globals, locals, fromlist, level)
        recorder.install()
        return module

    class LazyModule(object):
        __slots__ = ("_sc_name", "_sc_module")

        def __init__(self, name):
            object.__setattr__(self, "_sc_name", name)
            object.__setattr__(self, "_sc_module", None)

        def _sc_load(self):
            module = object.__getattribute__(self, "_sc_module")
            if module is None:
                module = importlib.import_module(object.__getattribute__(self, "_sc_name"))
                object.__setattr__(self, "_sc_module", module)
                recorder.install()
            return module

        def __getattr__(self, attr):
            return getattr(self._sc_load(), attr)

        def __setattr__(self, attr, value):
            setattr(self._sc_load(), attr, value)

        def __dir__(self):
            return dir(self._sc_load())

        def __repr__(self):
            return repr(self._sc_load())

    safe_builtins = {}
    for name in manifest.get("builtins", []):
        if hasattr(builtins, name):
            safe_builtins[name] = getattr(builtins, name)
    safe_builtins["__import__"] = guarded_import
    safe_builtins["__build_class__"] = builtins.__build_class__

    namespace = {"__builtins__": safe_builtins, "__name__": "__sandbox__"}
    for alias, module in manifest.get("aliases", {}).items():
        namespace[alias] = LazyModule(module)

    try:
        code = compile(source, "<generated>", "exec", dont_inherit=True)
        exec(code, namespace)
        recorder.install()
        recorder.finish()
        result = {"status": "ok", "figures": recorder.report(),
                  "figures_dropped": recorder.dropped}
    except MemoryError:
        namespace.clear()
        recorder.figures = []
        recorder.tagged = []
        gc.collect()
        try:
            send({"status": "memory"})
        except BaseException:
            os._exit(86)
        return
    except BaseException as exc:
        try:
            message = str(exc)
        except BaseException:
            message = "<unprintable %s>" % type(exc).__name__
        frames = []
        if isinstance(exc, SyntaxError) and exc.filename == "<generated>":
            frames.append({"file": "<generated>", "line": exc.lineno or 0, "name": "<module>"})
        for frame in traceback.extract_tb(exc.__traceback__):
            frames.append({"file": frame.filename, "line": frame.lineno or 0, "name": frame.name})
        result = {"status": "error", "type": type(exc).__name__, "message": message,
                  "frames": frames}

    try:
        send(result)
    except MemoryError:
        result = None
        gc.collect()
        try:
            send({"status": "memory"})
        except BaseException:
            os._exit(86)


main()
sys.stdout.flush()
sys.stderr.flush()
os._exit(0)
)PY";

} // namespace

const char* harness_source() {
    return kHarness;
}

} // namespace sandcell
