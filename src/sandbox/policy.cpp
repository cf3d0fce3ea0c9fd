/*
 * sandcell - Execution Policy Implementation
 */
#include <sandcell/sandbox/policy.hpp>
#include <sandcell/core/config.hpp>
#include <sandcell/core/logger.hpp>
#include <sandcell/core/utils.hpp>

#include <algorithm>

namespace sandcell {

namespace {

const int64_t kMiB = 1024 * 1024;

const char* const kStdlibModules[] = {
    "math", "cmath", "statistics", "random", "itertools", "functools",
    "collections", "collections.abc", "datetime", "decimal", "fractions",
    "json", "re", "string", "heapq", "bisect", "copy", "enum", NULL
};

const char* const kDefaultPackages[] = {
    "numpy", "pandas", "matplotlib", "seaborn", "scipy", "scikit-learn", NULL
};

const char* const kForbiddenBuiltins[] = {
    "eval", "exec", "compile", "__import__", "getattr", "setattr", "delattr",
    "hasattr", "globals", "locals", "vars", "dir", "breakpoint", "input",
    "help", "memoryview", "exit", "quit", "copyright", "credits", "license",
    "__build_class__", "__loader__", "__spec__", NULL
};

const char* const kCapabilityNames[] = {
    "open", "os", "sys", "subprocess", "socket", "shutil", "pathlib", "io",
    "ctypes", "importlib", "builtins", "pickle", "marshal", "shelve",
    "threading", "multiprocessing", "concurrent", "asyncio", "signal",
    "resource", "gc", "inspect", "pty", "fcntl", "posix", "mmap",
    "tempfile", "urllib", "http", "ftplib", "smtplib", "requests",
    "webbrowser", "sqlite3", "selectors", "runpy", "pkgutil", "zipimport",
    "sysconfig", "faulthandler", "tracemalloc", "platform", "ctypeslib", NULL
};

const char* const kForbiddenAttributes[] = {
    // frame, generator and code introspection
    "gi_frame", "gi_code", "gi_yieldfrom", "cr_frame", "cr_code", "cr_await",
    "ag_frame", "ag_code", "f_globals", "f_locals", "f_builtins", "f_back",
    "f_code", "f_trace", "tb_frame", "tb_next", "co_code", "func_globals",
    "mro",
    // lookups by computed name and evaluation of expression strings
    "attrgetter", "methodcaller", "get_type_hints", "ForwardRef",
    "singledispatch", "singledispatchmethod", "vformat", "get_field",
    "eval", "exec", "query", "f2py", "LowLevelCallable",
    // file and process entry points of the scientific stack
    "load", "save", "savez", "savez_compressed", "savetxt",
    "loadtxt", "genfromtxt", "fromfile", "tofile", "fromregex", "memmap",
    "DataSource", "read_csv", "read_table", "read_fwf", "read_excel",
    "read_json", "read_html", "read_xml", "read_parquet", "read_orc",
    "read_feather", "read_pickle", "read_sql", "read_sql_query",
    "read_sql_table", "read_hdf", "read_sas", "read_spss", "read_stata",
    "read_clipboard", "to_csv", "to_excel", "to_json", "to_parquet",
    "to_orc", "to_feather", "to_pickle", "to_sql", "to_hdf", "to_stata",
    "to_clipboard", "to_xml", "savefig", "imsave", "imread", "ctypeslib",
    "loadmat", "savemat", "load_svmlight_file", "dump_svmlight_file",
    "fetch_openml", "get_data_home", "load_dataset", "get_sample_data",
    // blocking and interactive calls
    "pause", "ginput", "waitforbuttonpress", "install_repl_displayhook",
    NULL
};

const char* const kAllowedDunders[] = {
    "__init__", "__post_init__", "__repr__", "__str__", "__format__",
    "__eq__", "__ne__", "__lt__", "__le__", "__gt__", "__ge__", "__hash__",
    "__bool__", "__len__", "__iter__", "__next__", "__reversed__",
    "__contains__", "__getitem__", "__setitem__", "__delitem__",
    "__add__", "__sub__", "__mul__", "__matmul__", "__truediv__",
    "__floordiv__", "__mod__", "__divmod__", "__pow__", "__neg__",
    "__pos__", "__abs__", "__invert__", "__radd__", "__rsub__", "__rmul__",
    "__rmatmul__", "__rtruediv__", "__rfloordiv__", "__rmod__", "__rpow__",
    "__iadd__", "__isub__", "__imul__", "__itruediv__", "__and__", "__or__",
    "__xor__", "__int__", "__float__", "__complex__", "__round__",
    "__index__", "__call__", "__enter__", "__exit__", NULL
};

const char* const kBuiltins[] = {
    "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes",
    "callable", "chr", "classmethod", "complex", "dict", "divmod",
    "enumerate", "filter", "float", "format", "frozenset", "hash", "hex",
    "id", "int", "isinstance", "issubclass", "iter", "len", "list", "map",
    "max", "min", "next", "object", "oct", "ord", "pow", "print",
    "property", "range", "repr", "reversed", "round", "set", "slice",
    "sorted", "staticmethod", "str", "sum", "super", "tuple", "type", "zip",
    "NotImplemented", "Ellipsis",
    "BaseException", "Exception", "ArithmeticError", "AssertionError",
    "AttributeError", "FloatingPointError", "IndexError", "KeyError",
    "LookupError", "MemoryError", "NameError", "NotImplementedError",
    "OverflowError", "RecursionError", "RuntimeError", "StopIteration",
    "TypeError", "ValueError", "ZeroDivisionError", "ImportError",
    "ModuleNotFoundError", "UnicodeError", "Warning", "UserWarning",
    "DeprecationWarning", "RuntimeWarning", "FutureWarning", NULL
};

// alias, module
const char* const kAliases[][2] = {
    {"np", "numpy"},
    {"numpy", "numpy"},
    {"pd", "pandas"},
    {"pandas", "pandas"},
    {"plt", "matplotlib.pyplot"},
    {"matplotlib", "matplotlib"},
    {"sns", "seaborn"},
    {"seaborn", "seaborn"},
    {"scipy", "scipy"},
    {"sklearn", "sklearn"},
};

void fill_set(std::set<std::string>& out, const char* const* names) {
    for (int i = 0; names[i] != NULL; ++i) out.insert(names[i]);
}

void add_package(std::vector<std::string>& modules, const std::string& package) {
    std::string module = package_to_module(package);
    if (module.empty()) return;
    if (std::find(modules.begin(), modules.end(), module) == modules.end()) {
        modules.push_back(module);
        modules.push_back(module + ".*");
    }
}

void rebuild_aliases(Policy& p) {
    p.module_aliases.clear();
    for (size_t i = 0; i < sizeof(kAliases) / sizeof(kAliases[0]); ++i) {
        if (p.module_allowed(kAliases[i][1])) {
            p.module_aliases.push_back(std::make_pair(std::string(kAliases[i][0]),
                                                      std::string(kAliases[i][1])));
        }
    }
}

void set_packages(Policy& p, const std::vector<std::string>& packages) {
    p.allowed_modules.clear();
    for (int i = 0; kStdlibModules[i] != NULL; ++i) {
        p.allowed_modules.push_back(kStdlibModules[i]);
    }
    for (size_t i = 0; i < packages.size(); ++i) {
        add_package(p.allowed_modules, packages[i]);
    }
}

} // namespace

ExecutionLimits::ExecutionLimits()
    : timeout_seconds(30.0)
    , cpu_time_seconds(60)
    , max_memory_bytes(512 * kMiB)
    , max_output_bytes(1024 * 1024)
    , max_figures(16)
    , figure_dpi(100)
    , max_file_bytes(4 * kMiB)
    , max_open_files(64)
    , max_result_bytes(32 * 1024 * 1024)
{
}

bool Policy::module_allowed(const std::string& module) const {
    for (size_t i = 0; i < allowed_modules.size(); ++i) {
        const std::string& entry = allowed_modules[i];
        if (ends_with(entry, ".*")) {
            std::string base = entry.substr(0, entry.size() - 2);
            if (module == base || starts_with(module, base + ".")) return true;
        } else if (module == entry) {
            return true;
        }
    }
    return false;
}

bool Policy::module_listed_exactly(const std::string& module) const {
    return std::find(allowed_modules.begin(), allowed_modules.end(), module) != allowed_modules.end();
}

std::string package_to_module(const std::string& package) {
    std::string name = to_lower(trim(package));
    if (name == "scikit-learn" || name == "scikit_learn") return "sklearn";
    if (name == "pillow") return "PIL";
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

std::vector<std::string> default_packages() {
    std::vector<std::string> out;
    for (int i = 0; kDefaultPackages[i] != NULL; ++i) out.push_back(kDefaultPackages[i]);
    return out;
}

Policy Policy::defaults() {
    Policy p;
    set_packages(p, default_packages());
    p.forbidden_node_kinds.insert(pyast::NodeKind::AsyncFunctionDef);
    p.forbidden_node_kinds.insert(pyast::NodeKind::AsyncFor);
    p.forbidden_node_kinds.insert(pyast::NodeKind::AsyncWith);
    p.forbidden_node_kinds.insert(pyast::NodeKind::Await);
    fill_set(p.forbidden_builtins, kForbiddenBuiltins);
    fill_set(p.capability_names, kCapabilityNames);
    fill_set(p.forbidden_attributes, kForbiddenAttributes);
    fill_set(p.allowed_dunder_methods, kAllowedDunders);
    for (int i = 0; kBuiltins[i] != NULL; ++i) p.builtins.push_back(kBuiltins[i]);
    rebuild_aliases(p);
    return p;
}

Policy Policy::from_config(const Config& cfg) {
    Policy p = defaults();
    ExecutionLimits& lim = p.limits;

    double timeout = cfg.get_double("sandbox.timeout_seconds", lim.timeout_seconds);
    if (timeout > 0) {
        lim.timeout_seconds = timeout;
    } else {
        LOG_WARN("[Policy] Ignoring non-positive sandbox.timeout_seconds");
    }

    int64_t memory_mb = cfg.get_int("sandbox.max_memory_mb", lim.max_memory_bytes / kMiB);
    if (memory_mb > 0) {
        lim.max_memory_bytes = memory_mb * kMiB;
    } else {
        LOG_WARN("[Policy] Ignoring non-positive sandbox.max_memory_mb");
    }

    // CPU time never drops below the wall clock limit
    int64_t cpu = cfg.get_int("sandbox.cpu_time_seconds", lim.cpu_time_seconds);
    int64_t wall = static_cast<int64_t>(lim.timeout_seconds) + 1;
    lim.cpu_time_seconds = static_cast<int>(std::max(cpu, wall));

    int64_t output = cfg.get_int("sandbox.max_output_bytes", static_cast<int64_t>(lim.max_output_bytes));
    if (output > 0) lim.max_output_bytes = static_cast<size_t>(output);

    lim.max_figures = static_cast<int>(clamp<int64_t>(
        cfg.get_int("sandbox.max_figures", lim.max_figures), 0, 256));
    lim.figure_dpi = static_cast<int>(clamp<int64_t>(
        cfg.get_int("sandbox.figure_dpi", lim.figure_dpi), 10, 600));

    int64_t file_mb = cfg.get_int("sandbox.max_file_mb", lim.max_file_bytes / kMiB);
    if (file_mb >= 0) lim.max_file_bytes = file_mb * kMiB;

    lim.max_open_files = static_cast<int>(clamp<int64_t>(
        cfg.get_int("sandbox.max_open_files", lim.max_open_files), 16, 4096));

    int64_t result = cfg.get_int("sandbox.max_result_bytes", static_cast<int64_t>(lim.max_result_bytes));
    if (result > 0) lim.max_result_bytes = static_cast<size_t>(result);

    if (cfg.has("sandbox.allowed_packages")) {
        set_packages(p, cfg.get_string_list("sandbox.allowed_packages"));
    }
    if (cfg.has("sandbox.allowed_modules")) {
        p.allowed_modules = cfg.get_string_list("sandbox.allowed_modules");
    }

    if (cfg.has("sandbox.forbidden_node_kinds")) {
        std::vector<std::string> kinds = cfg.get_string_list("sandbox.forbidden_node_kinds");
        p.forbidden_node_kinds.clear();
        for (size_t i = 0; i < kinds.size(); ++i) {
            pyast::NodeKind kind;
            if (pyast::parse_node_kind(kinds[i], kind)) {
                p.forbidden_node_kinds.insert(kind);
            } else {
                LOG_WARN("[Policy] Unknown node kind '%s' in sandbox.forbidden_node_kinds",
                         kinds[i].c_str());
            }
        }
    }

    std::vector<std::string> extra = cfg.get_string_list("sandbox.extra_forbidden_attributes");
    p.forbidden_attributes.insert(extra.begin(), extra.end());

    rebuild_aliases(p);

    LOG_DEBUG("[Policy] %zu module entries, %zu aliases, timeout %.1fs, memory %lld MiB",
              p.allowed_modules.size(), p.module_aliases.size(), lim.timeout_seconds,
              static_cast<long long>(lim.max_memory_bytes / kMiB));
    return p;
}

} // namespace sandcell
