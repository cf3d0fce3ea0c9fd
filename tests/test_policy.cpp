#include <sandcell/sandbox/policy.hpp>
#include <sandcell/core/config.hpp>

#include <algorithm>
#include <cassert>
#include <string>

static bool hasAlias(const sandcell::Policy& p, const std::string& alias) {
    for (size_t i = 0; i < p.module_aliases.size(); ++i) {
        if (p.module_aliases[i].first == alias) return true;
    }
    return false;
}

static void testDefaults() {
    sandcell::Policy p = sandcell::Policy::defaults();

    assert(p.module_allowed("math"));
    assert(p.module_allowed("numpy"));
    assert(p.module_allowed("numpy.linalg"));
    assert(p.module_allowed("sklearn.linear_model"));
    assert(!p.module_allowed("os"));
    assert(!p.module_allowed("numpyx"));
    assert(!p.module_allowed("math.sub"));

    assert(p.module_listed_exactly("numpy"));
    assert(!p.module_listed_exactly("numpy.linalg"));

    assert(p.is_forbidden_builtin("eval"));
    assert(p.is_forbidden_builtin("getattr"));
    assert(p.is_capability("open"));
    assert(p.is_capability("subprocess"));
    assert(p.is_forbidden_attribute("f_globals"));
    assert(p.is_forbidden_attribute("read_csv"));
    assert(!p.is_forbidden_attribute("loads"));
    assert(p.is_allowed_dunder("__init__"));
    assert(!p.is_allowed_dunder("__class__"));

    assert(p.forbidden_node_kinds.count(sandcell::pyast::NodeKind::Await) == 1);
    assert(std::find(p.builtins.begin(), p.builtins.end(), "print") != p.builtins.end());
    assert(std::find(p.builtins.begin(), p.builtins.end(), "open") == p.builtins.end());

    assert(hasAlias(p, "np"));
    assert(hasAlias(p, "plt"));

    assert(p.limits.timeout_seconds == 30.0);
    assert(p.limits.max_memory_bytes == 512LL * 1024 * 1024);
    assert(p.limits.max_figures == 16);
}

static void testPackageNames() {
    assert(sandcell::package_to_module("scikit-learn") == "sklearn");
    assert(sandcell::package_to_module(" Pillow ") == "PIL");
    assert(sandcell::package_to_module("python-dateutil") == "python_dateutil");
    assert(sandcell::default_packages().size() == 6);
}

static void testFromConfig() {
    sandcell::Config cfg;
    assert(cfg.load_string(R"({
        "sandbox": {
            "timeout_seconds": 10,
            "max_memory_mb": 256,
            "cpu_time_seconds": 2,
            "max_figures": 1000,
            "figure_dpi": 5,
            "max_open_files": 1,
            "allowed_packages": ["numpy"],
            "forbidden_node_kinds": ["Lambda", "NotAKind"],
            "extra_forbidden_attributes": ["tolist"]
        }
    })"));

    sandcell::Policy p = sandcell::Policy::from_config(cfg);
    assert(p.limits.timeout_seconds == 10.0);
    assert(p.limits.max_memory_bytes == 256LL * 1024 * 1024);
    // CPU limit is raised to cover the wall clock
    assert(p.limits.cpu_time_seconds == 11);
    assert(p.limits.max_figures == 256);
    assert(p.limits.figure_dpi == 10);
    assert(p.limits.max_open_files == 16);

    assert(p.module_allowed("numpy.fft"));
    assert(p.module_allowed("json"));
    assert(!p.module_allowed("pandas"));
    assert(hasAlias(p, "np"));
    assert(!hasAlias(p, "pd"));
    assert(!hasAlias(p, "plt"));

    assert(p.forbidden_node_kinds.size() == 1);
    assert(p.forbidden_node_kinds.count(sandcell::pyast::NodeKind::Lambda) == 1);
    assert(p.is_forbidden_attribute("tolist"));
}

static void testExplicitModuleList() {
    sandcell::Config cfg;
    assert(cfg.load_string("{\"sandbox\": {\"allowed_modules\": [\"math\", \"numpy.*\"]}}"));
    sandcell::Policy p = sandcell::Policy::from_config(cfg);
    assert(p.allowed_modules.size() == 2);
    assert(p.module_allowed("numpy"));
    assert(p.module_allowed("numpy.random"));
    assert(!p.module_listed_exactly("numpy"));
    assert(!p.module_allowed("json"));
}

int main() {
    testDefaults();
    testPackageNames();
    testFromConfig();
    testExplicitModuleList();
    return 0;
}
