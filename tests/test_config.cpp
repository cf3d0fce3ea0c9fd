#include <sandcell/core/config.hpp>

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

static void clearEnvironment() {
    const char* names[] = {
        "SANDBOX_TIMEOUT", "SANDBOX_MAX_MEMORY_MB", "ALLOWED_PACKAGES",
        "SANDBOX_PYTHON", "LOG_LEVEL", "LOG_FILE"
    };
    for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) unsetenv(names[i]);
}

static void testDottedGetters() {
    sandcell::Config cfg;
    assert(cfg.load_string(R"({
        "log_level": "debug",
        "sandbox": {
            "timeout_seconds": 12.5,
            "max_memory_mb": 256,
            "require_confinement": true,
            "allowed_packages": ["numpy", 3, "pandas"]
        }
    })"));

    assert(cfg.get_string("log_level") == "debug");
    assert(cfg.get_double("sandbox.timeout_seconds") == 12.5);
    assert(cfg.get_int("sandbox.timeout_seconds") == 12);
    assert(cfg.get_int("sandbox.max_memory_mb") == 256);
    assert(cfg.get_bool("sandbox.require_confinement"));
    assert(cfg.has("sandbox.max_memory_mb"));
    assert(!cfg.has("sandbox.missing"));

    // Wrong types fall back to the default
    assert(cfg.get_int("log_level", 7) == 7);
    assert(cfg.get_string("sandbox.max_memory_mb", "x") == "x");
    assert(!cfg.get_bool("sandbox.timeout_seconds", false));

    std::vector<std::string> packages = cfg.get_string_list("sandbox.allowed_packages");
    assert(packages.size() == 2);
    assert(packages[0] == "numpy" && packages[1] == "pandas");
}

static void testInvalidDocuments() {
    sandcell::Config cfg;
    assert(!cfg.load_string("{not json"));
    assert(!cfg.load_string("[1, 2]"));
    assert(!cfg.load_file("/nonexistent/sandcell/config.json"));
}

static void testSetCreatesPath() {
    sandcell::Config cfg;
    cfg.set_int("server.workers", 8);
    cfg.set_string("sandbox.python_path", "/opt/py/bin/python3");
    assert(cfg.get_int("server.workers") == 8);
    assert(cfg.get_string("sandbox.python_path") == "/opt/py/bin/python3");
}

static void testLoadFile() {
    char path[] = "/tmp/sandcell-config-XXXXXX";
    int fd = mkstemp(path);
    assert(fd >= 0);
    close(fd);
    {
        std::ofstream out(path);
        out << "{\"server\": {\"workers\": 3}}";
    }
    sandcell::Config cfg;
    assert(cfg.load_file(path));
    assert(cfg.get_int("server.workers") == 3);
    unlink(path);
}

static void testEnvironmentOverrides() {
    clearEnvironment();
    sandcell::Config cfg;
    assert(cfg.load_string("{\"sandbox\": {\"timeout_seconds\": 30}}"));
    assert(cfg.apply_env_overrides() == 0);

    setenv("SANDBOX_TIMEOUT", "5", 1);
    setenv("SANDBOX_MAX_MEMORY_MB", "128", 1);
    setenv("ALLOWED_PACKAGES", "numpy, scikit-learn ,,", 1);
    setenv("SANDBOX_PYTHON", "/usr/local/bin/python3", 1);
    setenv("LOG_LEVEL", "WARN", 1);
    assert(cfg.apply_env_overrides() == 5);

    assert(cfg.get_double("sandbox.timeout_seconds") == 5.0);
    assert(cfg.get_int("sandbox.max_memory_mb") == 128);
    std::vector<std::string> packages = cfg.get_string_list("sandbox.allowed_packages");
    assert(packages.size() == 2);
    assert(packages[1] == "scikit-learn");
    assert(cfg.get_string("sandbox.python_path") == "/usr/local/bin/python3");
    assert(cfg.get_string("log_level") == "warn");

    // Invalid numbers are ignored
    clearEnvironment();
    setenv("SANDBOX_TIMEOUT", "soon", 1);
    assert(cfg.apply_env_overrides() == 0);
    assert(cfg.get_double("sandbox.timeout_seconds") == 5.0);
    clearEnvironment();
}

int main() {
    testDottedGetters();
    testInvalidDocuments();
    testSetCreatesPath();
    testLoadFile();
    testEnvironmentOverrides();
    return 0;
}
