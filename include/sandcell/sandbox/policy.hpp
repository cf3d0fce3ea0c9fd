/*
 * sandcell - Execution Policy
 *
 * Immutable description of what sandboxed code may do: which modules it
 * may import, which syntax, names and attributes are rejected, which
 * builtins it sees, and the resource bounds of one execution. Built once
 * at start-up and shared read-only between concurrent executions.
 */
#ifndef sandcell_SANDBOX_POLICY_HPP
#define sandcell_SANDBOX_POLICY_HPP

#include <sandcell/pyast/ast.hpp>

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sandcell {

class Config;

// Resource bounds of a single execution
struct ExecutionLimits {
    double timeout_seconds;      // wall clock
    int cpu_time_seconds;        // RLIMIT_CPU
    int64_t max_memory_bytes;    // RLIMIT_AS and RSS monitor
    size_t max_output_bytes;     // per stream
    int max_figures;
    int figure_dpi;
    int64_t max_file_bytes;      // RLIMIT_FSIZE
    int max_open_files;          // RLIMIT_NOFILE
    size_t max_result_bytes;     // result channel (figures dominate)

    ExecutionLimits();
};

struct Policy {
    // Exact module names ("json") or declared submodule prefixes ("numpy.*")
    std::vector<std::string> allowed_modules;
    std::set<pyast::NodeKind> forbidden_node_kinds;
    std::set<std::string> forbidden_builtins;
    std::set<std::string> capability_names;
    std::set<std::string> forbidden_attributes;
    std::set<std::string> allowed_dunder_methods;
    // Builtin names exposed to sandboxed code
    std::vector<std::string> builtins;
    // (alias, module) pairs bound lazily in the namespace
    std::vector<std::pair<std::string, std::string> > module_aliases;
    ExecutionLimits limits;

    // Exact entry or covered by a declared prefix
    bool module_allowed(const std::string& module) const;
    // Exact entry only (wildcard imports need this)
    bool module_listed_exactly(const std::string& module) const;

    bool is_forbidden_builtin(const std::string& name) const { return forbidden_builtins.count(name) > 0; }
    bool is_capability(const std::string& name) const { return capability_names.count(name) > 0; }
    bool is_forbidden_attribute(const std::string& name) const { return forbidden_attributes.count(name) > 0; }
    bool is_allowed_dunder(const std::string& name) const { return allowed_dunder_methods.count(name) > 0; }

    // Built-in defaults with the default package set
    static Policy defaults();

    // Defaults overlaid with the "sandbox.*" section of the configuration
    static Policy from_config(const Config& cfg);
};

typedef std::shared_ptr<const Policy> PolicyPtr;

// Distribution name to import name ("scikit-learn" -> "sklearn")
std::string package_to_module(const std::string& package);

// Package names used when the configuration names none
std::vector<std::string> default_packages();

} // namespace sandcell

#endif // sandcell_SANDBOX_POLICY_HPP
