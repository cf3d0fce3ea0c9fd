/*
 * sandcell - Capability Namespace Builder
 *
 * Produces the set of names sandboxed code starts with: the exposed
 * builtins, lazily bound module aliases, the import allow-list enforced
 * by the guarded __import__, and the figure capture settings. The handle
 * is rebuilt for every execution and serialized into the manifest the
 * Python harness reads.
 */
#ifndef sandcell_SANDBOX_NAMESPACE_BUILDER_HPP
#define sandcell_SANDBOX_NAMESPACE_BUILDER_HPP

#include <sandcell/sandbox/policy.hpp>
#include <sandcell/core/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace sandcell {

struct NamespaceHandle {
    std::string id;
    std::vector<std::string> builtins;
    std::vector<std::pair<std::string, std::string> > aliases;
    std::vector<std::string> allowed_modules;
    // Module path components and imported names the guarded __import__ refuses
    std::vector<std::string> blocked_names;
    bool capture_figures;
    int max_figures;
    int figure_dpi;

    NamespaceHandle() : capture_figures(false), max_figures(0), figure_dpi(100) {}

    bool has_builtin(const std::string& name) const;
    bool has_alias(const std::string& name) const;

    Json to_manifest() const;
};

class NamespaceBuilder {
public:
    explicit NamespaceBuilder(const Policy& policy);

    NamespaceHandle build() const;

private:
    const Policy& policy_;
};

NamespaceHandle build_namespace(const Policy& policy);

} // namespace sandcell

#endif // sandcell_SANDBOX_NAMESPACE_BUILDER_HPP
