/*
 * sandcell - Capability Namespace Builder Implementation
 */
#include <sandcell/sandbox/namespace_builder.hpp>
#include <sandcell/core/logger.hpp>
#include <sandcell/core/utils.hpp>

#include <algorithm>

namespace sandcell {

bool NamespaceHandle::has_builtin(const std::string& name) const {
    return std::find(builtins.begin(), builtins.end(), name) != builtins.end();
}

bool NamespaceHandle::has_alias(const std::string& name) const {
    for (size_t i = 0; i < aliases.size(); ++i) {
        if (aliases[i].first == name) return true;
    }
    return false;
}

Json NamespaceHandle::to_manifest() const {
    Json alias_map = Json::object();
    for (size_t i = 0; i < aliases.size(); ++i) {
        alias_map[aliases[i].first] = aliases[i].second;
    }

    Json manifest;
    manifest["id"] = id;
    manifest["builtins"] = builtins;
    manifest["aliases"] = alias_map;
    manifest["allowed_modules"] = allowed_modules;
    manifest["blocked_names"] = blocked_names;
    manifest["capture_figures"] = capture_figures;
    manifest["max_figures"] = max_figures;
    manifest["figure_dpi"] = figure_dpi;
    return manifest;
}

NamespaceBuilder::NamespaceBuilder(const Policy& policy)
    : policy_(policy)
{
}

NamespaceHandle NamespaceBuilder::build() const {
    NamespaceHandle ns;
    ns.id = generate_uuid();

    for (size_t i = 0; i < policy_.builtins.size(); ++i) {
        const std::string& name = policy_.builtins[i];
        if (policy_.is_forbidden_builtin(name) || policy_.is_capability(name)) {
            continue;
        }
        if (!name.empty() && name[0] == '_') continue;
        if (!ns.has_builtin(name)) ns.builtins.push_back(name);
    }

    for (size_t i = 0; i < policy_.module_aliases.size(); ++i) {
        const std::string& module = policy_.module_aliases[i].second;
        if (policy_.module_allowed(module) && !ns.has_alias(policy_.module_aliases[i].first)) {
            ns.aliases.push_back(policy_.module_aliases[i]);
        }
    }

    ns.allowed_modules = policy_.allowed_modules;
    ns.blocked_names.assign(policy_.capability_names.begin(), policy_.capability_names.end());
    for (std::set<std::string>::const_iterator it = policy_.forbidden_attributes.begin();
         it != policy_.forbidden_attributes.end(); ++it) {
        ns.blocked_names.push_back(*it);
    }

    ns.max_figures = policy_.limits.max_figures;
    ns.figure_dpi = policy_.limits.figure_dpi;
    ns.capture_figures = policy_.module_allowed("matplotlib.pyplot");

    LOG_DEBUG("[Namespace] %s: %zu builtins, %zu aliases, figures %s",
              ns.id.c_str(), ns.builtins.size(), ns.aliases.size(),
              ns.capture_figures ? "on" : "off");
    return ns;
}

NamespaceHandle build_namespace(const Policy& policy) {
    return NamespaceBuilder(policy).build();
}

} // namespace sandcell
