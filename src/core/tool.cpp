/*
 * sandcell - Tool Provider Implementation
 */
#include <sandcell/core/tool.hpp>

namespace sandcell {

Json ToolSpec::to_json() const {
    Json properties = Json::object();
    Json required = Json::array();
    for (size_t i = 0; i < params.size(); ++i) {
        const ToolParamSchema& p = params[i];
        properties[p.name] = {{"type", p.type}, {"description", p.description}};
        if (p.required) {
            required.push_back(p.name);
        }
    }

    Json j;
    j["name"] = name;
    j["description"] = description;
    j["input_schema"] = {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
    return j;
}

std::vector<ToolSpec> ToolProvider::get_tool_specs() const {
    std::vector<ToolSpec> specs;

    const std::vector<std::string> action_list = actions();
    const std::string desc = description();

    for (size_t i = 0; i < action_list.size(); ++i) {
        ToolSpec spec(action_list[i], desc + " - " + action_list[i] + " action");
        spec.params.push_back(ToolParamSchema("params", "object", "Action parameters", false));
        specs.push_back(spec);
    }

    return specs;
}

bool ToolProvider::has_action(const std::string& action) const {
    const std::vector<std::string> action_list = actions();
    for (size_t i = 0; i < action_list.size(); ++i) {
        if (action_list[i] == action) return true;
    }
    return false;
}

} // namespace sandcell
