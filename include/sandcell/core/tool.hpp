/*
 * sandcell - Tool Provider Interface
 *
 * A tool provider exposes named actions taking JSON parameters and
 * returning a ToolResult. The server dispatches requests to providers
 * by action name.
 */
#ifndef sandcell_CORE_TOOL_HPP
#define sandcell_CORE_TOOL_HPP

#include <sandcell/core/json.hpp>
#include <string>
#include <vector>

namespace sandcell {

class Config;

// Parameter description for a tool action
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;

    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

// Description of one callable action
struct ToolSpec {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;

    ToolSpec() {}
    ToolSpec(const std::string& n, const std::string& d) : name(n), description(d) {}

    // JSON-schema style description used by list_tools
    Json to_json() const;
};

// Result of a tool action
struct ToolResult {
    bool success;
    Json data;
    std::string error;

    ToolResult() : success(false), data(Json::object()) {}

    static ToolResult ok(const Json& data) {
        ToolResult r;
        r.success = true;
        r.data = data;
        return r;
    }

    static ToolResult fail(const std::string& err) {
        ToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

class ToolProvider {
public:
    ToolProvider() : initialized_(false) {}
    virtual ~ToolProvider() {}

    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual const char* version() const = 0;

    virtual bool init(const Config& cfg) = 0;
    virtual void shutdown() = 0;
    bool is_initialized() const { return initialized_; }

    virtual const char* tool_id() const = 0;
    virtual std::vector<std::string> actions() const = 0;
    virtual ToolResult execute(const std::string& action, const Json& params) = 0;

    // Detailed action descriptions. The default wraps each action with a
    // generic "params" object.
    virtual std::vector<ToolSpec> get_tool_specs() const;

    bool has_action(const std::string& action) const;

protected:
    bool initialized_;
};

} // namespace sandcell

#endif // sandcell_CORE_TOOL_HPP
