/*
 * sandcell - Static Validator Implementation
 */
#include <sandcell/sandbox/validator.hpp>
#include <sandcell/pyast/lexer.hpp>
#include <sandcell/pyast/parser.hpp>
#include <sandcell/core/logger.hpp>
#include <sandcell/core/utils.hpp>

#include <algorithm>

namespace sandcell {

using pyast::Node;
using pyast::NodeKind;

namespace {

bool is_dunder(const std::string& name) {
    return name.size() > 4 && starts_with(name, "__") && ends_with(name, "__");
}

bool has_non_ascii(const std::string& name) {
    for (size_t i = 0; i < name.size(); ++i) {
        if (static_cast<unsigned char>(name[i]) >= 0x80) return true;
    }
    return false;
}

bool is_identifier_text(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

// super() or super(Cls, self)
bool is_super_call(const Node* node) {
    if (!node || node->kind != NodeKind::Call) return false;
    const Node* fn = node->child(0);
    return fn && fn->kind == NodeKind::Name && fn->value == "super";
}

bool is_string_literal(const Node* node) {
    return node && node->kind == NodeKind::Constant && node->extra == "str";
}

} // namespace

const char* finding_kind_name(FindingKind kind) {
    switch (kind) {
        case FindingKind::ForbiddenSyntax: return "forbidden_syntax";
        case FindingKind::DisallowedImport: return "disallowed_import";
        case FindingKind::DisallowedAttribute: return "disallowed_attribute";
        case FindingKind::SyntaxError: return "syntax_error";
    }
    return "unknown";
}

std::string ValidationFinding::location() const {
    return std::to_string(line) + ":" + std::to_string(column);
}

bool ValidationFinding::operator<(const ValidationFinding& other) const {
    if (line != other.line) return line < other.line;
    if (column != other.column) return column < other.column;
    if (kind != other.kind) return kind < other.kind;
    return detail < other.detail;
}

bool ValidationFinding::operator==(const ValidationFinding& other) const {
    return line == other.line && column == other.column &&
           kind == other.kind && detail == other.detail;
}

// ============================================================================
// Tree walk
// ============================================================================

struct Validator::Walk {
    const Policy& policy;
    std::vector<ValidationFinding> findings;

    explicit Walk(const Policy& p) : policy(p) {}

    void add(FindingKind kind, const Node* node, const std::string& detail) {
        findings.push_back(ValidationFinding(kind, node->line, node->column, detail));
    }

    void visit(const Node* node, const Node* parent) {
        if (!node) return;

        if (policy.forbidden_node_kinds.count(node->kind)) {
            add(FindingKind::ForbiddenSyntax, node,
                std::string("'") + pyast::node_kind_name(node->kind) + "' is not allowed");
        }

        switch (node->kind) {
            case NodeKind::Name:
                check_name(node);
                break;
            case NodeKind::Attribute:
                check_attribute(node);
                break;
            case NodeKind::Constant:
                if (node->extra == "str") check_format_fields(node);
                break;
            case NodeKind::Import:
                for (size_t i = 0; i < node->size(); ++i) {
                    const Node* alias = node->child(i);
                    check_module_path(alias, alias->value);
                    if (!alias->extra.empty()) check_definition(alias, alias->extra, node);
                }
                return;
            case NodeKind::ImportFrom:
                check_import_from(node);
                return;
            case NodeKind::FunctionDef:
            case NodeKind::AsyncFunctionDef:
            case NodeKind::ClassDef:
            case NodeKind::Arg:
            case NodeKind::ExceptHandler:
            case NodeKind::MatchStar:
            case NodeKind::MatchAs:
                check_definition(node, node->value, parent);
                break;
            case NodeKind::Keyword:
                if (parent && parent->kind == NodeKind::MatchClass) {
                    check_attribute_name(node, node->value, false);
                } else if (has_non_ascii(node->value)) {
                    add(FindingKind::ForbiddenSyntax, node,
                        "non-ASCII identifier '" + node->value + "'");
                }
                break;
            case NodeKind::Comprehension:
                if (node->extra == "async" && policy.forbidden_node_kinds.count(NodeKind::AsyncFor)) {
                    add(FindingKind::ForbiddenSyntax, node, "'async for' comprehension is not allowed");
                }
                break;
            default:
                break;
        }

        for (size_t i = 0; i < node->size(); ++i) {
            visit(node->child(i), node);
        }
    }

    void check_name(const Node* node) {
        const std::string& name = node->value;
        if (has_non_ascii(name)) {
            add(FindingKind::ForbiddenSyntax, node, "non-ASCII identifier '" + name + "'");
            return;
        }
        if (policy.is_forbidden_builtin(name)) {
            add(FindingKind::ForbiddenSyntax, node, "use of '" + name + "' is not allowed");
        } else if (policy.is_capability(name)) {
            add(FindingKind::ForbiddenSyntax, node, "reference to capability '" + name + "' is not allowed");
        } else if (is_dunder(name)) {
            add(FindingKind::ForbiddenSyntax, node, "reference to '" + name + "' is not allowed");
        }
    }

    void check_attribute(const Node* node) {
        const std::string& attr = node->value;
        const Node* receiver = node->child(0);

        if ((attr == "format" || attr == "format_map") && !is_string_literal(receiver)) {
            add(FindingKind::ForbiddenSyntax, node,
                "'." + attr + "' is only allowed on a string literal");
            return;
        }
        bool super_dunder = is_super_call(receiver) && policy.is_allowed_dunder(attr);
        check_attribute_name(node, attr, super_dunder);
    }

    void check_attribute_name(const Node* node, const std::string& attr, bool private_ok) {
        if (has_non_ascii(attr)) {
            add(FindingKind::ForbiddenSyntax, node, "non-ASCII identifier '" + attr + "'");
            return;
        }
        if (!attr.empty() && attr[0] == '_') {
            if (!private_ok) {
                add(FindingKind::DisallowedAttribute, node,
                    "access to private attribute '" + attr + "' is not allowed");
            }
            return;
        }
        if (policy.is_forbidden_attribute(attr)) {
            add(FindingKind::DisallowedAttribute, node, "access to attribute '" + attr + "' is not allowed");
        } else if (policy.is_capability(attr)) {
            add(FindingKind::DisallowedAttribute, node, "access to capability '" + attr + "' is not allowed");
        }
    }

    // str.format field names such as "{0.__class__}" reach attributes at runtime
    void check_format_fields(const Node* node) {
        const std::string& s = node->value;
        size_t i = 0;
        while ((i = s.find('{', i)) != std::string::npos) {
            if (i + 1 < s.size() && s[i + 1] == '{') {
                i += 2;
                continue;
            }
            size_t end = s.find_first_of("}!:{", i + 1);
            std::string field = s.substr(i + 1, end == std::string::npos ? std::string::npos : end - i - 1);
            ++i;

            size_t dot = 0;
            while ((dot = field.find('.', dot)) != std::string::npos) {
                size_t stop = field.find_first_of(".[", dot + 1);
                std::string attr = field.substr(dot + 1, stop == std::string::npos ? std::string::npos : stop - dot - 1);
                if (attr.empty() || attr[0] == '_' || !is_identifier_text(attr)) {
                    add(FindingKind::DisallowedAttribute, node,
                        "format field '" + field + "' reaches a private attribute");
                    break;
                }
                if (policy.is_forbidden_attribute(attr) || policy.is_capability(attr)) {
                    add(FindingKind::DisallowedAttribute, node,
                        "format field '" + field + "' reaches attribute '" + attr + "'");
                    break;
                }
                dot = dot + 1;
            }
        }
    }

    // Returns false when a finding was recorded
    bool check_module_path(const Node* node, const std::string& module) {
        std::vector<std::string> parts = split(module, '.');
        for (size_t i = 0; i < parts.size(); ++i) {
            const std::string& part = parts[i];
            if (has_non_ascii(part)) {
                add(FindingKind::ForbiddenSyntax, node, "non-ASCII identifier '" + part + "'");
                return false;
            }
            if (!part.empty() && part[0] == '_') {
                add(FindingKind::DisallowedImport, node,
                    "import of private module '" + module + "' is not allowed");
                return false;
            }
            if (policy.is_capability(part) || policy.is_forbidden_attribute(part)) {
                add(FindingKind::DisallowedImport, node,
                    "import of '" + module + "' is not allowed (capability '" + part + "')");
                return false;
            }
        }
        if (!policy.module_allowed(module)) {
            add(FindingKind::DisallowedImport, node,
                "module '" + module + "' is not in the allow-list");
            return false;
        }
        return true;
    }

    void check_import_from(const Node* node) {
        if (node->level > 0) {
            add(FindingKind::DisallowedImport, node, "relative imports are not allowed");
            return;
        }
        const std::string& module = node->value;
        if (!check_module_path(node, module)) {
            return;
        }
        for (size_t i = 0; i < node->size(); ++i) {
            const Node* alias = node->child(i);
            const std::string& name = alias->value;
            if (name == "*") {
                if (!policy.module_listed_exactly(module)) {
                    add(FindingKind::DisallowedImport, alias,
                        "wildcard import from '" + module + "' is not allowed");
                }
                continue;
            }
            if (has_non_ascii(name)) {
                add(FindingKind::ForbiddenSyntax, alias, "non-ASCII identifier '" + name + "'");
            } else if (name[0] == '_' || policy.is_forbidden_attribute(name) ||
                       policy.is_capability(name) || policy.is_forbidden_builtin(name)) {
                add(FindingKind::DisallowedAttribute, alias,
                    "import of '" + name + "' from '" + module + "' is not allowed");
            }
            if (!alias->extra.empty()) check_definition(alias, alias->extra, node);
        }
    }

    void check_definition(const Node* node, const std::string& name, const Node* parent) {
        if (name.empty()) return;
        if (has_non_ascii(name)) {
            add(FindingKind::ForbiddenSyntax, node, "non-ASCII identifier '" + name + "'");
            return;
        }
        if (!is_dunder(name)) return;

        bool method = node->kind == NodeKind::FunctionDef && parent &&
                      parent->kind == NodeKind::ClassDef;
        if (method && policy.is_allowed_dunder(name)) return;
        add(FindingKind::ForbiddenSyntax, node, "definition of '" + name + "' is not allowed");
    }
};

// ============================================================================
// Validator
// ============================================================================

Validator::Validator(const Policy& policy)
    : policy_(policy)
{
}

std::vector<ValidationFinding> Validator::check_tree(const pyast::Node& module) const {
    Walk walk(policy_);
    walk.visit(&module, nullptr);

    std::vector<ValidationFinding>& out = walk.findings;
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<ValidationFinding> Validator::validate(const std::string& source) const {
    pyast::ParseResult parsed = pyast::parse_module(source);
    if (!parsed.ok) {
        LOG_DEBUG("[Validator] Syntax error at %d:%d: %s",
                  parsed.line, parsed.column, parsed.error.c_str());
        std::vector<ValidationFinding> out;
        out.push_back(ValidationFinding(FindingKind::SyntaxError,
                                        std::max(parsed.line, 1), std::max(parsed.column, 1),
                                        parsed.error));
        return out;
    }

    std::vector<ValidationFinding> findings = check_tree(*parsed.module);
    if (!findings.empty()) {
        LOG_DEBUG("[Validator] %zu finding(s), first at %s: %s", findings.size(),
                  findings[0].location().c_str(), findings[0].detail.c_str());
    }
    return findings;
}

std::vector<ValidationFinding> validate(const std::string& source, const Policy& policy) {
    return Validator(policy).validate(source);
}

} // namespace sandcell
