/*
 * sandcell - Static Validator
 *
 * Parses agent-generated source and walks the whole tree, recording every
 * construct that could reach outside the capability set. Validation never
 * stops at the first finding; callers receive the complete list.
 */
#ifndef sandcell_SANDBOX_VALIDATOR_HPP
#define sandcell_SANDBOX_VALIDATOR_HPP

#include <sandcell/sandbox/policy.hpp>
#include <sandcell/pyast/ast.hpp>

#include <string>
#include <vector>

namespace sandcell {

enum class FindingKind {
    ForbiddenSyntax,
    DisallowedImport,
    DisallowedAttribute,
    SyntaxError
};

// "forbidden_syntax", "disallowed_import", ...
const char* finding_kind_name(FindingKind kind);

struct ValidationFinding {
    FindingKind kind;
    int line;      // 1-based
    int column;    // 1-based
    std::string detail;

    ValidationFinding() : kind(FindingKind::ForbiddenSyntax), line(0), column(0) {}
    ValidationFinding(FindingKind k, int l, int c, const std::string& d)
        : kind(k), line(l), column(c), detail(d) {}

    // "line:col"
    std::string location() const;

    bool operator<(const ValidationFinding& other) const;
    bool operator==(const ValidationFinding& other) const;
};

class Validator {
public:
    explicit Validator(const Policy& policy);

    // Sorted, de-duplicated findings; empty means the source may run
    std::vector<ValidationFinding> validate(const std::string& source) const;

    // Findings for an already parsed module
    std::vector<ValidationFinding> check_tree(const pyast::Node& module) const;

private:
    struct Walk;

    const Policy& policy_;
};

std::vector<ValidationFinding> validate(const std::string& source, const Policy& policy);

} // namespace sandcell

#endif // sandcell_SANDBOX_VALIDATOR_HPP
