/**
 * codebox Code Validator
 *
 * Policy check of submitted source before any sandbox work: blocked and
 * allowed import namespaces, then disallowed operation patterns in the body.
 * Pure and deterministic.
 */
#pragma once
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>
#include "config/config.hpp"

namespace codebox::exec {

struct ValidationResult {
    bool valid = true;
    std::optional<std::string> reason;  // Names the offending namespace or operation

    static ValidationResult ok() { return {}; }
    static ValidationResult reject(std::string why) { return {false, std::move(why)}; }
};

// One `import` statement
struct ImportStatement {
    size_t line = 0;                      // 1-based
    std::vector<std::string> namespaces;
};

class CodeValidator {
public:
    // Longer lines are rejected before any pattern is run over them
    static constexpr size_t MAX_LINE_LENGTH = 4096;

    // Throws std::regex_error if a disallowed operation pattern does not compile
    explicit CodeValidator(config::ValidationPolicy policy);

    ValidationResult validate(const std::string& code) const;

    const config::ValidationPolicy& policy() const { return policy_; }

    // Import statements in source order
    static std::vector<ImportStatement> extract_imports(const std::string& code);

    // Exact match, or `pattern` is a dotted prefix of `ns` ("Std" covers "Std.Data")
    static bool namespace_matches(const std::string& ns, const std::string& pattern);

private:
    config::ValidationPolicy policy_;
    std::vector<std::pair<std::string, std::regex>> operations_;

    std::optional<std::string> check_namespace(const std::string& ns) const;
    std::optional<std::string> check_operations(const std::string& code) const;
};

} // namespace codebox::exec
