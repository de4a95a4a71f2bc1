#include "exec/validator.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace codebox::exec {

namespace {

// Split a line into whitespace separated tokens, stopping at a `--` comment
std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        if (token.rfind("--", 0) == 0) break;
        tokens.push_back(token);
    }
    return tokens;
}

bool is_import_line(const std::vector<std::string>& tokens) {
    return !tokens.empty() && tokens[0] == "import";
}

} // namespace

CodeValidator::CodeValidator(config::ValidationPolicy policy)
    : policy_(std::move(policy)) {
    for (const auto& pattern : policy_.disallowed_operations) {
        operations_.emplace_back(pattern, std::regex(pattern));
    }
}

ValidationResult CodeValidator::validate(const std::string& code) const {
    for (const auto& stmt : extract_imports(code)) {
        for (const auto& ns : stmt.namespaces) {
            if (auto reason = check_namespace(ns)) {
                spdlog::warn("Validation rejected import {} (line {})", ns, stmt.line);
                return ValidationResult::reject(*reason);
            }
        }
    }

    if (auto reason = check_operations(code)) {
        spdlog::warn("Validation rejected code: {}", *reason);
        return ValidationResult::reject(*reason);
    }

    return ValidationResult::ok();
}

std::optional<std::string> CodeValidator::check_namespace(const std::string& ns) const {
    // Blocked list wins over the allowed list
    for (const auto& blocked : policy_.blocked_namespaces) {
        if (namespace_matches(ns, blocked)) {
            return "Import '" + ns + "' is blocked for security reasons";
        }
    }

    // If no allowed namespaces specified, allow all (except blocked)
    if (policy_.allowed_namespaces.empty()) {
        return std::nullopt;
    }

    for (const auto& allowed : policy_.allowed_namespaces) {
        if (namespace_matches(ns, allowed)) {
            return std::nullopt;
        }
    }

    return "Import '" + ns + "' is not in the allowed list";
}

std::optional<std::string> CodeValidator::check_operations(const std::string& code) const {
    std::istringstream iss(code);
    std::string line;
    size_t line_no = 0;
    while (std::getline(iss, line)) {
        line_no++;
        // std::regex recursion depth grows with the match length
        if (line.size() > MAX_LINE_LENGTH) {
            return "Line " + std::to_string(line_no) + " exceeds the maximum length of " +
                   std::to_string(MAX_LINE_LENGTH) + " characters";
        }
        if (operations_.empty() || is_import_line(tokenize(line))) continue;

        // Earliest match on the line; pattern order breaks ties
        std::optional<std::smatch> first;
        for (const auto& [pattern, re] : operations_) {
            std::smatch m;
            if (std::regex_search(line, m, re)) {
                if (!first || m.position(0) < first->position(0)) {
                    first = m;
                }
            }
        }

        if (first) {
            return "IO operation '" + first->str(0) + "' is not permitted";
        }
    }

    return std::nullopt;
}

std::vector<ImportStatement> CodeValidator::extract_imports(const std::string& code) {
    std::vector<ImportStatement> imports;

    std::istringstream iss(code);
    std::string line;
    size_t line_no = 0;
    while (std::getline(iss, line)) {
        line_no++;
        auto tokens = tokenize(line);
        if (!is_import_line(tokens) || tokens.size() < 2) continue;

        ImportStatement stmt;
        stmt.line = line_no;
        stmt.namespaces.assign(tokens.begin() + 1, tokens.end());
        imports.push_back(std::move(stmt));
    }

    return imports;
}

bool CodeValidator::namespace_matches(const std::string& ns, const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }
    if (ns == pattern) {
        return true;
    }
    return ns.size() > pattern.size() &&
           ns.compare(0, pattern.size(), pattern) == 0 &&
           ns[pattern.size()] == '.';
}

} // namespace codebox::exec
