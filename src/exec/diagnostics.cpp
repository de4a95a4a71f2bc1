#include "exec/diagnostics.hpp"
#include <cctype>
#include <sstream>
#include <utility>

namespace codebox::exec {

namespace {

constexpr const char* ERROR_TAG = "error:";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Text between `start` and `end` markers, without the marker lines
std::optional<std::string> between(const std::string& raw, const std::string& start,
                                   const std::string& end) {
    size_t begin = raw.find(start);
    if (begin == std::string::npos) return std::nullopt;
    begin += start.size();
    if (begin < raw.size() && raw[begin] == '\r') begin++;
    if (begin < raw.size() && raw[begin] == '\n') begin++;

    size_t finish = raw.find(end, begin);
    if (finish == std::string::npos) return std::nullopt;

    std::string body = raw.substr(begin, finish - begin);
    if (!body.empty() && body.back() == '\n') body.pop_back();
    if (!body.empty() && body.back() == '\r') body.pop_back();
    return body;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Walk back over ":<digits>" ending at `end` (exclusive). Returns the start
// of the ':' or npos.
size_t number_before(const std::string& text, size_t end, int& value) {
    size_t start = end;
    while (start > 0 && end - start < 9 && is_digit(text[start - 1])) start--;
    if (start == end || start == 0 || text[start - 1] != ':') {
        return std::string::npos;
    }
    value = std::stoi(text.substr(start, end - start));
    return start - 1;
}

// First "<path>:<line>:<column>: error:" in `text`. Plain scanning, so
// arbitrarily long tool output is safe.
std::optional<std::pair<int, int>> find_error_location(const std::string& text) {
    for (size_t tag = text.find(ERROR_TAG); tag != std::string::npos;
         tag = text.find(ERROR_TAG, tag + 1)) {
        size_t end = tag;
        while (end > 0 && is_space(text[end - 1])) end--;
        if (end == 0 || text[end - 1] != ':') continue;

        int column = 0;
        int line = 0;
        size_t colon = number_before(text, end - 1, column);
        if (colon == std::string::npos) continue;
        colon = number_before(text, colon, line);
        if (colon == std::string::npos) continue;

        // Non-empty path of non-space, non-colon characters
        if (colon == 0 || is_space(text[colon - 1]) || text[colon - 1] == ':') continue;

        return std::make_pair(line, column);
    }
    return std::nullopt;
}

std::string diagnostic_message(const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    std::string first_non_empty;
    while (std::getline(iss, line)) {
        size_t pos = line.find(ERROR_TAG);
        if (pos != std::string::npos) {
            std::string msg = trim(line.substr(pos + 6));
            if (!msg.empty()) return msg;
        }
        if (first_non_empty.empty()) {
            first_non_empty = trim(line);
        }
    }
    return first_non_empty;
}

} // namespace

const char* diagnostic_kind_to_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::TYPE_MISMATCH:      return "type_mismatch";
        case DiagnosticKind::UNKNOWN_IDENTIFIER: return "unknown_identifier";
        case DiagnosticKind::SYNTAX_ERROR:       return "syntax_error";
        case DiagnosticKind::COMPILATION_ERROR:  return "compilation_error";
        default: return "compilation_error";
    }
}

nlohmann::json Diagnostic::to_json() const {
    nlohmann::json j;
    j["error_type"] = diagnostic_kind_to_string(kind);
    j["message"] = message;
    if (line) j["line"] = *line;
    if (column) j["column"] = *column;
    return j;
}

OutputSections extract_sections(const std::string& raw) {
    OutputSections sections;

    auto output = between(raw, OUTPUT_START_MARKER, OUTPUT_END_MARKER);
    if (!output) {
        sections.output = raw;
        return sections;
    }

    sections.marked = true;
    sections.output = *output;

    if (auto code = between(raw, EXIT_CODE_START_MARKER, EXIT_CODE_END_MARKER)) {
        try {
            sections.exit_code = std::stoi(trim(*code));
        } catch (const std::exception&) {
            // Leave unset; the caller falls back to the process exit code
        }
    }

    return sections;
}

std::optional<Diagnostic> parse_diagnostic(const std::string& raw_output) {
    const std::string text = extract_sections(raw_output).output;

    Diagnostic diag;
    if (text.find("type mismatch") != std::string::npos) {
        diag.kind = DiagnosticKind::TYPE_MISMATCH;
    } else if (text.find("unknown identifier") != std::string::npos) {
        diag.kind = DiagnosticKind::UNKNOWN_IDENTIFIER;
    } else if (text.find("syntax error") != std::string::npos) {
        diag.kind = DiagnosticKind::SYNTAX_ERROR;
    } else if (text.find("error:") != std::string::npos) {
        diag.kind = DiagnosticKind::COMPILATION_ERROR;
    } else {
        return std::nullopt;
    }

    diag.message = diagnostic_message(text);

    if (auto location = find_error_location(text)) {
        diag.line = location->first;
        diag.column = location->second;
    }

    return diag;
}

std::vector<std::string> wrap_command(const std::vector<std::string>& command) {
    std::ostringstream script;
    script << "echo '" << OUTPUT_START_MARKER << "'; "
           << "\"$@\" 2>&1; code=$?; "
           << "echo '" << OUTPUT_END_MARKER << "'; "
           << "echo '" << EXIT_CODE_START_MARKER << "'; "
           << "echo \"$code\"; "
           << "echo '" << EXIT_CODE_END_MARKER << "'; "
           << "exit \"$code\"";

    std::vector<std::string> argv = {"sh", "-c", script.str(), "sh"};
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}

} // namespace codebox::exec
