/**
 * codebox Diagnostics
 *
 * Turns raw sandbox output into a structured compiler/runtime diagnostic.
 * Output produced through the execution wrapper carries section markers
 * around the program output and its exit code; those are stripped first.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace codebox::exec {

constexpr const char* OUTPUT_START_MARKER = "---OUTPUT_START---";
constexpr const char* OUTPUT_END_MARKER = "---OUTPUT_END---";
constexpr const char* EXIT_CODE_START_MARKER = "---EXIT_CODE_START---";
constexpr const char* EXIT_CODE_END_MARKER = "---EXIT_CODE_END---";

enum class DiagnosticKind {
    TYPE_MISMATCH,
    UNKNOWN_IDENTIFIER,
    SYNTAX_ERROR,
    COMPILATION_ERROR
};

const char* diagnostic_kind_to_string(DiagnosticKind kind);

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::COMPILATION_ERROR;
    std::string message;
    std::optional<int> line;
    std::optional<int> column;

    nlohmann::json to_json() const;
};

// Program output and exit code recovered from marked raw output
struct OutputSections {
    std::string output;
    std::optional<int> exit_code;
    bool marked = false;  // Markers were present
};

// Strip section markers. Unmarked text is returned unchanged.
OutputSections extract_sections(const std::string& raw);

// Classify the first error in `raw_output`, or nullopt for clean output
std::optional<Diagnostic> parse_diagnostic(const std::string& raw_output);

// Wrap a toolchain command so its combined output and exit code are
// emitted between section markers. Arguments are passed positionally to
// the shell, never spliced into the script text.
std::vector<std::string> wrap_command(const std::vector<std::string>& command);

} // namespace codebox::exec
