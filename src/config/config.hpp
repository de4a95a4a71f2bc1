/**
 * codebox Configuration
 *
 * Sandbox resource limits, toolchain command, code validation policy and
 * protocol options. Loaded from JSON, then overridden from the environment.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace codebox::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Limits and placement of every sandbox the service provisions
struct ResourceLimits {
    std::string image = "codebox-lean:latest";
    std::string working_dir = "/home/runner/project";
    std::string memory_limit = "256m";           // Docker size string
    double cpu_limit = 0.5;                      // Fraction of one CPU
    std::chrono::seconds timeout{30};            // Wall clock, transient runs
    bool network_disabled = true;
    bool read_only = false;                      // Root filesystem, transient runs
    std::string user = "runner";                 // exec user inside sessions
    std::string script_mount = "/app";           // Bind target for transient scripts
    std::chrono::seconds session_lifetime{86400};
    std::chrono::milliseconds poll_interval{100};
    std::chrono::seconds stop_grace{1};

    // CFS quota in microseconds per 100ms period
    int64_t cpu_quota_us() const;
};

struct ToolchainConfig {
    std::vector<std::string> command = {"lean", "--run"};
    std::string script_extension = ".lean";
};

struct ValidationPolicy {
    std::vector<std::string> allowed_namespaces;     // Empty = any namespace
    std::vector<std::string> blocked_namespaces;     // Always denied
    std::vector<std::string> disallowed_operations;  // ECMAScript regexes, checked in order
};

// Lean-flavoured defaults: core namespaces allowed, process and file access denied
ValidationPolicy default_validation_policy();

struct ProtocolConfig {
    // Report executions with a diagnostic as -32002 errors instead of results
    bool diagnostics_as_errors = false;
};

struct Config {
    ResourceLimits container;
    ToolchainConfig toolchain;
    ValidationPolicy validation = default_validation_policy();
    ProtocolConfig protocol;
    std::string log_level = "info";

    // Create from JSON; keys that are absent keep their defaults
    static Config from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    // Read and parse a JSON file
    static Config load_file(const std::string& path);

    // Resolve the config file (explicit path, $CODEBOX_CONFIG,
    // ~/.codebox/config.json, defaults) and apply environment overrides
    static Config load(const std::optional<std::string>& explicit_path = std::nullopt);

    // CODEBOX_IMAGE, CODEBOX_TIMEOUT, CODEBOX_MEMORY_LIMIT,
    // CODEBOX_NETWORK_DISABLED, CODEBOX_LOG_LEVEL
    void apply_env();
};

} // namespace codebox::config
