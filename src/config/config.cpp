#include "config/config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace codebox::config {

namespace {

const std::regex MEMORY_LIMIT_RE("^[0-9]+[bkmgBKMG]?$");

void check_memory_limit(const std::string& value) {
    if (!std::regex_match(value, MEMORY_LIMIT_RE)) {
        throw ConfigError("invalid memory_limit '" + value + "' (expected e.g. 256m)");
    }
}

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    for (const auto& item : j.at(key)) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

bool parse_bool(const std::string& name, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw ConfigError(name + ": expected a boolean, got '" + value + "'");
}

} // namespace

// ============================================================================
// ResourceLimits / defaults
// ============================================================================

int64_t ResourceLimits::cpu_quota_us() const {
    return static_cast<int64_t>(cpu_limit * 100000);
}

ValidationPolicy default_validation_policy() {
    ValidationPolicy policy;
    policy.allowed_namespaces = {"Lean", "Init", "Std", "Mathlib"};
    policy.blocked_namespaces = {"System.IO.Process", "System.FilePath"};
    policy.disallowed_operations = {
        "IO\\.FS\\.[A-Za-z]+",
        "IO\\.Process\\.[A-Za-z]+",
    };
    return policy;
}

// ============================================================================
// JSON
// ============================================================================

Config Config::from_json(const json& j) {
    Config cfg;

    if (!j.is_object()) {
        throw ConfigError("config root must be an object");
    }

    try {
        if (j.contains("container")) {
            const auto& c = j["container"];
            auto& limits = cfg.container;
            if (c.contains("image")) limits.image = c["image"].get<std::string>();
            if (c.contains("working_dir")) limits.working_dir = c["working_dir"].get<std::string>();
            if (c.contains("memory_limit")) limits.memory_limit = c["memory_limit"].get<std::string>();
            if (c.contains("cpu_limit")) limits.cpu_limit = c["cpu_limit"].get<double>();
            if (c.contains("timeout")) limits.timeout = std::chrono::seconds(c["timeout"].get<int64_t>());
            if (c.contains("network_disabled")) limits.network_disabled = c["network_disabled"].get<bool>();
            if (c.contains("read_only")) limits.read_only = c["read_only"].get<bool>();
            if (c.contains("user")) limits.user = c["user"].get<std::string>();
            if (c.contains("script_mount")) limits.script_mount = c["script_mount"].get<std::string>();
            if (c.contains("session_lifetime")) {
                limits.session_lifetime = std::chrono::seconds(c["session_lifetime"].get<int64_t>());
            }
            if (c.contains("poll_interval_ms")) {
                limits.poll_interval = std::chrono::milliseconds(c["poll_interval_ms"].get<int64_t>());
            }
            if (c.contains("stop_grace")) limits.stop_grace = std::chrono::seconds(c["stop_grace"].get<int64_t>());
        }

        if (j.contains("toolchain")) {
            const auto& t = j["toolchain"];
            if (t.contains("command")) cfg.toolchain.command = string_list(t, "command");
            if (t.contains("script_extension")) {
                cfg.toolchain.script_extension = t["script_extension"].get<std::string>();
            }
        }

        if (j.contains("validation")) {
            const auto& v = j["validation"];
            if (v.contains("allowed_namespaces")) {
                cfg.validation.allowed_namespaces = string_list(v, "allowed_namespaces");
            }
            if (v.contains("blocked_namespaces")) {
                cfg.validation.blocked_namespaces = string_list(v, "blocked_namespaces");
            }
            if (v.contains("disallowed_operations")) {
                cfg.validation.disallowed_operations = string_list(v, "disallowed_operations");
            }
        }

        if (j.contains("protocol")) {
            const auto& p = j["protocol"];
            if (p.contains("diagnostics_as_errors")) {
                cfg.protocol.diagnostics_as_errors = p["diagnostics_as_errors"].get<bool>();
            }
        }

        if (j.contains("log_level")) cfg.log_level = j["log_level"].get<std::string>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    check_memory_limit(cfg.container.memory_limit);
    if (cfg.container.timeout.count() <= 0) {
        throw ConfigError("container.timeout must be positive");
    }
    if (cfg.container.poll_interval.count() <= 0) {
        throw ConfigError("container.poll_interval_ms must be positive");
    }
    if (cfg.container.cpu_limit <= 0.0) {
        throw ConfigError("container.cpu_limit must be positive");
    }
    if (cfg.toolchain.command.empty()) {
        throw ConfigError("toolchain.command must not be empty");
    }
    for (const auto& pattern : cfg.validation.disallowed_operations) {
        try {
            std::regex compiled(pattern);
        } catch (const std::regex_error& e) {
            throw ConfigError("invalid disallowed_operations pattern '" + pattern + "': " + e.what());
        }
    }

    return cfg;
}

json Config::to_json() const {
    json j;

    j["container"]["image"] = container.image;
    j["container"]["working_dir"] = container.working_dir;
    j["container"]["memory_limit"] = container.memory_limit;
    j["container"]["cpu_limit"] = container.cpu_limit;
    j["container"]["timeout"] = container.timeout.count();
    j["container"]["network_disabled"] = container.network_disabled;
    j["container"]["read_only"] = container.read_only;
    j["container"]["user"] = container.user;
    j["container"]["script_mount"] = container.script_mount;
    j["container"]["session_lifetime"] = container.session_lifetime.count();
    j["container"]["poll_interval_ms"] = container.poll_interval.count();
    j["container"]["stop_grace"] = container.stop_grace.count();

    j["toolchain"]["command"] = toolchain.command;
    j["toolchain"]["script_extension"] = toolchain.script_extension;

    j["validation"]["allowed_namespaces"] = validation.allowed_namespaces;
    j["validation"]["blocked_namespaces"] = validation.blocked_namespaces;
    j["validation"]["disallowed_operations"] = validation.disallowed_operations;

    j["protocol"]["diagnostics_as_errors"] = protocol.diagnostics_as_errors;
    j["log_level"] = log_level;

    return j;
}

// ============================================================================
// Loading
// ============================================================================

Config Config::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }

    spdlog::debug("Loaded config from {}", path);
    return from_json(j);
}

Config Config::load(const std::optional<std::string>& explicit_path) {
    Config cfg;

    if (explicit_path) {
        cfg = load_file(*explicit_path);
    } else if (const char* env_path = std::getenv("CODEBOX_CONFIG")) {
        cfg = load_file(env_path);
    } else if (const char* home = std::getenv("HOME")) {
        fs::path user_config = fs::path(home) / ".codebox" / "config.json";
        std::error_code ec;
        if (fs::exists(user_config, ec)) {
            cfg = load_file(user_config.string());
        }
    }

    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    if (const char* image = std::getenv("CODEBOX_IMAGE")) {
        container.image = image;
    }

    if (const char* timeout = std::getenv("CODEBOX_TIMEOUT")) {
        try {
            size_t used = 0;
            long long seconds = std::stoll(timeout, &used);
            if (used != std::string(timeout).size() || seconds <= 0) {
                throw ConfigError("");
            }
            container.timeout = std::chrono::seconds(seconds);
        } catch (const std::exception&) {
            throw ConfigError(std::string("CODEBOX_TIMEOUT: expected positive seconds, got '") +
                              timeout + "'");
        }
    }

    if (const char* memory = std::getenv("CODEBOX_MEMORY_LIMIT")) {
        check_memory_limit(memory);
        container.memory_limit = memory;
    }

    if (const char* network = std::getenv("CODEBOX_NETWORK_DISABLED")) {
        container.network_disabled = parse_bool("CODEBOX_NETWORK_DISABLED", network);
    }

    if (const char* level = std::getenv("CODEBOX_LOG_LEVEL")) {
        log_level = level;
    }
}

} // namespace codebox::config
