/**
 * codebox Session Manager
 *
 * Owns every sandbox the service provisions. Transient runs get a fresh
 * container that is removed when the run ends; persistent sessions keep a
 * long-lived container per session id until cleanup or shutdown.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "config/config.hpp"
#include "exec/diagnostics.hpp"
#include "exec/validator.hpp"
#include "runtime/container_runtime.hpp"

namespace codebox::session {

// A persistent session and the container backing it
struct Session {
    std::string id;
    std::string handle;
    std::chrono::system_clock::time_point created;
    bool network_disabled = false;   // Intended policy
    bool network_isolated = false;   // Every attached network was disconnected
};

struct ExecutionResult {
    bool success = false;
    std::string output;
    int exit_code = -1;
    std::optional<exec::Diagnostic> diagnostic;
    std::optional<std::string> session_id;

    const char* status() const { return success ? "success" : "error"; }
    nlohmann::json to_json() const;
};

enum class CleanupOutcome {
    SUCCESS,
    NOT_FOUND,
    ERROR
};

const char* cleanup_outcome_to_string(CleanupOutcome outcome);

struct CleanupResult {
    CleanupOutcome outcome = CleanupOutcome::NOT_FOUND;
    std::string message;

    nlohmann::json to_json() const;
};

class SessionManager {
public:
    // `runtime` must outlive the manager
    SessionManager(runtime::ContainerRuntime& runtime, const config::Config& config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Validate, then run `code` in a throwaway sandbox.
    // Throws ServiceError (VALIDATION, RUNTIME).
    ExecutionResult run_transient(const std::string& code);

    // Validate, then run `code` in the session's sandbox, provisioning it on
    // first use. Calls for the same id are serialized.
    // Throws ServiceError (VALIDATION, RUNTIME, SESSION_EXPIRED).
    ExecutionResult run_persistent(const std::string& session_id, const std::string& code);

    // Stop and remove a session sandbox. Never throws for unknown ids.
    CleanupResult cleanup(const std::string& session_id);

    // Tear down every live session
    void shutdown();

    size_t session_count() const;
    bool has_session(const std::string& session_id) const;

    // Copy of the session record; waits for in-flight calls on that id
    std::optional<Session> get_session(const std::string& session_id);

private:
    struct SessionSlot {
        std::mutex mutex;
        std::optional<Session> session;  // Guarded by mutex
        std::atomic<bool> live{false};
    };

    runtime::ContainerRuntime& runtime_;
    config::ResourceLimits limits_;
    config::ToolchainConfig toolchain_;
    exec::CodeValidator validator_;

    mutable std::mutex table_mutex_;  // Guards sessions_ only
    std::unordered_map<std::string, std::shared_ptr<SessionSlot>> sessions_;

    void ensure_valid(const std::string& code) const;

    // Lock the slot for `session_id`. With `create` false, returns an empty
    // lock when the id has no slot.
    std::unique_lock<std::mutex> lock_slot(const std::string& session_id, bool create,
                                           std::shared_ptr<SessionSlot>& slot);
    // Caller holds the slot lock
    void retire_slot(const std::string& session_id, const std::shared_ptr<SessionSlot>& slot);

    std::optional<runtime::ContainerState> wait_for_exit(const std::string& handle);
    Session provision_session(const std::string& session_id);
    ExecutionResult execute_in_session(const Session& session, const std::string& code);
    void teardown(const Session& session);
    ExecutionResult make_result(const std::string& raw, int process_exit) const;
    std::vector<std::string> toolchain_command(const std::string& script_path) const;
};

} // namespace codebox::session
