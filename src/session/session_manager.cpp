#include "session/session_manager.hpp"
#include "util/errors.hpp"
#include "util/ids.hpp"
#include "util/temp_dir.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace codebox::session {

namespace {

std::string short_id(const std::string& handle) {
    return handle.substr(0, 12);
}

// Removes a transient container on every exit path
class ContainerGuard {
public:
    ContainerGuard(runtime::ContainerRuntime& runtime, std::string handle)
        : runtime_(runtime), handle_(std::move(handle)) {}

    ~ContainerGuard() {
        try {
            runtime_.remove(handle_);
        } catch (const runtime::ContainerError& e) {
            spdlog::error("Failed to remove sandbox {}: {}", short_id(handle_), e.what());
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    runtime::ContainerRuntime& runtime_;
    std::string handle_;
};

// Deletes a script written into a session sandbox
class ScriptGuard {
public:
    ScriptGuard(runtime::ContainerRuntime& runtime, const Session& session,
                std::string path, const config::ResourceLimits& limits)
        : runtime_(runtime), session_(session), path_(std::move(path)), limits_(limits) {}

    ~ScriptGuard() {
        runtime::ExecSpec rm;
        rm.command = {"rm", "-f", path_};
        rm.working_dir = limits_.working_dir;
        rm.user = limits_.user;
        try {
            auto result = runtime_.exec(session_.handle, rm);
            if (result.exit_code != 0) {
                spdlog::warn("Failed to remove {} in session {}: {}", path_, session_.id, result.output);
            }
        } catch (const runtime::ContainerError& e) {
            spdlog::warn("Failed to remove {} in session {}: {}", path_, session_.id, e.what());
        }
    }

    ScriptGuard(const ScriptGuard&) = delete;
    ScriptGuard& operator=(const ScriptGuard&) = delete;

private:
    runtime::ContainerRuntime& runtime_;
    const Session& session_;
    std::string path_;
    const config::ResourceLimits& limits_;
};

} // namespace

// ============================================================================
// Results
// ============================================================================

json ExecutionResult::to_json() const {
    json j = {
        {"status", status()},
        {"output", output},
        {"exit_code", exit_code}
    };
    if (diagnostic) {
        j["diagnostic"] = diagnostic->to_json();
    }
    if (session_id) {
        j["session_id"] = *session_id;
    }
    return j;
}

const char* cleanup_outcome_to_string(CleanupOutcome outcome) {
    switch (outcome) {
        case CleanupOutcome::SUCCESS:   return "success";
        case CleanupOutcome::NOT_FOUND: return "not_found";
        case CleanupOutcome::ERROR:     return "error";
        default: return "error";
    }
}

json CleanupResult::to_json() const {
    return {
        {"status", cleanup_outcome_to_string(outcome)},
        {"message", message}
    };
}

// ============================================================================
// SessionManager
// ============================================================================

SessionManager::SessionManager(runtime::ContainerRuntime& runtime, const config::Config& config)
    : runtime_(runtime)
    , limits_(config.container)
    , toolchain_(config.toolchain)
    , validator_(config.validation) {}

SessionManager::~SessionManager() {
    shutdown();
}

void SessionManager::ensure_valid(const std::string& code) const {
    auto verdict = validator_.validate(code);
    if (!verdict.valid) {
        std::string reason = verdict.reason.value_or("code rejected");
        throw ServiceError(ErrorKind::VALIDATION, "Code validation failed: " + reason,
                           json{{"error_type", "validation_error"}, {"reason", reason}});
    }
}

std::vector<std::string> SessionManager::toolchain_command(const std::string& script_path) const {
    std::vector<std::string> cmd = toolchain_.command;
    cmd.push_back(script_path);
    return exec::wrap_command(cmd);
}

ExecutionResult SessionManager::make_result(const std::string& raw, int process_exit) const {
    auto sections = exec::extract_sections(raw);

    ExecutionResult result;
    result.output = sections.output;
    result.exit_code = sections.exit_code.value_or(process_exit);
    result.diagnostic = exec::parse_diagnostic(raw);
    result.success = result.exit_code == 0 && !result.diagnostic;
    return result;
}

// ============================================================================
// Transient runs
// ============================================================================

std::optional<runtime::ContainerState> SessionManager::wait_for_exit(const std::string& handle) {
    auto deadline = std::chrono::steady_clock::now() + limits_.timeout;

    while (true) {
        auto state = runtime_.inspect(handle);
        if (!state.running) {
            return state;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(limits_.poll_interval, remaining));
    }
}

ExecutionResult SessionManager::run_transient(const std::string& code) {
    ensure_valid(code);

    std::string script_name = "Script" + toolchain_.script_extension;
    std::optional<util::TempDir> workspace;
    try {
        workspace.emplace();
        workspace->write_file(script_name, code);
    } catch (const std::runtime_error& e) {
        throw ServiceError(ErrorKind::RUNTIME, std::string("Cannot stage script: ") + e.what());
    }

    runtime::ContainerSpec spec;
    spec.image = limits_.image;
    spec.command = toolchain_command(limits_.script_mount + "/" + script_name);
    spec.working_dir = limits_.working_dir;
    spec.memory_limit = limits_.memory_limit;
    spec.cpu_quota_us = limits_.cpu_quota_us();
    spec.network_disabled = limits_.network_disabled;
    spec.read_only = limits_.read_only;
    spec.binds.push_back({workspace->path(), limits_.script_mount, true});
    spec.labels["codebox.mode"] = "transient";

    std::string handle;
    try {
        handle = runtime_.create(spec);
    } catch (const runtime::ContainerError& e) {
        throw ServiceError(ErrorKind::RUNTIME, std::string("Cannot start sandbox: ") + e.what());
    }

    ContainerGuard guard(runtime_, handle);
    spdlog::debug("Transient sandbox {} started", short_id(handle));

    try {
        auto state = wait_for_exit(handle);
        if (!state) {
            try {
                runtime_.stop(handle, limits_.stop_grace);
            } catch (const runtime::ContainerError& e) {
                spdlog::warn("Failed to stop timed out sandbox {}: {}", short_id(handle), e.what());
            }
            spdlog::warn("Transient sandbox {} timed out after {}s", short_id(handle), limits_.timeout.count());
            throw ServiceError(ErrorKind::RUNTIME,
                fmt::format("Execution timed out after {} seconds", limits_.timeout.count()));
        }

        std::string raw = runtime_.logs(handle);
        return make_result(raw, state->exit_code);
    } catch (const runtime::ContainerError& e) {
        throw ServiceError(ErrorKind::RUNTIME, std::string("Error executing code in sandbox: ") + e.what());
    }
}

// ============================================================================
// Session table
// ============================================================================

std::unique_lock<std::mutex> SessionManager::lock_slot(const std::string& session_id, bool create,
                                                       std::shared_ptr<SessionSlot>& slot) {
    while (true) {
        {
            std::lock_guard<std::mutex> table_lock(table_mutex_);
            auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                if (!create) {
                    slot.reset();
                    return {};
                }
                it = sessions_.emplace(session_id, std::make_shared<SessionSlot>()).first;
            }
            slot = it->second;
        }

        std::unique_lock<std::mutex> slot_lock(slot->mutex);

        // The slot may have been retired while we waited for it
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end() && it->second == slot) {
            return slot_lock;
        }
    }
}

void SessionManager::retire_slot(const std::string& session_id, const std::shared_ptr<SessionSlot>& slot) {
    slot->session.reset();
    slot->live = false;

    std::lock_guard<std::mutex> table_lock(table_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && it->second == slot) {
        sessions_.erase(it);
    }
}

size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> table_lock(table_mutex_);
    size_t count = 0;
    for (const auto& [id, slot] : sessions_) {
        if (slot->live) count++;
    }
    return count;
}

bool SessionManager::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> table_lock(table_mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() && it->second->live;
}

std::optional<Session> SessionManager::get_session(const std::string& session_id) {
    std::shared_ptr<SessionSlot> slot;
    auto lock = lock_slot(session_id, false, slot);
    if (!lock.owns_lock()) {
        return std::nullopt;
    }
    return slot->session;
}

// ============================================================================
// Persistent sessions
// ============================================================================

Session SessionManager::provision_session(const std::string& session_id) {
    runtime::ContainerSpec spec;
    spec.image = limits_.image;
    spec.command = {"sleep", std::to_string(limits_.session_lifetime.count())};
    spec.working_dir = limits_.working_dir;
    spec.memory_limit = limits_.memory_limit;
    spec.cpu_quota_us = limits_.cpu_quota_us();
    spec.network_disabled = false;  // Disconnected below so the intent is recorded on the container
    spec.read_only = false;
    spec.labels["codebox.session_id"] = session_id;
    spec.labels["codebox.network_disabled"] = limits_.network_disabled ? "true" : "false";

    Session session;
    session.id = session_id;
    session.handle = runtime_.create(spec);
    session.created = std::chrono::system_clock::now();
    session.network_disabled = limits_.network_disabled;

    if (limits_.network_disabled) {
        bool isolated = true;
        try {
            for (const auto& network : runtime_.networks(session.handle)) {
                try {
                    runtime_.disconnect_network(session.handle, network);
                    spdlog::debug("Disconnected session {} from network {}", session_id, network);
                } catch (const runtime::ContainerError& e) {
                    isolated = false;
                    spdlog::warn("Failed to disconnect session {} from {}: {}", session_id, network, e.what());
                }
            }
        } catch (const runtime::ContainerError& e) {
            isolated = false;
            spdlog::warn("Cannot list networks of session {}: {}", session_id, e.what());
        }
        session.network_isolated = isolated;
    }

    spdlog::info("Session {} provisioned in sandbox {}", session_id, short_id(session.handle));
    return session;
}

ExecutionResult SessionManager::execute_in_session(const Session& session, const std::string& code) {
    std::string script = "Script_" + util::random_hex(16) + toolchain_.script_extension;
    std::string path = limits_.working_dir + "/" + script;

    // Code travels on stdin; the path is a positional shell argument
    runtime::ExecSpec write;
    write.command = {"sh", "-c", "cat > \"$1\"", "sh", path};
    write.working_dir = limits_.working_dir;
    write.user = limits_.user;
    write.stdin_data = code;

    auto written = runtime_.exec(session.handle, write);
    if (written.exit_code != 0) {
        throw ServiceError(ErrorKind::RUNTIME, "Failed to create script file: " + written.output);
    }

    ScriptGuard script_guard(runtime_, session, path, limits_);

    runtime::ExecSpec run;
    run.command = toolchain_command(path);
    run.working_dir = limits_.working_dir;
    run.user = limits_.user;

    auto output = runtime_.exec(session.handle, run);
    ExecutionResult result = make_result(output.output, output.exit_code);
    result.session_id = session.id;
    return result;
}

ExecutionResult SessionManager::run_persistent(const std::string& session_id, const std::string& code) {
    ensure_valid(code);

    std::shared_ptr<SessionSlot> slot;
    auto lock = lock_slot(session_id, true, slot);

    if (!slot->session) {
        try {
            slot->session = provision_session(session_id);
            slot->live = true;
        } catch (const runtime::ContainerError& e) {
            retire_slot(session_id, slot);
            throw ServiceError(ErrorKind::RUNTIME,
                fmt::format("Cannot provision session {}: {}", session_id, e.what()));
        }
    }

    try {
        return execute_in_session(*slot->session, code);
    } catch (const runtime::ContainerError& e) {
        if (e.not_found()) {
            spdlog::warn("Session {} sandbox is gone, dropping it: {}", session_id, e.what());
            // A stopped container still exists on the host
            try {
                runtime_.remove(slot->session->handle);
            } catch (const runtime::ContainerError& remove_error) {
                spdlog::debug("Removing expired sandbox of session {}: {}", session_id, remove_error.what());
            }
            retire_slot(session_id, slot);
            throw ServiceError(ErrorKind::SESSION_EXPIRED,
                fmt::format("Session {} has expired or was deleted, start a new session", session_id),
                json{{"error_type", "session_expired"}, {"session_id", session_id}});
        }
        throw ServiceError(ErrorKind::RUNTIME, std::string("Error executing code in session: ") + e.what());
    }
}

// ============================================================================
// Teardown
// ============================================================================

// Stop then force-remove. Removal is attempted even when stop fails, since
// a stopped container reports "not running". A not-found error is rethrown
// only when the container could not be removed either.
void SessionManager::teardown(const Session& session) {
    std::optional<runtime::ContainerError> stop_failure;

    try {
        runtime_.stop(session.handle, limits_.stop_grace);
    } catch (const runtime::ContainerError& e) {
        stop_failure = e;
    }

    try {
        runtime_.remove(session.handle);
    } catch (const runtime::ContainerError& e) {
        if (stop_failure && !stop_failure->not_found()) {
            throw *stop_failure;
        }
        throw;
    }

    if (stop_failure && !stop_failure->not_found()) {
        throw *stop_failure;
    }
}

CleanupResult SessionManager::cleanup(const std::string& session_id) {
    CleanupResult result;

    std::shared_ptr<SessionSlot> slot;
    auto lock = lock_slot(session_id, false, slot);
    if (!lock.owns_lock() || !slot->session) {
        if (slot) retire_slot(session_id, slot);
        result.outcome = CleanupOutcome::NOT_FOUND;
        result.message = fmt::format("Session {} not found", session_id);
        return result;
    }

    Session session = *slot->session;
    retire_slot(session_id, slot);

    try {
        teardown(session);
        result.outcome = CleanupOutcome::SUCCESS;
        result.message = fmt::format("Session {} cleaned up successfully", session_id);
        spdlog::info("Session {} cleaned up", session_id);
    } catch (const runtime::ContainerError& e) {
        if (e.not_found()) {
            result.outcome = CleanupOutcome::NOT_FOUND;
            result.message = fmt::format("Session {} sandbox not found, it may have already been removed", session_id);
        } else {
            result.outcome = CleanupOutcome::ERROR;
            result.message = fmt::format("Error cleaning up session {}: {}", session_id, e.what());
            spdlog::error("{}", result.message);
        }
    }
    return result;
}

void SessionManager::shutdown() {
    std::vector<std::pair<std::string, std::shared_ptr<SessionSlot>>> slots;
    {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        slots.assign(sessions_.begin(), sessions_.end());
    }

    for (auto& [id, slot] : slots) {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        if (slot->session) {
            Session session = *slot->session;
            try {
                teardown(session);
                spdlog::info("Session {} torn down", id);
            } catch (const runtime::ContainerError& e) {
                spdlog::warn("Failed to tear down session {}: {}", id, e.what());
            }
        }
        retire_slot(id, slot);
    }
}

} // namespace codebox::session
