#include "runtime/docker_runtime.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace codebox::runtime {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

} // namespace

DockerRuntime::DockerRuntime(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {}

// ============================================================================
// Subprocess plumbing
// ============================================================================

CommandResult DockerRuntime::run(const std::vector<std::string>& args,
                                 const std::optional<std::string>& input) {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe2(stdin_pipe, O_CLOEXEC) == -1 ||
        pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
        pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw ContainerError(std::string("failed to create pipes: ") + strerror(err));
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(docker_binary_.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw ContainerError(std::string("failed to fork docker: ") + strerror(err));
    }

    if (pid == 0) {
        // Child: wire the pipes to stdio, O_CLOEXEC closes the originals
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent process
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    const std::string payload = input.value_or("");
    size_t written = 0;
    if (payload.empty()) {
        close_fd(stdin_pipe[1]);
    } else {
        int flags = fcntl(stdin_pipe[1], F_GETFL, 0);
        fcntl(stdin_pipe[1], F_SETFL, flags | O_NONBLOCK);
    }

    CommandResult result;
    char buffer[4096];

    while (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0 || stdin_pipe[1] >= 0) {
        pollfd fds[3];
        nfds_t n = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (stdout_pipe[0] >= 0) { out_idx = n; fds[n++] = {stdout_pipe[0], POLLIN, 0}; }
        if (stderr_pipe[0] >= 0) { err_idx = n; fds[n++] = {stderr_pipe[0], POLLIN, 0}; }
        if (stdin_pipe[1] >= 0)  { in_idx = n;  fds[n++] = {stdin_pipe[1], POLLOUT, 0}; }

        if (poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll() on docker pipes failed: {}", strerror(errno));
            break;
        }

        auto drain = [&](int idx, int& fd, std::string& target) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) return;
            ssize_t r = read(fd, buffer, sizeof(buffer));
            if (r > 0) {
                target.append(buffer, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                close_fd(fd);
            }
        };
        drain(out_idx, stdout_pipe[0], result.out);
        drain(err_idx, stderr_pipe[0], result.err);

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t w = write(stdin_pipe[1], payload.data() + written, payload.size() - written);
            if (w > 0) {
                written += static_cast<size_t>(w);
            } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
                spdlog::debug("docker stdin closed early: {}", strerror(errno));
                close_fd(stdin_pipe[1]);
            }
            if (written == payload.size()) {
                close_fd(stdin_pipe[1]);
            }
        }
    }

    close_pipe(stdin_pipe);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ContainerError(std::string("waitpid on docker failed: ") + strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.exit_code == 127 && result.out.empty() && result.err.empty()) {
        throw ContainerError("cannot execute " + docker_binary_ + " (is docker installed?)");
    }

    return result;
}

CommandResult DockerRuntime::run_checked(const std::vector<std::string>& args,
                                         const std::string& what) {
    CommandResult result = run(args);
    if (result.exit_code != 0) {
        std::string detail = trim(result.err);
        throw ContainerError(what + " failed: " + (detail.empty() ? "exit " + std::to_string(result.exit_code) : detail),
                             is_not_found_error(result.err));
    }
    return result;
}

bool DockerRuntime::is_not_found_error(const std::string& stderr_text) {
    return stderr_text.find("No such container") != std::string::npos ||
           stderr_text.find("No such object") != std::string::npos ||
           stderr_text.find("is not running") != std::string::npos;
}

// ============================================================================
// ContainerRuntime
// ============================================================================

std::vector<std::string> DockerRuntime::run_args(const ContainerSpec& spec) {
    std::vector<std::string> args = {"run", "--detach"};

    if (!spec.memory_limit.empty()) {
        args.push_back("--memory=" + spec.memory_limit);
    }
    if (spec.cpu_quota_us > 0) {
        args.push_back("--cpu-period=" + std::to_string(spec.cpu_period_us));
        args.push_back("--cpu-quota=" + std::to_string(spec.cpu_quota_us));
    }
    if (spec.network_disabled) {
        args.push_back("--network=none");
    }
    if (spec.read_only) {
        // Toolchains still need scratch space
        args.push_back("--read-only");
        args.push_back("--tmpfs=/tmp");
    }
    if (!spec.working_dir.empty()) {
        args.push_back("--workdir=" + spec.working_dir);
    }
    for (const auto& bind : spec.binds) {
        args.push_back("--volume=" + bind.host_path + ":" + bind.container_path +
                       (bind.read_only ? ":ro" : ":rw"));
    }
    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label=" + key + "=" + value);
    }

    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

std::string DockerRuntime::create(const ContainerSpec& spec) {
    CommandResult result = run_checked(run_args(spec), "docker run");
    std::string handle = trim(result.out);
    if (handle.empty()) {
        throw ContainerError("docker run returned no container id");
    }
    spdlog::debug("Created container {} from {}", handle.substr(0, 12), spec.image);
    return handle;
}

json DockerRuntime::inspect_json(const std::string& handle) {
    CommandResult result = run_checked({"container", "inspect", handle}, "docker inspect");
    try {
        json doc = json::parse(result.out);
        if (!doc.is_array() || doc.empty()) {
            throw ContainerError("container " + handle + " not found", true);
        }
        return doc[0];
    } catch (const json::exception& e) {
        throw ContainerError(std::string("cannot parse docker inspect output: ") + e.what());
    }
}

ContainerState DockerRuntime::inspect(const std::string& handle) {
    json doc = inspect_json(handle);
    ContainerState state;
    try {
        const auto& s = doc.at("State");
        state.running = s.value("Running", false);
        state.exit_code = s.value("ExitCode", 0);
    } catch (const json::exception& e) {
        throw ContainerError(std::string("unexpected docker inspect document: ") + e.what());
    }
    return state;
}

std::string DockerRuntime::logs(const std::string& handle) {
    CommandResult result = run_checked({"logs", handle}, "docker logs");
    return result.out + result.err;
}

ExecOutput DockerRuntime::exec(const std::string& handle, const ExecSpec& spec) {
    std::vector<std::string> args = {"exec"};
    if (spec.stdin_data) {
        args.push_back("--interactive");
    }
    if (!spec.working_dir.empty()) {
        args.push_back("--workdir=" + spec.working_dir);
    }
    if (!spec.user.empty()) {
        args.push_back("--user=" + spec.user);
    }
    args.push_back(handle);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    CommandResult result = run(args, spec.stdin_data);

    // Daemon-side failures surface as docker's own exit codes with a message
    if (result.exit_code != 0 && is_not_found_error(result.err)) {
        throw ContainerError("container " + handle + " not found: " + trim(result.err), true);
    }
    if (result.exit_code == 126 || result.exit_code == 127) {
        spdlog::debug("exec in {} exited {}: {}", handle.substr(0, 12), result.exit_code, trim(result.err));
    }

    ExecOutput output;
    output.exit_code = result.exit_code;
    output.output = result.out + result.err;
    return output;
}

void DockerRuntime::stop(const std::string& handle, std::chrono::seconds grace) {
    run_checked({"stop", "--time=" + std::to_string(grace.count()), handle}, "docker stop");
}

void DockerRuntime::remove(const std::string& handle) {
    run_checked({"rm", "--force", handle}, "docker rm");
    spdlog::debug("Removed container {}", handle.substr(0, 12));
}

std::vector<std::string> DockerRuntime::networks(const std::string& handle) {
    json doc = inspect_json(handle);
    std::vector<std::string> names;
    auto settings = doc.find("NetworkSettings");
    if (settings == doc.end() || !settings->is_object()) {
        return names;
    }
    auto nets = settings->find("Networks");
    if (nets == settings->end() || !nets->is_object()) {
        return names;
    }
    for (auto it = nets->begin(); it != nets->end(); ++it) {
        names.push_back(it.key());
    }
    return names;
}

void DockerRuntime::disconnect_network(const std::string& handle, const std::string& network) {
    run_checked({"network", "disconnect", network, handle}, "docker network disconnect");
}

bool DockerRuntime::image_exists(const std::string& image) {
    try {
        return run({"image", "inspect", image}).exit_code == 0;
    } catch (const ContainerError& e) {
        spdlog::error("Cannot query image {}: {}", image, e.what());
        return false;
    }
}

} // namespace codebox::runtime
