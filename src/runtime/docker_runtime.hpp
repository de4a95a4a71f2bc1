/**
 * codebox Docker Runtime
 *
 * ContainerRuntime backed by the docker CLI. Each operation runs one docker
 * subprocess with its stdin/stdout/stderr on pipes; container output and
 * daemon errors come back through those pipes.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/container_runtime.hpp"

namespace codebox::runtime {

// Outcome of one docker CLI invocation
struct CommandResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(std::string docker_binary = "docker");

    std::string create(const ContainerSpec& spec) override;
    ContainerState inspect(const std::string& handle) override;
    std::string logs(const std::string& handle) override;
    ExecOutput exec(const std::string& handle, const ExecSpec& spec) override;
    void stop(const std::string& handle, std::chrono::seconds grace) override;
    void remove(const std::string& handle) override;
    std::vector<std::string> networks(const std::string& handle) override;
    void disconnect_network(const std::string& handle, const std::string& network) override;
    bool image_exists(const std::string& image) override;

    // docker CLI arguments for `run` (exposed for tests)
    static std::vector<std::string> run_args(const ContainerSpec& spec);

    // Daemon error text that means the container is gone or unusable
    static bool is_not_found_error(const std::string& stderr_text);

private:
    std::string docker_binary_;

    // Run the docker binary with `args`, optionally feeding `input` to stdin
    CommandResult run(const std::vector<std::string>& args,
                      const std::optional<std::string>& input = std::nullopt);

    // Run and throw ContainerError on a non-zero exit
    CommandResult run_checked(const std::vector<std::string>& args, const std::string& what);

    // Parsed `docker container inspect` document for one container
    nlohmann::json inspect_json(const std::string& handle);
};

} // namespace codebox::runtime
