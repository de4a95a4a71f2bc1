/**
 * codebox Container Runtime
 *
 * Interface to the container engine that hosts every sandbox. The session
 * manager only talks to this interface; DockerRuntime implements it on top
 * of the docker CLI and tests substitute an in-memory fake.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codebox::runtime {

// Raised by every runtime operation. not_found() marks an invalid or
// expired container handle.
class ContainerError : public std::runtime_error {
public:
    explicit ContainerError(const std::string& what, bool not_found = false)
        : std::runtime_error(what), not_found_(not_found) {}

    bool not_found() const { return not_found_; }

private:
    bool not_found_;
};

struct BindMount {
    std::string host_path;
    std::string container_path;
    bool read_only = true;
};

// Everything needed to create and start one container
struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;
    std::string working_dir;
    std::string memory_limit;
    int64_t cpu_quota_us = 0;
    int64_t cpu_period_us = 100000;
    bool network_disabled = true;
    bool read_only = false;
    std::vector<BindMount> binds;
    std::map<std::string, std::string> labels;
};

struct ContainerState {
    bool running = false;
    int exit_code = 0;  // Valid once !running
};

struct ExecSpec {
    std::vector<std::string> command;
    std::string working_dir;
    std::string user;
    std::optional<std::string> stdin_data;  // Fed to the command's stdin
};

struct ExecOutput {
    int exit_code = -1;
    std::string output;  // stdout and stderr, interleaved
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Create and start a container, returning its handle
    virtual std::string create(const ContainerSpec& spec) = 0;

    virtual ContainerState inspect(const std::string& handle) = 0;

    virtual std::string logs(const std::string& handle) = 0;

    virtual ExecOutput exec(const std::string& handle, const ExecSpec& spec) = 0;

    virtual void stop(const std::string& handle, std::chrono::seconds grace) = 0;

    // Force-remove; stops the container first if needed
    virtual void remove(const std::string& handle) = 0;

    // Names of the networks the container is attached to
    virtual std::vector<std::string> networks(const std::string& handle) = 0;

    virtual void disconnect_network(const std::string& handle, const std::string& network) = 0;

    virtual bool image_exists(const std::string& image) = 0;
};

} // namespace codebox::runtime
