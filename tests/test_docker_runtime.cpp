/**
 * @file test_docker_runtime.cpp
 * @brief docker CLI argument building and subprocess plumbing.
 *
 * No docker daemon is needed: the subprocess tests substitute small system
 * binaries for the docker executable.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include "runtime/docker_runtime.hpp"

using namespace codebox::runtime;

namespace {

bool has_arg(const std::vector<std::string>& args, const std::string& arg) {
    return std::find(args.begin(), args.end(), arg) != args.end();
}

} // namespace

TEST(DockerRunArgsTest, TransientSandbox) {
    ContainerSpec spec;
    spec.image = "codebox-lean:latest";
    spec.command = {"lean", "--run", "/app/Script.lean"};
    spec.working_dir = "/home/runner/project";
    spec.memory_limit = "256m";
    spec.cpu_quota_us = 50000;
    spec.network_disabled = true;
    spec.read_only = true;
    spec.binds.push_back({"/tmp/codebox-abc", "/app", true});
    spec.labels["codebox.mode"] = "transient";

    auto args = DockerRuntime::run_args(spec);

    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ(args[0], "run");
    EXPECT_EQ(args[1], "--detach");
    EXPECT_TRUE(has_arg(args, "--memory=256m"));
    EXPECT_TRUE(has_arg(args, "--cpu-period=100000"));
    EXPECT_TRUE(has_arg(args, "--cpu-quota=50000"));
    EXPECT_TRUE(has_arg(args, "--network=none"));
    EXPECT_TRUE(has_arg(args, "--read-only"));
    EXPECT_TRUE(has_arg(args, "--workdir=/home/runner/project"));
    EXPECT_TRUE(has_arg(args, "--volume=/tmp/codebox-abc:/app:ro"));
    EXPECT_TRUE(has_arg(args, "--label=codebox.mode=transient"));

    // Image, then the command verbatim
    std::vector<std::string> tail(args.end() - 4, args.end());
    EXPECT_EQ(tail, (std::vector<std::string>{"codebox-lean:latest", "lean", "--run", "/app/Script.lean"}));
}

TEST(DockerRunArgsTest, SessionSandboxKeepsNetwork) {
    ContainerSpec spec;
    spec.image = "img";
    spec.command = {"sleep", "86400"};
    spec.network_disabled = false;

    auto args = DockerRuntime::run_args(spec);
    EXPECT_FALSE(has_arg(args, "--network=none"));
    EXPECT_FALSE(has_arg(args, "--read-only"));
    EXPECT_FALSE(has_arg(args, "--cpu-quota=0"));
    EXPECT_EQ(args.back(), "86400");
}

TEST(DockerRuntimeTest, NotFoundErrorText) {
    EXPECT_TRUE(DockerRuntime::is_not_found_error("Error response from daemon: No such container: abc"));
    EXPECT_TRUE(DockerRuntime::is_not_found_error("Error: No such object: abc"));
    EXPECT_TRUE(DockerRuntime::is_not_found_error("Error response from daemon: container abc is not running"));
    EXPECT_FALSE(DockerRuntime::is_not_found_error("Cannot connect to the Docker daemon"));
}

TEST(DockerRuntimeTest, ImageExistsFollowsExitStatus) {
    EXPECT_TRUE(DockerRuntime("true").image_exists("any"));
    EXPECT_FALSE(DockerRuntime("false").image_exists("any"));
    EXPECT_FALSE(DockerRuntime("/nonexistent/codebox-docker").image_exists("any"));
}

TEST(DockerRuntimeTest, CapturesSubprocessOutput) {
    // `echo logs <handle>` stands in for docker
    DockerRuntime runtime("echo");
    EXPECT_EQ(runtime.logs("abc"), "logs abc\n");
}

TEST(DockerRuntimeTest, FailedCommandThrows) {
    DockerRuntime runtime("false");
    try {
        runtime.stop("abc", std::chrono::seconds(1));
        FAIL() << "expected ContainerError";
    } catch (const ContainerError& e) {
        EXPECT_FALSE(e.not_found());
    }
}

TEST(DockerRuntimeTest, MissingBinaryThrows) {
    DockerRuntime runtime("/nonexistent/codebox-docker");
    EXPECT_THROW(runtime.remove("abc"), ContainerError);
}
