#include <gtest/gtest.h>
#include <runtime/docker_runtime.hpp>

// ── Name filter ─────────────────────────────────────────────

TEST(DockerRuntime, NameFilterIsAnchored) {
    EXPECT_EQ(anchored_name_filter("ai-scientist-container"), "^/ai-scientist-container$");
}

TEST(DockerRuntime, NameFilterEscapesDots) {
    EXPECT_EQ(anchored_name_filter("box.v2"), "^/box\\.v2$");
}

TEST(DockerRuntime, ProbeArgsListAllStates) {
    std::vector<std::string> expected = {"ps", "-a", "--filter", "name=^/box$",
                                         "--format", "{{.State}}"};
    EXPECT_EQ(docker_probe_args("box"), expected);
}

// ── State parsing ───────────────────────────────────────────

TEST(DockerRuntime, EmptyOutputMeansAbsent) {
    EXPECT_EQ(parse_container_state(""), ContainerStatus::kAbsent);
    EXPECT_EQ(parse_container_state("\n"), ContainerStatus::kAbsent);
}

TEST(DockerRuntime, LiveStatesAreRunning) {
    EXPECT_EQ(parse_container_state("running\n"), ContainerStatus::kRunning);
    EXPECT_EQ(parse_container_state("paused\n"), ContainerStatus::kRunning);
    EXPECT_EQ(parse_container_state("restarting\n"), ContainerStatus::kRunning);
}

TEST(DockerRuntime, OtherStatesAreStopped) {
    EXPECT_EQ(parse_container_state("exited\n"), ContainerStatus::kStopped);
    EXPECT_EQ(parse_container_state("created\n"), ContainerStatus::kStopped);
    EXPECT_EQ(parse_container_state("dead"), ContainerStatus::kStopped);
}

// ── Run arguments ───────────────────────────────────────────

static CreateRequest sample_request() {
    CreateRequest req;
    req.name = "box";
    req.image = "img";
    req.mount_path = "/host/dir/";
    req.workspace = "/workspace";
    req.gpus = "all";
    req.shell = "/bin/bash";
    return req;
}

TEST(DockerRuntime, RunArgsWithoutEnvFile) {
    std::vector<std::string> expected = {
        "run", "--gpus", "all", "-d",
        "-v", "/host/dir/:/workspace",
        "--name", "box", "-it", "img", "/bin/bash"};
    EXPECT_EQ(docker_run_args(sample_request()), expected);
}

TEST(DockerRuntime, RunArgsWithEnvFile) {
    auto req = sample_request();
    req.env_file = ".env";
    std::vector<std::string> expected = {
        "run", "--gpus", "all", "-d", "--env-file", ".env",
        "-v", "/host/dir/:/workspace",
        "--name", "box", "-it", "img", "/bin/bash"};
    EXPECT_EQ(docker_run_args(req), expected);
}

// ── Client invocation ───────────────────────────────────────

TEST(DockerRuntime, UnreachableClientFailsProbe) {
    DockerRuntime runtime("devbox-no-such-client");
    auto probe = runtime.probe("box");

    EXPECT_FALSE(probe.ok());
    EXPECT_EQ(probe.command.exit_code, 127);
    EXPECT_FALSE(probe.exists());
}

TEST(DockerRuntime, ProbeReadsClientOutput) {
    // `echo` stands in for the client: it prints its arguments, which is
    // non-empty output and therefore an existing, non-running container.
    DockerRuntime runtime("echo");
    auto probe = runtime.probe("box");

    EXPECT_TRUE(probe.ok());
    EXPECT_TRUE(probe.exists());
    EXPECT_FALSE(probe.running());
}

TEST(DockerRuntime, OperatorCommands) {
    DockerRuntime runtime("podman");
    EXPECT_EQ(runtime.attach_command("box", "/bin/bash"), "podman exec -it box /bin/bash");
    EXPECT_EQ(runtime.remove_command("box"), "podman rm box");
}
