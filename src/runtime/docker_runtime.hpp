#pragma once

#include <string>
#include <vector>
#include "container_runtime.hpp"

// ContainerRuntime backed by the docker command-line client (or any client
// with the same syntax, such as podman).
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(std::string binary = DEFAULT_RUNTIME);

    ProbeResult probe(const std::string& name) override;
    CommandResult create(const CreateRequest& request) override;
    CommandResult start(const std::string& name) override;
    CommandResult stop(const std::string& name) override;
    CommandResult remove(const std::string& name) override;

    std::string attach_command(const std::string& name,
                               const std::string& shell) const override;
    std::string remove_command(const std::string& name) const override;

    const std::string& binary() const { return binary_; }

private:
    CommandResult exec(const std::string& label, const std::vector<std::string>& args);

    std::string binary_;
};

// ── Argument builders (exposed for tests) ────────────────────

// "^/name$" with regex metacharacters in the name escaped.
std::string anchored_name_filter(const std::string& name);

std::vector<std::string> docker_probe_args(const std::string& name);
std::vector<std::string> docker_run_args(const CreateRequest& request);

// Map `ps --format {{.State}}` output to a status. Empty output means the
// container does not exist.
ContainerStatus parse_container_state(const std::string& output);
