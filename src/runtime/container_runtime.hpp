#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// Everything needed to create the workspace container.
struct CreateRequest {
    std::string name;
    std::string image;
    std::string mount_path;                // host side of the bind mount
    std::string workspace;                 // container side of the bind mount
    std::string gpus;
    std::string shell;                     // initial process, run with a TTY
    std::optional<std::string> env_file;   // set only when the file exists
};

// Outcome of a single status query against the runtime.
struct ProbeResult {
    ContainerStatus status = ContainerStatus::kAbsent;
    CommandResult command{0, "", ""};

    bool ok() const { return command.success(); }
    bool exists() const { return status != ContainerStatus::kAbsent; }
    bool running() const { return status == ContainerStatus::kRunning; }
};

// The container runtime as seen by devbox: named create/start/stop/remove
// plus a status query. Every call blocks until the runtime answers.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Existence and running state, answered from one query.
    virtual ProbeResult probe(const std::string& name) = 0;

    virtual CommandResult create(const CreateRequest& request) = 0;
    virtual CommandResult start(const std::string& name) = 0;
    virtual CommandResult stop(const std::string& name) = 0;
    virtual CommandResult remove(const std::string& name) = 0;

    // Command lines the operator can paste into another terminal.
    virtual std::string attach_command(const std::string& name,
                                       const std::string& shell) const = 0;
    virtual std::string remove_command(const std::string& name) const = 0;
};
