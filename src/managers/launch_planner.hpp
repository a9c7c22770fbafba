#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <runtime/container_runtime.hpp>

namespace fs = std::filesystem;

// Exactly one of these runs per invocation.
enum class LaunchAction {
    kAttach,             // already running: no runtime call
    kRestart,            // exists but stopped: start it
    kCreateWithEnv,      // absent, env file present
    kCreateWithoutEnv,   // absent, no env file
};

const char* to_string(LaunchAction action);

// Decision table. Precedence: running, then exists, then the env file.
// The env file only matters when the container has to be created.
LaunchAction plan_launch(bool exists, bool running, bool env_file_present);

struct LaunchOutcome {
    LaunchAction action;
    CommandResult command;   // exit_code 0 and no output for kAttach

    bool ok() const { return command.success(); }
};

// Probes the runtime for the configured container and brings it up.
//
// Holds references to its collaborators; the session config is the value
// resolved from operator input and is never modified here.
class LaunchPlanner {
public:
    LaunchPlanner(const SessionConfig& session, const LaunchSettings& settings,
                  ContainerRuntime& runtime);

    // Existence and running state of the container, from one runtime query.
    ProbeResult probe();

    // True if the env file exists as a regular file in `dir`.
    bool env_file_present(const fs::path& dir = fs::current_path()) const;

    CreateRequest create_request(bool with_env_file) const;

    // Run the planned action. Runtime failures come back in the outcome
    // untouched; nothing is retried or rolled back.
    LaunchOutcome launch(const ProbeResult& probe, bool env_file_present,
                         StatusCallback cb = nullptr);

private:
    const SessionConfig& session_;
    const LaunchSettings& settings_;
    ContainerRuntime& runtime_;
};
